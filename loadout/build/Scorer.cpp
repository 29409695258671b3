#include "Scorer.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

#include "../../engine/core/Logger.h"

namespace Loadout {

ScoreWeights playstyleWeights(Playstyle style) {
    switch (style) {
        case Playstyle::Spellspam: return {0.6f, 0.0001f, 100.0f, 10.0f};
        case Playstyle::Melee: return {0.4f, 0.0001f, 0.0f, 10.0f};
        case Playstyle::Tank: return {0.0f, 0.0002f, 20.0f, 10.0f};
        case Playstyle::Hybrid: return {0.3f, 0.0001f, 30.0f, 10.0f};
        default: return {0.6f, 0.0001f, 100.0f, 10.0f};
    }
}

float weightedScore(const AggregatedStats& agg, const DerivedStats& derived, const ScoreWeights& w, int maxSkillPoints) {
    const float unused = static_cast<float>(maxSkillPoints - agg.requirements.total());
    return derived.dps * w.dps + derived.ehp.combinedEhp * w.ehp + derived.manaSustain * w.mana + unused * w.bonus;
}

BuildScorer::BuildScorer(const BuildRequest& request)
    : weights_(request.weights.value_or(playstyleWeights(request.playstyle))),
      maxSkillPoints_(request.maxSkillPoints),
      custom_(request.customScoring) {}

float BuildScorer::score(const AggregatedStats& agg, const DerivedStats& derived) {
    if (!custom_) return weightedScore(agg, derived, weights_, maxSkillPoints_);

    std::string failure;
    try {
        const float s = custom_(agg, derived);
        if (std::isfinite(s)) return s;
        failure = "returned a non-finite score";
    } catch (const std::exception& e) {
        failure = std::string("threw: ") + e.what();
    } catch (...) {
        failure = "threw a non-standard exception";
    }
    customFailures_ += 1;
    if (customFailures_ == 1) {
        Forge::logWarn("Custom scoring function " + failure + "; using the default score.");
    }
    return weightedScore(agg, derived, weights_, maxSkillPoints_);
}

void TopNSelector::offer(ScoredBuild candidate) {
    if (capacity_ == 0) return;
    if (best_.size() >= capacity_ && candidate.score <= best_.back().score) return;
    auto pos = std::upper_bound(best_.begin(), best_.end(), candidate.score,
                                [](float s, const ScoredBuild& b) { return s > b.score; });
    best_.insert(pos, std::move(candidate));
    if (best_.size() > capacity_) best_.pop_back();
}

}  // namespace Loadout
