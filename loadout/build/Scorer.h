// Composite build scoring and bounded top-N selection.
#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "../config/BuildRequest.h"

namespace Loadout {

ScoreWeights playstyleWeights(Playstyle style);

// dps*w.dps + combinedEhp*w.ehp + manaSustain*w.mana + (maxSkillPoints - requirement total)*w.bonus
float weightedScore(const AggregatedStats& agg, const DerivedStats& derived, const ScoreWeights& w, int maxSkillPoints);

// Scores builds for one run. A custom function that throws or returns a non-finite value falls back
// to the weighted score; the first failure is logged and all of them are counted.
class BuildScorer {
public:
    explicit BuildScorer(const BuildRequest& request);

    float score(const AggregatedStats& agg, const DerivedStats& derived);
    int customFailures() const { return customFailures_; }
    const ScoreWeights& weights() const { return weights_; }

private:
    ScoreWeights weights_{};
    int maxSkillPoints_{0};
    CustomScoringFn custom_;
    int customFailures_{0};
};

// Keeps the `capacity` best builds in descending score order; equal scores keep arrival order.
class TopNSelector {
public:
    explicit TopNSelector(std::size_t capacity) : capacity_(capacity) {}

    void offer(ScoredBuild candidate);
    const std::vector<ScoredBuild>& results() const { return best_; }
    std::vector<ScoredBuild> take() { return std::move(best_); }

private:
    std::size_t capacity_{0};
    std::vector<ScoredBuild> best_;
};

}  // namespace Loadout
