#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "../loadout/build/Scorer.h"

namespace {

using namespace Loadout;

bool near(float a, float b, float eps = 0.001f) { return std::abs(a - b) < eps; }

ScoredBuild scoredAs(float score, const std::string& tag) {
    ScoredBuild sb{};
    sb.score = score;
    sb.derived.spellCosts.push_back({tag, 0, 0});
    return sb;
}

const std::string& tagOf(const ScoredBuild& sb) { return sb.derived.spellCosts.front().name; }

}  // namespace

int main() {
    {
        ScoreWeights w = playstyleWeights(Playstyle::Spellspam);
        assert(near(w.dps, 0.6f) && near(w.ehp, 0.0001f) && near(w.mana, 100.0f) && near(w.bonus, 10.0f));
        w = playstyleWeights(Playstyle::Tank);
        assert(w.dps == 0.0f && near(w.ehp, 0.0002f) && near(w.mana, 20.0f));
        w = playstyleWeights(Playstyle::Melee);
        assert(near(w.dps, 0.4f) && w.mana == 0.0f);
        w = playstyleWeights(Playstyle::Hybrid);
        assert(near(w.dps, 0.3f) && near(w.mana, 30.0f));
    }
    {
        // 100*0.6 + 10000*0.0001 + 2*100 + (200 - 150)*10
        AggregatedStats agg{};
        agg.requirements.set(SkillStat::Intelligence, 150);
        DerivedStats d{};
        d.dps = 100.0f;
        d.ehp.combinedEhp = 10000.0f;
        d.manaSustain = 2.0f;
        assert(near(weightedScore(agg, d, playstyleWeights(Playstyle::Spellspam), 200), 761.0f, 0.01f));

        BuildRequest req{};
        BuildScorer scorer(req);
        assert(near(scorer.score(agg, d), 761.0f, 0.01f));

        // Request weights override the profile.
        req.weights = ScoreWeights{1.0f, 0.0f, 0.0f, 0.0f};
        BuildScorer custom(req);
        assert(near(custom.score(agg, d), 100.0f));
    }
    {
        // Custom scoring replaces the formula; failures fall back and are counted.
        AggregatedStats agg{};
        DerivedStats d{};
        d.dps = 10.0f;
        BuildRequest req{};
        req.customScoring = [](const AggregatedStats&, const DerivedStats& derived) { return derived.dps * 3.0f; };
        BuildScorer ok(req);
        assert(near(ok.score(agg, d), 30.0f));
        assert(ok.customFailures() == 0);

        req.customScoring = [](const AggregatedStats&, const DerivedStats&) -> float {
            throw std::runtime_error("scoring backend offline");
        };
        BuildScorer throwing(req);
        const float fallback = weightedScore(agg, d, playstyleWeights(Playstyle::Spellspam), 200);
        assert(near(throwing.score(agg, d), fallback));
        assert(near(throwing.score(agg, d), fallback));
        assert(throwing.customFailures() == 2);

        req.customScoring = [](const AggregatedStats&, const DerivedStats&) -> float { throw 42; };
        BuildScorer throwsInt(req);
        assert(near(throwsInt.score(agg, d), fallback));
        assert(throwsInt.customFailures() == 1);

        req.customScoring = [](const AggregatedStats&, const DerivedStats&) {
            return std::numeric_limits<float>::quiet_NaN();
        };
        BuildScorer nan(req);
        assert(near(nan.score(agg, d), fallback));
        assert(nan.customFailures() == 1);
    }
    {
        // Top-N: descending, capacity-bound, ties keep arrival order.
        TopNSelector top(3);
        top.offer(scoredAs(5.0f, "a"));
        top.offer(scoredAs(9.0f, "b"));
        top.offer(scoredAs(5.0f, "c"));
        top.offer(scoredAs(1.0f, "d"));
        top.offer(scoredAs(7.0f, "e"));
        top.offer(scoredAs(5.0f, "f"));
        const auto& r = top.results();
        assert(r.size() == 3);
        assert(tagOf(r[0]) == "b");
        assert(tagOf(r[1]) == "e");
        assert(tagOf(r[2]) == "a");

        TopNSelector none(0);
        none.offer(scoredAs(100.0f, "x"));
        assert(none.results().empty());
    }
    return 0;
}
