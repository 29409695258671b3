#include "BuildEngine.h"

#include <algorithm>
#include <string>
#include <utility>

#include "../../engine/core/Logger.h"
#include "BuildValidator.h"
#include "CombinationGenerator.h"
#include "Scorer.h"
#include "SlotFilter.h"
#include "StatAggregator.h"
#include "StatCalculator.h"

namespace Loadout {

const char* stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::Exhausted: return "exhausted";
        case StopReason::CheckLimit: return "check-limit";
        case StopReason::TargetReached: return "target-reached";
        case StopReason::MissingSlot: return "missing-slot";
        case StopReason::NothingRequested: return "nothing-requested";
        default: return "unknown";
    }
}

GenerationResult generateBuilds(const std::vector<Item>& catalog, const BuildRequest& request, const ClassTable& classes) {
    GenerationResult result{};
    if (request.topN <= 0) {
        result.stopReason = StopReason::NothingRequested;
        return result;
    }

    Forge::logInfo(std::string("Generating ") + className(request.playerClass) + " builds (" +
                   playstyleName(request.playstyle) + ", top " + std::to_string(request.topN) + ") from " +
                   std::to_string(catalog.size()) + " items");

    const SlotCandidates candidates = filterCandidates(catalog, request);
    std::string counts;
    for (std::size_t s = 0; s < kSlotCount; ++s) {
        if (!counts.empty()) counts += ", ";
        counts += slotName(static_cast<EquipmentSlot>(s));
        counts += "=" + std::to_string(candidates.bySlot[s].size());
    }
    Forge::logInfo("Candidates per slot: " + counts);

    const std::size_t maxChecks = request.maxChecks > 0 ? static_cast<std::size_t>(request.maxChecks) : 0;
    CombinationGenerator generator(candidates, request.playerClass, maxChecks);
    if (auto missing = generator.missingSlot()) {
        result.stopReason = StopReason::MissingSlot;
        result.diagnostic = std::string("no candidates for slot ") + slotName(*missing);
        Forge::logWarn("Build generation stopped: " + result.diagnostic);
        return result;
    }
    Forge::logDebug("Search space: " + std::to_string(generator.totalCombinations()) + " combinations");

    const std::size_t target =
        static_cast<std::size_t>(std::max(request.maxBuilds, request.topN));
    BuildScorer scorer(request);
    TopNSelector selector(static_cast<std::size_t>(request.topN));

    bool targetReached = false;
    Build build{};
    while (generator.next(build)) {
        if (!passesStructural(build, request)) continue;
        ScoredBuild scored{};
        scored.aggregated = aggregate(build);
        scored.derived = deriveStats(build, scored.aggregated, classes, request.playerLevel);
        if (!passesThresholds(scored.derived, request)) continue;
        scored.score = scorer.score(scored.aggregated, scored.derived);
        scored.build = build;
        selector.offer(std::move(scored));

        result.validBuilds += 1;
        if (result.validBuilds >= target) {
            targetReached = !generator.exhausted();
            break;
        }
    }

    result.combinationsChecked = generator.checked();
    result.customScoringFailures = scorer.customFailures();
    if (generator.capped()) {
        result.truncated = true;
        result.stopReason = StopReason::CheckLimit;
    } else if (targetReached) {
        result.truncated = true;
        result.stopReason = StopReason::TargetReached;
    } else {
        result.stopReason = StopReason::Exhausted;
    }
    result.builds = selector.take();

    if (result.customScoringFailures > 0) {
        Forge::logWarn("Custom scoring failed for " + std::to_string(result.customScoringFailures) +
                       " builds; default scores were used.");
    }
    Forge::logInfo("Checked " + std::to_string(result.combinationsChecked) + " combinations, " +
                   std::to_string(result.validBuilds) + " valid, kept " + std::to_string(result.builds.size()) +
                   " (" + stopReasonName(result.stopReason) + (result.truncated ? ", truncated" : "") + ")");
    return result;
}

}  // namespace Loadout
