// Build search pipeline: filter -> enumerate -> validate -> aggregate -> derive -> score -> top-N.
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../config/BuildRequest.h"
#include "../config/ClassTable.h"

namespace Loadout {

enum class StopReason {
    Exhausted,         // every combination was inspected
    CheckLimit,        // maxChecks reached with combinations left
    TargetReached,     // maxBuilds valid builds collected with combinations left
    MissingSlot,       // a mandatory slot had no candidates
    NothingRequested   // topN == 0
};

const char* stopReasonName(StopReason reason);

struct GenerationResult {
    std::vector<ScoredBuild> builds;  // descending score, at most topN
    bool truncated{false};
    StopReason stopReason{StopReason::Exhausted};
    std::string diagnostic;
    std::size_t combinationsChecked{0};
    std::size_t validBuilds{0};
    int customScoringFailures{0};
};

// Builds in the result point into `catalog`; keep it alive while the result is used.
GenerationResult generateBuilds(const std::vector<Item>& catalog, const BuildRequest& request, const ClassTable& classes);

}  // namespace Loadout
