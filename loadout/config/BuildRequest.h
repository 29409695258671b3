// Per-run build search parameters (class, playstyle, filters, guards, scoring).
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../build/Build.h"

namespace Loadout {

struct ScoreWeights {
    float dps{0.0f};
    float ehp{0.0f};
    float mana{0.0f};
    float bonus{0.0f};
};

// Replaces the weighted formula when set. May throw; the engine falls back to the default score.
using CustomScoringFn = std::function<float(const AggregatedStats&, const DerivedStats&)>;

struct BuildRequest {
    PlayerClass playerClass{PlayerClass::Mage};
    Playstyle playstyle{Playstyle::Spellspam};
    std::vector<Element> elements;
    bool strictElements{false};
    int maxSkillPoints{200};
    bool noMythics{false};
    int minLevel{80};
    int maxLevel{106};
    int playerLevel{106};
    float minDps{0.0f};
    float minManaRegen{0.0f};
    std::optional<float> maxCost;
    int topN{10};
    int maxBuilds{1000};
    int maxChecks{50000};
    int maxItemsPerSlot{20};
    std::vector<std::string> excludeItems;
    std::optional<ScoreWeights> weights;
    CustomScoringFn customScoring;
};

// Reads request JSON text on top of the defaults above. Returns nullopt when the text is not a JSON
// object or names an unknown class/playstyle/element.
std::optional<BuildRequest> parseBuildRequestText(const std::string& text);

std::optional<BuildRequest> loadBuildRequest(const std::string& path);

}  // namespace Loadout
