// Build validation: structural/skill-point checks, derived-stat thresholds and a detailed report.
#pragma once

#include <string>
#include <vector>

#include "../config/BuildRequest.h"
#include "../config/ClassTable.h"

namespace Loadout {

// Ring count 0 or 2, weapon type allowed for the class, class requirements, and skill points
// (each attribute and the overall sum must be <= request.maxSkillPoints).
bool passesStructural(const Build& build, const BuildRequest& request);

// minDps, minManaRegen and maxCost (when set).
bool passesThresholds(const DerivedStats& derived, const BuildRequest& request);

// Both phases; aggregates and derives internally.
bool isValid(const Build& build, const BuildRequest& request, const ClassTable& classes);

// Skill points a character has at `level`: min(10 + 2 * level, 200).
int availableSkillPoints(int level);

struct BuildReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    SkillPoints requirements{};
    int requiredTotal{0};
    int available{0};

    bool valid() const { return errors.empty(); }
};

// Player-facing check of a single loadout. Errors make it unequippable; warnings are acquisition notes.
BuildReport validateBuild(const Build& build, int playerLevel);

}  // namespace Loadout
