#include "BuildValidator.h"

#include <algorithm>

#include "StatAggregator.h"
#include "StatCalculator.h"

namespace Loadout {

namespace {

constexpr int kBaseSkillPoints = 10;
constexpr int kSkillPointsPerLevel = 2;
constexpr int kSkillPointCeiling = 200;

bool weaponFitsClass(const Build& build) {
    const Item* w = build.weapon();
    if (!w) return true;
    return w->weaponType.has_value() && *w->weaponType == weaponTypeForClass(build.playerClass);
}

}  // namespace

bool passesStructural(const Build& build, const BuildRequest& request) {
    const int rings = build.ringCount();
    if (rings != 0 && rings != 2) return false;
    if (!weaponFitsClass(build)) return false;

    SkillPoints req{};
    for (const Item* item : build.items()) {
        if (item->classRequirement.has_value() && *item->classRequirement != build.playerClass) return false;
        req += item->requirements;
    }
    if (req.highest() > request.maxSkillPoints) return false;
    return req.total() <= request.maxSkillPoints;
}

bool passesThresholds(const DerivedStats& derived, const BuildRequest& request) {
    if (derived.dps < request.minDps) return false;
    if (derived.manaSustain < request.minManaRegen) return false;
    if (request.maxCost.has_value() && derived.cost > *request.maxCost) return false;
    return true;
}

bool isValid(const Build& build, const BuildRequest& request, const ClassTable& classes) {
    if (!passesStructural(build, request)) return false;
    const AggregatedStats agg = aggregate(build);
    return passesThresholds(deriveStats(build, agg, classes, request.playerLevel), request);
}

int availableSkillPoints(int level) {
    return std::min(kBaseSkillPoints + kSkillPointsPerLevel * std::max(0, level), kSkillPointCeiling);
}

BuildReport validateBuild(const Build& build, int playerLevel) {
    BuildReport report{};
    report.available = availableSkillPoints(playerLevel);

    const int rings = build.ringCount();
    if (rings == 1) report.errors.push_back("Build has a single ring; rings are equipped in pairs.");
    if (!weaponFitsClass(build)) {
        const Item* w = build.weapon();
        report.errors.push_back(w->name + " cannot be used by " + className(build.playerClass) + ".");
    }

    for (const Item* item : build.items()) {
        report.requirements += item->requirements;
        if (item->classRequirement.has_value() && *item->classRequirement != build.playerClass) {
            report.errors.push_back(item->name + " requires class " + className(*item->classRequirement) + ".");
        }
        if (item->level > playerLevel) {
            report.errors.push_back(item->name + " requires level " + std::to_string(item->level) + " (player is " +
                                    std::to_string(playerLevel) + ").");
        }
        if (item->questRequired) {
            report.warnings.push_back(item->name + " requires a quest" +
                                      (item->questName.empty() ? std::string{} : ": " + item->questName) + ".");
        }
        if (item->untradeable) report.warnings.push_back(item->name + " is untradeable.");
        if (item->tier == Tier::Mythic) report.warnings.push_back(item->name + " is Mythic and may be hard to obtain.");
    }

    report.requiredTotal = report.requirements.total();
    if (report.requiredTotal > report.available) {
        report.errors.push_back("Requires " + std::to_string(report.requiredTotal) + " skill points but only " +
                                std::to_string(report.available) + " are available at level " +
                                std::to_string(playerLevel) + ".");
    }
    return report;
}

}  // namespace Loadout
