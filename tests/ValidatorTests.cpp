#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

#include "../loadout/build/BuildValidator.h"
#include "../loadout/build/StatAggregator.h"
#include "../loadout/build/StatCalculator.h"
#include "TestItems.h"

namespace {

using namespace Loadout;

Build buildFrom(const std::vector<Item>& catalog, PlayerClass cls) {
    Build b{};
    b.playerClass = cls;
    int ring = 0;
    for (const auto& item : catalog) {
        if (item.slot == EquipmentSlot::Ring) {
            if (ring < 2) b.rings[ring++] = &item;
        } else {
            b.setItem(item.slot, &item);
        }
    }
    return b;
}

bool mentions(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string& l) { return l.find(needle) != std::string::npos; });
}

}  // namespace

int main() {
    const ClassTable classes = defaultClassTable();
    {
        // Baseline build passes both phases.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        Build b = buildFrom(catalog, PlayerClass::Mage);
        BuildRequest req{};
        assert(b.ringCount() == 2);
        assert(passesStructural(b, req));
        assert(isValid(b, req, classes));

        // One ring is never a final build.
        b.rings[1] = nullptr;
        assert(!passesStructural(b, req));
        b.rings[0] = nullptr;
        assert(passesStructural(b, req));
    }
    {
        // Weapon type and class requirement must fit the class.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        Build b = buildFrom(catalog, PlayerClass::Warrior);
        BuildRequest req{};
        req.playerClass = PlayerClass::Warrior;
        assert(!passesStructural(b, req));

        catalog[0].classRequirement = PlayerClass::Archer;
        Build mage = buildFrom(catalog, PlayerClass::Mage);
        assert(!passesStructural(mage, BuildRequest{}));
    }
    {
        // Skill points: a single attribute or the overall sum above the cap fails.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        catalog[0].requirements.set(SkillStat::Intelligence, 120);
        catalog[1].requirements.set(SkillStat::Intelligence, 90);
        Build b = buildFrom(catalog, PlayerClass::Mage);
        BuildRequest req{};
        assert(!passesStructural(b, req));

        catalog[1].requirements.set(SkillStat::Intelligence, 0);
        catalog[1].requirements.set(SkillStat::Defense, 70);
        catalog[2].requirements.set(SkillStat::Agility, 10);
        b = buildFrom(catalog, PlayerClass::Mage);
        assert(passesStructural(b, req));
        req.maxSkillPoints = 120;
        assert(!passesStructural(b, req));
        req.maxSkillPoints = 210;
        assert(passesStructural(b, req));
    }
    {
        // Thresholds on derived stats.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        catalog[5].identifications.set(StatId::ManaRegen, 3.0f);
        catalog[4].tier = Tier::Legendary;
        Build b = buildFrom(catalog, PlayerClass::Mage);
        AggregatedStats agg = aggregate(b);
        DerivedStats d = deriveStats(b, agg, classes, 106);
        assert(d.dps > 0.0f);
        assert(d.cost == 100.0f);

        BuildRequest req{};
        assert(passesThresholds(d, req));
        req.minDps = d.dps + 1.0f;
        assert(!passesThresholds(d, req));
        req.minDps = 0.0f;
        req.minManaRegen = 3.0f;
        assert(passesThresholds(d, req));
        req.minManaRegen = 3.5f;
        assert(!passesThresholds(d, req));
        req.minManaRegen = 0.0f;
        req.maxCost = 99.0f;
        assert(!passesThresholds(d, req));
        assert(!isValid(b, req, classes));
        req.maxCost = 100.0f;
        assert(passesThresholds(d, req));
    }
    {
        assert(availableSkillPoints(1) == 12);
        assert(availableSkillPoints(50) == 110);
        assert(availableSkillPoints(106) == 200);
    }
    {
        // Detailed report: errors block the build, warnings describe acquisition.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        catalog[0].questRequired = true;
        catalog[0].questName = "The Lost";
        catalog[1].untradeable = true;
        catalog[2].tier = Tier::Mythic;
        Build b = buildFrom(catalog, PlayerClass::Mage);
        BuildReport report = validateBuild(b, 106);
        assert(report.valid());
        assert(report.warnings.size() == 3);
        assert(mentions(report.warnings, "The Lost"));
        assert(mentions(report.warnings, "untradeable"));
        assert(mentions(report.warnings, "Mythic"));

        // Level 50: items are level 100 and the budget is 110.
        catalog[3].requirements.set(SkillStat::Strength, 150);
        b = buildFrom(catalog, PlayerClass::Mage);
        report = validateBuild(b, 50);
        assert(!report.valid());
        assert(report.available == 110);
        assert(report.requiredTotal == 150);
        assert(mentions(report.errors, "requires level 100"));
        assert(mentions(report.errors, "skill points"));

        b.rings[1] = nullptr;
        report = validateBuild(b, 106);
        assert(mentions(report.errors, "single ring"));
    }
    return 0;
}
