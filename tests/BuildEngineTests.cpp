#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "../loadout/build/BuildEngine.h"
#include "../loadout/build/Scorer.h"
#include "TestItems.h"

int main() {
    using namespace Loadout;
    using TestItems::makeItem;
    using TestItems::makeWeapon;
    const ClassTable classes = defaultClassTable();
    {
        // One item per slot: exactly one complete build.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        BuildRequest req{};
        GenerationResult r = generateBuilds(catalog, req, classes);
        assert(r.builds.size() == 1);
        assert(!r.truncated);
        assert(r.stopReason == StopReason::Exhausted);
        assert(r.diagnostic.empty());
        assert(r.combinationsChecked == 1);
        assert(r.validBuilds == 1);
        const ScoredBuild& best = r.builds[0];
        assert(best.build.ringCount() == 2);
        assert(best.build.weapon()->weaponType == WeaponType::Wand);
        assert(best.aggregated.itemCount == 9);
        assert(best.derived.dps > 0.0f);
        assert(best.derived.spellCosts.size() == 4);
    }
    {
        // topN = 0 returns nothing and is not truncated.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        BuildRequest req{};
        req.topN = 0;
        GenerationResult r = generateBuilds(catalog, req, classes);
        assert(r.builds.empty());
        assert(!r.truncated);
        assert(r.stopReason == StopReason::NothingRequested);
        assert(r.combinationsChecked == 0);
    }
    {
        // A mandatory slot with no candidates yields a diagnostic, never partial builds.
        std::vector<Item> catalog;
        for (const auto& it : TestItems::minimalMageCatalog()) {
            if (it.slot != EquipmentSlot::Leggings) catalog.push_back(it);
        }
        GenerationResult r = generateBuilds(catalog, BuildRequest{}, classes);
        assert(r.builds.empty());
        assert(r.stopReason == StopReason::MissingSlot);
        assert(r.diagnostic == "no candidates for slot leggings");
    }
    {
        // Only the class's weapon type is ever equipped.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        catalog.push_back(makeWeapon("Longbow", WeaponType::Bow, 500.0f, 900.0f));
        catalog.push_back(makeWeapon("Pike", WeaponType::Spear, 500.0f, 900.0f));
        catalog.push_back(makeWeapon("Big Stick", WeaponType::Wand, 200.0f, 300.0f));
        BuildRequest req{};
        GenerationResult r = generateBuilds(catalog, req, classes);
        assert(r.builds.size() == 2);
        for (const auto& sb : r.builds) assert(sb.build.weapon()->weaponType == WeaponType::Wand);
        // Higher damage ranks first; scores descend.
        assert(r.builds[0].build.weapon()->name == "Big Stick");
        assert(r.builds[0].score >= r.builds[1].score);

        req.playerClass = PlayerClass::Archer;
        r = generateBuilds(catalog, req, classes);
        assert(r.builds.size() == 1);
        assert(r.builds[0].build.weapon()->name == "Longbow");
    }
    {
        // Check cap and build target both mark the result truncated.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        for (int i = 0; i < 3; ++i) {
            catalog.push_back(makeWeapon("Wand " + std::to_string(i), WeaponType::Wand, 10.0f + i, 20.0f + i));
            catalog.push_back(makeItem("Hat " + std::to_string(i), EquipmentSlot::Helmet));
        }
        // 4 wands x 4 helmets.
        BuildRequest req{};
        req.topN = 20;
        GenerationResult full = generateBuilds(catalog, req, classes);
        assert(full.combinationsChecked == 16);
        assert(full.builds.size() == 16);
        assert(!full.truncated);

        req.maxChecks = 5;
        GenerationResult capped = generateBuilds(catalog, req, classes);
        assert(capped.truncated);
        assert(capped.stopReason == StopReason::CheckLimit);
        assert(capped.combinationsChecked == 5);
        assert(capped.builds.size() == 5);

        req.maxChecks = 50000;
        req.topN = 2;
        req.maxBuilds = 3;
        GenerationResult target = generateBuilds(catalog, req, classes);
        assert(target.truncated);
        assert(target.stopReason == StopReason::TargetReached);
        assert(target.validBuilds == 3);
        assert(target.builds.size() == 2);

        // The target is never below topN.
        req.topN = 6;
        req.maxBuilds = 1;
        target = generateBuilds(catalog, req, classes);
        assert(target.validBuilds == 6);
        assert(target.builds.size() == 6);
    }
    {
        // Identical inputs give identical output.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        catalog.push_back(makeWeapon("Twin", WeaponType::Wand, 40.0f, 90.0f));
        catalog.push_back(makeItem("Band C", EquipmentSlot::Ring));
        BuildRequest req{};
        GenerationResult a = generateBuilds(catalog, req, classes);
        GenerationResult b = generateBuilds(catalog, req, classes);
        assert(a.builds.size() == b.builds.size());
        for (std::size_t i = 0; i < a.builds.size(); ++i) {
            assert(describeBuild(a.builds[i].build) == describeBuild(b.builds[i].build));
            assert(a.builds[i].score == b.builds[i].score);
        }
    }
    {
        // Skill point cap and thresholds prune builds.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        Item greedy = makeItem("Greedy Hat", EquipmentSlot::Helmet);
        greedy.requirements.set(SkillStat::Intelligence, 150);
        greedy.requirements.set(SkillStat::Agility, 60);
        catalog.push_back(greedy);
        BuildRequest req{};
        GenerationResult r = generateBuilds(catalog, req, classes);
        assert(r.combinationsChecked == 2);
        assert(r.validBuilds == 1);
        assert(r.builds[0].build.item(EquipmentSlot::Helmet)->name == "Cap");

        req.minDps = 1.0e9f;
        r = generateBuilds(catalog, req, classes);
        assert(r.builds.empty());
        assert(!r.truncated);
    }
    {
        // A throwing custom scorer falls back to the default score for every build.
        std::vector<Item> catalog = TestItems::minimalMageCatalog();
        catalog.push_back(makeWeapon("Spare", WeaponType::Wand, 1.0f, 2.0f));
        BuildRequest req{};
        req.customScoring = [](const AggregatedStats&, const DerivedStats&) -> float {
            throw std::runtime_error("bad scorer");
        };
        GenerationResult r = generateBuilds(catalog, req, classes);
        assert(r.builds.size() == 2);
        assert(r.customScoringFailures == 2);
        const ScoreWeights w = playstyleWeights(req.playstyle);
        for (const auto& sb : r.builds) {
            assert(sb.score == weightedScore(sb.aggregated, sb.derived, w, req.maxSkillPoints));
        }
    }
    return 0;
}
