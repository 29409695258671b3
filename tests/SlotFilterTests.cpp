#include <cassert>
#include <string>
#include <vector>

#include "../loadout/build/SlotFilter.h"
#include "TestItems.h"

int main() {
    using namespace Loadout;
    using TestItems::makeItem;
    using TestItems::makeWeapon;
    {
        // Class filter: weapon type must match, class requirement must match or be absent.
        std::vector<Item> catalog;
        catalog.push_back(makeWeapon("Wand", WeaponType::Wand, 1.0f, 2.0f));
        catalog.push_back(makeWeapon("Bow", WeaponType::Bow, 1.0f, 2.0f));
        Item archerHat = makeItem("Archer Hat", EquipmentSlot::Helmet);
        archerHat.classRequirement = PlayerClass::Archer;
        catalog.push_back(archerHat);
        catalog.push_back(makeItem("Any Hat", EquipmentSlot::Helmet));

        BuildRequest req{};
        req.playerClass = PlayerClass::Mage;
        SlotCandidates c = filterCandidates(catalog, req);
        assert(c[EquipmentSlot::Weapon].size() == 1);
        assert(c[EquipmentSlot::Weapon][0]->name == "Wand");
        assert(c[EquipmentSlot::Helmet].size() == 1);
        assert(c[EquipmentSlot::Helmet][0]->name == "Any Hat");

        req.playerClass = PlayerClass::Archer;
        c = filterCandidates(catalog, req);
        assert(c[EquipmentSlot::Weapon][0]->name == "Bow");
        assert(c[EquipmentSlot::Helmet].size() == 2);
    }
    {
        // Level range, mythic and name exclusion.
        std::vector<Item> catalog;
        catalog.push_back(makeItem("Low", EquipmentSlot::Boots, 79));
        catalog.push_back(makeItem("Edge Low", EquipmentSlot::Boots, 80));
        catalog.push_back(makeItem("Edge High", EquipmentSlot::Boots, 106));
        catalog.push_back(makeItem("Myth", EquipmentSlot::Boots, 100, Tier::Mythic));
        catalog.push_back(makeItem("Banned", EquipmentSlot::Boots, 100));

        BuildRequest req{};
        req.noMythics = true;
        req.excludeItems = {"banned"};
        SlotCandidates c = filterCandidates(catalog, req);
        const auto& boots = c[EquipmentSlot::Boots];
        assert(boots.size() == 2);
        assert(boots[0]->name == "Edge Low");
        assert(boots[1]->name == "Edge High");
    }
    {
        // Playstyle scoring and stable ordering.
        Item plain = makeItem("Plain", EquipmentSlot::Leggings);
        Item caster = makeItem("Caster", EquipmentSlot::Leggings);
        caster.identifications.set(StatId::SpellDamagePct, 10.0f);
        caster.identifications.set(StatId::ManaRegen, 2.0f);
        caster.identifications.set(StatId::WaterDamagePct, 5.0f);
        caster.identifications.set(StatId::FireDamagePct, -5.0f);
        Item tank = makeItem("Tank", EquipmentSlot::Leggings);
        tank.hp = 2000.0f;
        tank.identifications.set(StatId::HealthBonus, 300.0f);
        tank.identifications.set(StatId::EarthDefensePct, 10.0f);
        Item plain2 = makeItem("Plain Two", EquipmentSlot::Leggings);

        assert(playstyleScore(caster, Playstyle::Spellspam) == 3);
        assert(playstyleScore(tank, Playstyle::Tank) == 3);
        assert(playstyleScore(tank, Playstyle::Hybrid) == 1);
        assert(playstyleScore(plain, Playstyle::Melee) == 0);

        std::vector<Item> catalog{plain, tank, caster, plain2};
        BuildRequest req{};
        req.playstyle = Playstyle::Spellspam;
        SlotCandidates c = filterCandidates(catalog, req);
        const auto& legs = c[EquipmentSlot::Leggings];
        assert(legs.size() == 4);
        assert(legs[0]->name == "Caster");
        // Zero-score items keep catalog order.
        assert(legs[1]->name == "Plain");
        assert(legs[2]->name == "Tank");
        assert(legs[3]->name == "Plain Two");

        req.playstyle = Playstyle::Tank;
        c = filterCandidates(catalog, req);
        assert(c[EquipmentSlot::Leggings][0]->name == "Tank");
    }
    {
        // Element stage: default +1 keeps non-matching items; strict mode drops them.
        Item water = makeItem("Water Ring", EquipmentSlot::Ring);
        water.identifications.set(StatId::WaterDamagePct, 7.0f);
        Item waterDef = makeItem("Tide Ring", EquipmentSlot::Ring);
        waterDef.identifications.set(StatId::WaterDamagePct, 3.0f);
        waterDef.identifications.set(StatId::WaterDefensePct, 10.0f);
        Item fire = makeItem("Fire Ring", EquipmentSlot::Ring);
        fire.identifications.set(StatId::FireDamagePct, 7.0f);
        Item negative = makeItem("Dry Ring", EquipmentSlot::Ring);
        negative.identifications.set(StatId::WaterDamagePct, -10.0f);

        const std::vector<Element> pref{Element::Water};
        assert(elementScore(water, pref, false) == 2);
        assert(elementScore(waterDef, pref, false) == 4);
        assert(elementScore(fire, pref, false) == 1);
        assert(elementScore(fire, pref, true) == 0);
        assert(elementScore(negative, pref, false) == 1);

        std::vector<Item> catalog{fire, water, negative, waterDef};
        BuildRequest req{};
        req.elements = pref;
        SlotCandidates c = filterCandidates(catalog, req);
        const auto& rings = c[EquipmentSlot::Ring];
        assert(rings.size() == 4);
        assert(rings[0]->name == "Tide Ring");
        assert(rings[1]->name == "Water Ring");

        req.strictElements = true;
        c = filterCandidates(catalog, req);
        assert(c[EquipmentSlot::Ring].size() == 2);
        assert(c[EquipmentSlot::Ring][0]->name == "Tide Ring");
    }
    {
        // Per-slot cap keeps the highest-priority items.
        std::vector<Item> catalog;
        for (int i = 0; i < 30; ++i) {
            Item n = makeItem("Necklace " + std::to_string(i), EquipmentSlot::Necklace);
            if (i == 29) n.identifications.set(StatId::SpellDamagePct, 5.0f);
            catalog.push_back(n);
        }
        BuildRequest req{};
        req.maxItemsPerSlot = 5;
        SlotCandidates c = filterCandidates(catalog, req);
        assert(c[EquipmentSlot::Necklace].size() == 5);
        assert(c[EquipmentSlot::Necklace][0]->name == "Necklace 29");
        assert(c[EquipmentSlot::Necklace][1]->name == "Necklace 0");
    }
    return 0;
}
