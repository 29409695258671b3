// Immutable per-class data consumed by the derived-stat calculators.
#pragma once

#include <array>
#include <string>
#include <vector>

#include "../items/ItemTypes.h"

namespace Loadout {

struct SpellConversion {
    std::string spell;
    Element element{Element::Earth};
    float pct{0.0f};
};

struct SpellCostEntry {
    std::string name;
    int baseCost{1};
};

struct ClassProfile {
    PlayerClass cls{PlayerClass::Mage};
    WeaponType weaponType{WeaponType::Wand};
    float baseSpellMultiplier{1.0f};
    float baseDamageMultiplier{1.0f};
    float defenseMultiplier{1.0f};
    float healthPerLevel{5.0f};
    float manaPerLevel{10.0f};
    std::vector<SpellConversion> conversions;
    std::vector<SpellCostEntry> spellCosts;

    // Mean of all conversion percentages as a fraction; 1 when the class lists none.
    float conversionFactor() const;
};

class ClassTable {
public:
    ClassTable();

    const ClassProfile& profile(PlayerClass cls) const { return profiles_[static_cast<std::size_t>(cls)]; }
    ClassProfile& profile(PlayerClass cls) { return profiles_[static_cast<std::size_t>(cls)]; }

private:
    std::array<ClassProfile, kClassCount> profiles_{};
};

// Built-in class data for all five classes.
ClassTable defaultClassTable();

// Overlays the JSON file on the defaults. Missing file, bad JSON or unknown keys fall back to defaults.
ClassTable loadClassTable(const std::string& path);

// Same overlay from already-loaded JSON text; returns false if the text is not a JSON object.
bool applyClassTableText(const std::string& text, ClassTable& table);

}  // namespace Loadout
