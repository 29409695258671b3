// Build (one loadout) plus the aggregated/derived stat records computed for it.
#pragma once

#include <array>
#include <string>
#include <vector>

#include "../items/Item.h"

namespace Loadout {

// Items are borrowed from the catalog; the catalog must outlive every Build.
struct Build {
    PlayerClass playerClass{PlayerClass::Mage};
    // Indexed by EquipmentSlot; the Ring entry is unused (see rings).
    std::array<const Item*, kSlotCount> equipped{};
    std::array<const Item*, 2> rings{};

    const Item* item(EquipmentSlot slot) const { return equipped[static_cast<std::size_t>(slot)]; }
    void setItem(EquipmentSlot slot, const Item* it) { equipped[static_cast<std::size_t>(slot)] = it; }

    // Every non-empty position, unique slots in slot order, then rings.
    std::vector<const Item*> items() const;
    int ringCount() const;
    const Item* weapon() const { return item(EquipmentSlot::Weapon); }
};

struct AggregatedStats {
    StatBlock stats{};
    SkillPoints requirements{};
    int itemCount{0};
};

struct DamageBreakdown {
    float spellDps{0.0f};
    float meleeDps{0.0f};
    float poisonDps{0.0f};
};

struct SpellCostResult {
    std::string name;
    int baseCost{0};
    int cost{0};
};

struct DerivedStats {
    float dps{0.0f};
    DamageBreakdown damage{};
    float manaSustain{0.0f};
    Forge::Gameplay::EffectiveHp ehp{};
    float cost{0.0f};
    std::vector<SpellCostResult> spellCosts;
    SkillPoints skillPoints{};
    int skillPointTotal{0};
};

struct ScoredBuild {
    Build build{};
    AggregatedStats aggregated{};
    DerivedStats derived{};
    float score{0.0f};
};

// Single-line item list, e.g. "helmet=Foo, weapon=Bar, ring=Baz, ring=Qux".
std::string describeBuild(const Build& build);

}  // namespace Loadout
