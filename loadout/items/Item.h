// Typed item record consumed by the build pipeline.
#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ItemTypes.h"

namespace Loadout {

struct DamageRange {
    float min{0.0f};
    float max{0.0f};

    float average() const { return (min + max) * 0.5f; }
};

// Weapon-only data. Neutral plus the five elemental channels.
struct WeaponStats {
    AttackSpeed attackSpeed{AttackSpeed::Normal};
    DamageRange neutral{};
    std::array<DamageRange, kElementCount> elemental{};
    // False when the catalog carried no damage ranges (level estimate is used instead).
    bool hasDamage{false};

    float averageDamage() const;
};

struct Item {
    std::string name;
    EquipmentSlot slot{EquipmentSlot::Helmet};
    std::optional<WeaponType> weaponType;
    Tier tier{Tier::Normal};
    int level{1};
    std::optional<PlayerClass> classRequirement;
    SkillPoints requirements{};
    float hp{0.0f};
    float mana{0.0f};
    StatBlock identifications{};
    // Identifications the model does not know; kept verbatim, never aggregated.
    std::unordered_map<std::string, float> extraIdentifications;
    std::optional<WeaponStats> weapon;
    bool questRequired{false};
    std::string questName;
    bool untradeable{false};

    float stat(StatId id) const { return identifications.get(id); }
    bool hasStat(StatId id) const { return identifications.get(id) != 0.0f; }
    bool hasPositive(StatId id) const { return identifications.get(id) > 0.0f; }
    // Weapon-slot items with a weapon type usable by the class; non-weapons always pass.
    bool usableBy(PlayerClass cls) const;
};

// Tier -> base trade cost used by the build cost estimate.
float tierBaseCost(Tier tier);

// tierBaseCost(tier) * max(1, level / 50)
float itemCostEstimate(const Item& item);

// Level-based damage estimate for weapons without damage data.
float estimatedWeaponDamage(WeaponType type, int level);

// Finds an item by case-insensitive name; nullptr when absent.
const Item* findItem(const std::vector<Item>& catalog, const std::string& name);

}  // namespace Loadout
