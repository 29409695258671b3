#include "Item.h"

#include <algorithm>
#include <cctype>

namespace Loadout {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

float WeaponStats::averageDamage() const {
    float total = neutral.average();
    for (const auto& r : elemental) total += r.average();
    return total;
}

bool Item::usableBy(PlayerClass cls) const {
    if (classRequirement.has_value() && *classRequirement != cls) return false;
    if (slot != EquipmentSlot::Weapon) return true;
    return weaponType.has_value() && *weaponType == weaponTypeForClass(cls);
}

float tierBaseCost(Tier tier) {
    switch (tier) {
        case Tier::Normal: return 0.0f;
        case Tier::Unique: return 1.0f;
        case Tier::Rare: return 5.0f;
        case Tier::Legendary: return 50.0f;
        case Tier::Set: return 20.0f;
        case Tier::Mythic: return 500.0f;
        case Tier::Fabled: return 1000.0f;
        default: return 0.0f;
    }
}

float itemCostEstimate(const Item& item) {
    const float levelMult = std::max(1.0f, static_cast<float>(item.level) / 50.0f);
    return tierBaseCost(item.tier) * levelMult;
}

float estimatedWeaponDamage(WeaponType type, int level) {
    const float lvl = static_cast<float>(level);
    switch (type) {
        case WeaponType::Wand: return lvl * 1.2f;
        case WeaponType::Spear: return lvl * 1.4f;
        case WeaponType::Bow: return lvl * 1.1f;
        case WeaponType::Dagger: return lvl * 1.0f;
        case WeaponType::Relik: return lvl * 1.3f;
        default: return lvl;
    }
}

const Item* findItem(const std::vector<Item>& catalog, const std::string& name) {
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [&](const Item& item) { return equalsIgnoreCase(item.name, name); });
    return it == catalog.end() ? nullptr : &*it;
}

}  // namespace Loadout
