// Enumerations and key parsing shared by the item model, loaders and the build pipeline.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../../engine/gameplay/StatFormulas.h"

namespace Loadout {

using Forge::Gameplay::AttackSpeed;

enum class EquipmentSlot : std::uint8_t {
    Helmet = 0,
    Chestplate,
    Leggings,
    Boots,
    Weapon,
    Ring,
    Bracelet,
    Necklace,
    Count
};

enum class WeaponType : std::uint8_t { Wand = 0, Bow, Spear, Dagger, Relik, Count };

// Set is a parallel tier; it is ordered last only for table indexing.
enum class Tier : std::uint8_t { Normal = 0, Unique, Rare, Legendary, Fabled, Mythic, Set, Count };

enum class PlayerClass : std::uint8_t { Mage = 0, Archer, Warrior, Assassin, Shaman, Count };

enum class Playstyle : std::uint8_t { Spellspam = 0, Melee, Tank, Hybrid, Count };

enum class Element : std::uint8_t { Earth = 0, Thunder, Water, Fire, Air, Count };

enum class SkillStat : std::uint8_t { Strength = 0, Dexterity, Intelligence, Defense, Agility, Count };

// Fixed identification set summed by the aggregator.
enum class StatId : std::uint8_t {
    Health = 0,
    HealthBonus,
    HealthRegenRaw,
    HealthRegenPct,
    Mana,
    ManaRegen,
    ManaSteal,
    SpellDamageRaw,
    SpellDamagePct,
    MeleeDamageRaw,
    MeleeDamagePct,
    LifeSteal,
    Poison,
    Thorns,
    Reflection,
    Exploding,
    WalkSpeed,
    AttackSpeedBonus,
    SpellCostRaw,
    SpellCostPct,
    EarthDamagePct,
    ThunderDamagePct,
    WaterDamagePct,
    FireDamagePct,
    AirDamagePct,
    EarthDefensePct,
    ThunderDefensePct,
    WaterDefensePct,
    FireDefensePct,
    AirDefensePct,
    EarthDamageRaw,
    ThunderDamageRaw,
    WaterDamageRaw,
    FireDamageRaw,
    AirDamageRaw,
    Strength,
    Dexterity,
    Intelligence,
    Defense,
    Agility,
    Count
};

constexpr std::size_t kSlotCount = static_cast<std::size_t>(EquipmentSlot::Count);
constexpr std::size_t kClassCount = static_cast<std::size_t>(PlayerClass::Count);
constexpr std::size_t kTierCount = static_cast<std::size_t>(Tier::Count);
constexpr std::size_t kElementCount = static_cast<std::size_t>(Element::Count);
constexpr std::size_t kSkillCount = static_cast<std::size_t>(SkillStat::Count);
constexpr std::size_t kStatCount = static_cast<std::size_t>(StatId::Count);

// Summable stat container indexed by StatId.
struct StatBlock {
    std::array<float, kStatCount> values{};

    float get(StatId id) const { return values[static_cast<std::size_t>(id)]; }
    void set(StatId id, float v) { values[static_cast<std::size_t>(id)] = v; }
    void add(StatId id, float v) { values[static_cast<std::size_t>(id)] += v; }

    StatBlock& operator+=(const StatBlock& o) {
        for (std::size_t i = 0; i < values.size(); ++i) values[i] += o.values[i];
        return *this;
    }
};

// Per-attribute skill point vector (requirements or totals).
struct SkillPoints {
    std::array<int, kSkillCount> values{};

    int get(SkillStat s) const { return values[static_cast<std::size_t>(s)]; }
    void set(SkillStat s, int v) { values[static_cast<std::size_t>(s)] = v; }
    int total() const {
        int sum = 0;
        for (int v : values) sum += v;
        return sum;
    }
    int highest() const {
        int best = 0;
        for (int v : values) best = v > best ? v : best;
        return best;
    }

    SkillPoints& operator+=(const SkillPoints& o) {
        for (std::size_t i = 0; i < values.size(); ++i) values[i] += o.values[i];
        return *this;
    }
};

// Key parsing is case-insensitive and ignores spaces, '_' and '-'.
std::optional<EquipmentSlot> parseSlotKey(std::string_view key);
std::optional<WeaponType> parseWeaponTypeKey(std::string_view key);
std::optional<Tier> parseTierKey(std::string_view key);
std::optional<PlayerClass> parseClassKey(std::string_view key);
std::optional<Playstyle> parsePlaystyleKey(std::string_view key);
std::optional<Element> parseElementKey(std::string_view key);
std::optional<AttackSpeed> parseAttackSpeedKey(std::string_view key);
std::optional<SkillStat> parseSkillKey(std::string_view key);
// Accepts the canonical snake_case names and the short catalog aliases (e.g. "sdPct").
std::optional<StatId> parseStatKey(std::string_view key);

const char* slotName(EquipmentSlot slot);
const char* weaponTypeName(WeaponType type);
const char* tierName(Tier tier);
const char* className(PlayerClass cls);
const char* playstyleName(Playstyle style);
const char* elementName(Element element);
const char* attackSpeedName(AttackSpeed speed);
const char* skillName(SkillStat stat);
const char* statKey(StatId id);

WeaponType weaponTypeForClass(PlayerClass cls);

StatId elementDamagePct(Element element);
StatId elementDefensePct(Element element);
StatId elementDamageRaw(Element element);
StatId skillBonusStat(SkillStat stat);

}  // namespace Loadout
