#include "ItemTypes.h"

#include <cctype>

namespace Loadout {

namespace {

std::string normalizeKey(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == ' ' || c == '_' || c == '-') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

struct StatKeyEntry {
    StatId id;
    const char* key;
    const char* alias;
    const char* altAlias;
};

constexpr std::array<StatKeyEntry, kStatCount> kStatKeys = {{
    {StatId::Health, "hp", "health", nullptr},
    {StatId::HealthBonus, "health_bonus", "hpBonus", nullptr},
    {StatId::HealthRegenRaw, "health_regen_raw", "hprRaw", "hpr"},
    {StatId::HealthRegenPct, "health_regen_percent", "hprPct", nullptr},
    {StatId::Mana, "mana", nullptr, nullptr},
    {StatId::ManaRegen, "mana_regen", "mr", nullptr},
    {StatId::ManaSteal, "mana_steal", "ms", nullptr},
    {StatId::SpellDamageRaw, "spell_damage_raw", "sdRaw", nullptr},
    {StatId::SpellDamagePct, "spell_damage_percent", "sdPct", nullptr},
    {StatId::MeleeDamageRaw, "melee_damage_raw", "mdRaw", nullptr},
    {StatId::MeleeDamagePct, "melee_damage_percent", "mdPct", nullptr},
    {StatId::LifeSteal, "life_steal", "ls", nullptr},
    {StatId::Poison, "poison", nullptr, nullptr},
    {StatId::Thorns, "thorns", nullptr, nullptr},
    {StatId::Reflection, "reflection", "ref", nullptr},
    {StatId::Exploding, "exploding", "expd", nullptr},
    {StatId::WalkSpeed, "walk_speed", "spd", nullptr},
    {StatId::AttackSpeedBonus, "attack_speed_bonus", "atkTier", nullptr},
    {StatId::SpellCostRaw, "spell_cost_raw", nullptr, nullptr},
    {StatId::SpellCostPct, "spell_cost_percent", nullptr, nullptr},
    {StatId::EarthDamagePct, "earth_damage_percent", "eDamPct", nullptr},
    {StatId::ThunderDamagePct, "thunder_damage_percent", "tDamPct", nullptr},
    {StatId::WaterDamagePct, "water_damage_percent", "wDamPct", nullptr},
    {StatId::FireDamagePct, "fire_damage_percent", "fDamPct", nullptr},
    {StatId::AirDamagePct, "air_damage_percent", "aDamPct", nullptr},
    {StatId::EarthDefensePct, "earth_defense_percent", "eDefPct", nullptr},
    {StatId::ThunderDefensePct, "thunder_defense_percent", "tDefPct", nullptr},
    {StatId::WaterDefensePct, "water_defense_percent", "wDefPct", nullptr},
    {StatId::FireDefensePct, "fire_defense_percent", "fDefPct", nullptr},
    {StatId::AirDefensePct, "air_defense_percent", "aDefPct", nullptr},
    {StatId::EarthDamageRaw, "earth_damage_raw", "eDamRaw", nullptr},
    {StatId::ThunderDamageRaw, "thunder_damage_raw", "tDamRaw", nullptr},
    {StatId::WaterDamageRaw, "water_damage_raw", "wDamRaw", nullptr},
    {StatId::FireDamageRaw, "fire_damage_raw", "fDamRaw", nullptr},
    {StatId::AirDamageRaw, "air_damage_raw", "aDamRaw", nullptr},
    {StatId::Strength, "str", "strength", nullptr},
    {StatId::Dexterity, "dex", "dexterity", nullptr},
    {StatId::Intelligence, "int", "intelligence", nullptr},
    {StatId::Defense, "def", "defense", nullptr},
    {StatId::Agility, "agi", "agility", nullptr},
}};

}  // namespace

std::optional<EquipmentSlot> parseSlotKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "helmet") return EquipmentSlot::Helmet;
    if (k == "chestplate") return EquipmentSlot::Chestplate;
    if (k == "leggings") return EquipmentSlot::Leggings;
    if (k == "boots") return EquipmentSlot::Boots;
    if (k == "weapon") return EquipmentSlot::Weapon;
    if (k == "ring") return EquipmentSlot::Ring;
    if (k == "bracelet") return EquipmentSlot::Bracelet;
    if (k == "necklace") return EquipmentSlot::Necklace;
    return std::nullopt;
}

std::optional<WeaponType> parseWeaponTypeKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "wand") return WeaponType::Wand;
    if (k == "bow") return WeaponType::Bow;
    if (k == "spear") return WeaponType::Spear;
    if (k == "dagger") return WeaponType::Dagger;
    if (k == "relik") return WeaponType::Relik;
    return std::nullopt;
}

std::optional<Tier> parseTierKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "normal") return Tier::Normal;
    if (k == "unique") return Tier::Unique;
    if (k == "rare") return Tier::Rare;
    if (k == "legendary") return Tier::Legendary;
    if (k == "fabled") return Tier::Fabled;
    if (k == "mythic") return Tier::Mythic;
    if (k == "set") return Tier::Set;
    return std::nullopt;
}

std::optional<PlayerClass> parseClassKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "mage") return PlayerClass::Mage;
    if (k == "archer") return PlayerClass::Archer;
    if (k == "warrior") return PlayerClass::Warrior;
    if (k == "assassin") return PlayerClass::Assassin;
    if (k == "shaman") return PlayerClass::Shaman;
    return std::nullopt;
}

std::optional<Playstyle> parsePlaystyleKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "spellspam") return Playstyle::Spellspam;
    if (k == "melee") return Playstyle::Melee;
    if (k == "tank") return Playstyle::Tank;
    if (k == "hybrid") return Playstyle::Hybrid;
    return std::nullopt;
}

std::optional<Element> parseElementKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "earth") return Element::Earth;
    if (k == "thunder") return Element::Thunder;
    if (k == "water") return Element::Water;
    if (k == "fire") return Element::Fire;
    if (k == "air") return Element::Air;
    return std::nullopt;
}

std::optional<AttackSpeed> parseAttackSpeedKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "superslow") return AttackSpeed::SuperSlow;
    if (k == "veryslow") return AttackSpeed::VerySlow;
    if (k == "slow") return AttackSpeed::Slow;
    if (k == "normal") return AttackSpeed::Normal;
    if (k == "fast") return AttackSpeed::Fast;
    if (k == "veryfast") return AttackSpeed::VeryFast;
    if (k == "superfast") return AttackSpeed::SuperFast;
    return std::nullopt;
}

std::optional<SkillStat> parseSkillKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    if (k == "str" || k == "strength") return SkillStat::Strength;
    if (k == "dex" || k == "dexterity") return SkillStat::Dexterity;
    if (k == "int" || k == "intelligence") return SkillStat::Intelligence;
    if (k == "def" || k == "defense") return SkillStat::Defense;
    if (k == "agi" || k == "agility") return SkillStat::Agility;
    return std::nullopt;
}

std::optional<StatId> parseStatKey(std::string_view key) {
    const std::string k = normalizeKey(key);
    for (const auto& entry : kStatKeys) {
        if (k == normalizeKey(entry.key)) return entry.id;
        if (entry.alias && k == normalizeKey(entry.alias)) return entry.id;
        if (entry.altAlias && k == normalizeKey(entry.altAlias)) return entry.id;
    }
    return std::nullopt;
}

const char* slotName(EquipmentSlot slot) {
    switch (slot) {
        case EquipmentSlot::Helmet: return "helmet";
        case EquipmentSlot::Chestplate: return "chestplate";
        case EquipmentSlot::Leggings: return "leggings";
        case EquipmentSlot::Boots: return "boots";
        case EquipmentSlot::Weapon: return "weapon";
        case EquipmentSlot::Ring: return "ring";
        case EquipmentSlot::Bracelet: return "bracelet";
        case EquipmentSlot::Necklace: return "necklace";
        default: return "unknown";
    }
}

const char* weaponTypeName(WeaponType type) {
    switch (type) {
        case WeaponType::Wand: return "wand";
        case WeaponType::Bow: return "bow";
        case WeaponType::Spear: return "spear";
        case WeaponType::Dagger: return "dagger";
        case WeaponType::Relik: return "relik";
        default: return "unknown";
    }
}

const char* tierName(Tier tier) {
    switch (tier) {
        case Tier::Normal: return "Normal";
        case Tier::Unique: return "Unique";
        case Tier::Rare: return "Rare";
        case Tier::Legendary: return "Legendary";
        case Tier::Fabled: return "Fabled";
        case Tier::Mythic: return "Mythic";
        case Tier::Set: return "Set";
        default: return "Unknown";
    }
}

const char* className(PlayerClass cls) {
    switch (cls) {
        case PlayerClass::Mage: return "mage";
        case PlayerClass::Archer: return "archer";
        case PlayerClass::Warrior: return "warrior";
        case PlayerClass::Assassin: return "assassin";
        case PlayerClass::Shaman: return "shaman";
        default: return "unknown";
    }
}

const char* playstyleName(Playstyle style) {
    switch (style) {
        case Playstyle::Spellspam: return "spellspam";
        case Playstyle::Melee: return "melee";
        case Playstyle::Tank: return "tank";
        case Playstyle::Hybrid: return "hybrid";
        default: return "unknown";
    }
}

const char* elementName(Element element) {
    switch (element) {
        case Element::Earth: return "earth";
        case Element::Thunder: return "thunder";
        case Element::Water: return "water";
        case Element::Fire: return "fire";
        case Element::Air: return "air";
        default: return "unknown";
    }
}

const char* attackSpeedName(AttackSpeed speed) {
    switch (speed) {
        case AttackSpeed::SuperSlow: return "Super Slow";
        case AttackSpeed::VerySlow: return "Very Slow";
        case AttackSpeed::Slow: return "Slow";
        case AttackSpeed::Normal: return "Normal";
        case AttackSpeed::Fast: return "Fast";
        case AttackSpeed::VeryFast: return "Very Fast";
        case AttackSpeed::SuperFast: return "Super Fast";
        default: return "Unknown";
    }
}

const char* skillName(SkillStat stat) {
    switch (stat) {
        case SkillStat::Strength: return "str";
        case SkillStat::Dexterity: return "dex";
        case SkillStat::Intelligence: return "int";
        case SkillStat::Defense: return "def";
        case SkillStat::Agility: return "agi";
        default: return "unknown";
    }
}

const char* statKey(StatId id) {
    const auto idx = static_cast<std::size_t>(id);
    return idx < kStatKeys.size() ? kStatKeys[idx].key : "unknown";
}

WeaponType weaponTypeForClass(PlayerClass cls) {
    switch (cls) {
        case PlayerClass::Archer: return WeaponType::Bow;
        case PlayerClass::Warrior: return WeaponType::Spear;
        case PlayerClass::Assassin: return WeaponType::Dagger;
        case PlayerClass::Shaman: return WeaponType::Relik;
        case PlayerClass::Mage:
        default: return WeaponType::Wand;
    }
}

StatId elementDamagePct(Element element) {
    return static_cast<StatId>(static_cast<std::size_t>(StatId::EarthDamagePct) + static_cast<std::size_t>(element));
}

StatId elementDefensePct(Element element) {
    return static_cast<StatId>(static_cast<std::size_t>(StatId::EarthDefensePct) + static_cast<std::size_t>(element));
}

StatId elementDamageRaw(Element element) {
    return static_cast<StatId>(static_cast<std::size_t>(StatId::EarthDamageRaw) + static_cast<std::size_t>(element));
}

StatId skillBonusStat(SkillStat stat) {
    return static_cast<StatId>(static_cast<std::size_t>(StatId::Strength) + static_cast<std::size_t>(stat));
}

}  // namespace Loadout
