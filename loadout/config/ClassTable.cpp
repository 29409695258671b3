#include "ClassTable.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Loadout {

using nlohmann::json;

namespace {

constexpr double kMaxSpellBaseCost = 1000.0;

ClassProfile makeProfile(PlayerClass cls,
                         float spellMult,
                         float damageMult,
                         float defenseMult,
                         float manaPerLevel,
                         std::vector<SpellConversion> conversions,
                         std::vector<SpellCostEntry> costs) {
    ClassProfile p{};
    p.cls = cls;
    p.weaponType = weaponTypeForClass(cls);
    p.baseSpellMultiplier = spellMult;
    p.baseDamageMultiplier = damageMult;
    p.defenseMultiplier = defenseMult;
    p.healthPerLevel = 5.0f;
    p.manaPerLevel = manaPerLevel;
    p.conversions = std::move(conversions);
    p.spellCosts = std::move(costs);
    return p;
}

bool readSpellCost(const json& v, int& out) {
    if (!v.is_number()) return false;
    const double d = v.get<double>();
    if (d < 0.0 || d > kMaxSpellBaseCost) return false;
    out = static_cast<int>(d);
    return true;
}

void applyProfileJson(const json& j, ClassProfile& p) {
    auto num = [&](const char* key, float& out) {
        if (j.contains(key) && j[key].is_number()) out = j[key].get<float>();
    };
    num("baseSpellMultiplier", p.baseSpellMultiplier);
    num("baseDamageMultiplier", p.baseDamageMultiplier);
    num("defenseMultiplier", p.defenseMultiplier);
    num("healthPerLevel", p.healthPerLevel);
    num("manaPerLevel", p.manaPerLevel);

    if (j.contains("spellConversions") && j["spellConversions"].is_object()) {
        p.conversions.clear();
        for (const auto& spell : j["spellConversions"].items()) {
            if (!spell.value().is_object()) continue;
            for (const auto& kv : spell.value().items()) {
                auto el = parseElementKey(kv.key());
                if (!el.has_value() || !kv.value().is_number()) {
                    Forge::logWarn("Ignoring conversion '" + kv.key() + "' for spell " + spell.key());
                    continue;
                }
                p.conversions.push_back({spell.key(), *el, kv.value().get<float>()});
            }
        }
    }

    if (j.contains("spellCosts")) {
        const auto& sc = j["spellCosts"];
        std::vector<SpellCostEntry> costs;
        if (sc.is_array()) {
            for (const auto& e : sc) {
                if (!e.is_object()) continue;
                SpellCostEntry c{};
                if (e.contains("name") && e["name"].is_string()) c.name = e["name"].get<std::string>();
                if (c.name.empty()) continue;
                if (e.contains("cost") && !readSpellCost(e["cost"], c.baseCost)) {
                    Forge::logWarn("Ignoring spell cost for " + c.name + ": " + e["cost"].dump());
                    continue;
                }
                costs.push_back(c);
            }
        } else if (sc.is_object()) {
            for (const auto& kv : sc.items()) {
                SpellCostEntry c{kv.key(), 1};
                if (readSpellCost(kv.value(), c.baseCost)) {
                    costs.push_back(c);
                } else {
                    Forge::logWarn("Ignoring spell cost for " + kv.key() + ": " + kv.value().dump());
                }
            }
        }
        if (!costs.empty()) p.spellCosts = std::move(costs);
    }
}

}  // namespace

float ClassProfile::conversionFactor() const {
    if (conversions.empty()) return 1.0f;
    float sum = 0.0f;
    for (const auto& c : conversions) sum += c.pct;
    return sum / static_cast<float>(conversions.size()) / 100.0f;
}

ClassTable::ClassTable() {
    profiles_[static_cast<std::size_t>(PlayerClass::Mage)] = makeProfile(
        PlayerClass::Mage, 1.0f, 1.0f, 0.8f, 20.0f,
        {{"meteor", Element::Earth, 30.0f},
         {"meteor", Element::Fire, 30.0f},
         {"ice_snake", Element::Water, 70.0f},
         {"teleport", Element::Air, 50.0f},
         {"heal", Element::Water, 40.0f}},
        {{"Heal", 6}, {"Teleport", 8}, {"Meteor", 4}, {"Ice Snake", 4}});
    profiles_[static_cast<std::size_t>(PlayerClass::Archer)] = makeProfile(
        PlayerClass::Archer, 1.0f, 1.1f, 0.6f, 15.0f,
        {{"arrow_storm", Element::Air, 40.0f},
         {"escape", Element::Air, 80.0f},
         {"bomb", Element::Fire, 100.0f},
         {"arrow_shield", Element::Earth, 30.0f}},
        {{"Arrow Storm", 6}, {"Escape", 8}, {"Bomb Arrow", 4}, {"Arrow Shield", 6}});
    profiles_[static_cast<std::size_t>(PlayerClass::Warrior)] = makeProfile(
        PlayerClass::Warrior, 0.9f, 1.2f, 1.2f, 10.0f,
        {{"bash", Element::Earth, 50.0f},
         {"charge", Element::Earth, 30.0f},
         {"uppercut", Element::Thunder, 50.0f},
         {"war_scream", Element::Thunder, 30.0f}},
        {{"Bash", 4}, {"Charge", 6}, {"Uppercut", 4}, {"War Scream", 8}});
    profiles_[static_cast<std::size_t>(PlayerClass::Assassin)] = makeProfile(
        PlayerClass::Assassin, 1.1f, 1.3f, 1.0f, 10.0f,
        {{"spin_attack", Element::Air, 40.0f},
         {"vanish", Element::Air, 20.0f},
         {"multihit", Element::Thunder, 30.0f},
         {"smoke_bomb", Element::Fire, 20.0f}},
        {{"Spin Attack", 4}, {"Vanish", 6}, {"Multihit", 4}, {"Smoke Bomb", 8}});
    profiles_[static_cast<std::size_t>(PlayerClass::Shaman)] = makeProfile(
        PlayerClass::Shaman, 1.0f, 1.0f, 0.5f, 15.0f,
        {{"totem", Element::Earth, 40.0f},
         {"haul", Element::Air, 60.0f},
         {"aura", Element::Water, 30.0f},
         {"uproot", Element::Earth, 60.0f}},
        {{"Totem", 6}, {"Haul", 4}, {"Aura", 6}, {"Uproot", 8}});
}

ClassTable defaultClassTable() { return ClassTable{}; }

bool applyClassTableText(const std::string& text, ClassTable& table) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;
    for (const auto& kv : j.items()) {
        auto cls = parseClassKey(kv.key());
        if (!cls.has_value()) {
            Forge::logWarn("Unknown class '" + kv.key() + "' in class table; skipped.");
            continue;
        }
        if (!kv.value().is_object()) continue;
        applyProfileJson(kv.value(), table.profile(*cls));
    }
    return true;
}

ClassTable loadClassTable(const std::string& path) {
    ClassTable table = defaultClassTable();
    if (!std::filesystem::exists(path)) {
        Forge::logInfo("Class table not found at " + path + "; using built-in defaults.");
        return table;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        Forge::logWarn("Could not open class table " + path + "; using built-in defaults.");
        return table;
    }
    std::stringstream buf;
    buf << f.rdbuf();
    ClassTable loaded = table;
    if (!applyClassTableText(buf.str(), loaded)) {
        Forge::logWarn("Class table " + path + " is not a JSON object; using built-in defaults.");
        return table;
    }
    Forge::logInfo("Loaded class table from " + path);
    return loaded;
}

}  // namespace Loadout
