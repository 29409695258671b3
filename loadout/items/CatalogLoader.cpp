// JSON catalog ingestion for the build engine.
#include "CatalogLoader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Loadout {

using nlohmann::json;

namespace {

constexpr int kMinItemLevel = 1;
constexpr int kMaxItemLevel = 106;
constexpr double kRequirementLimit = 1000.0;
constexpr std::size_t kLoggedIssueLimit = 5;

struct ItemParseResult {
    std::optional<Item> item;
    IngestError error{IngestError::InvalidField};
    std::string detail;
};

ItemParseResult fail(IngestError error, std::string detail) {
    ItemParseResult r{};
    r.error = error;
    r.detail = std::move(detail);
    return r;
}

bool requirementInRange(const json& v) {
    const double d = v.get<double>();
    return d >= -kRequirementLimit && d <= kRequirementLimit;
}

float numberOr(const json& j, const char* key, float fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return it->get<float>();
}

std::string stringOr(const json& j, const char* key, const std::string& fallback = {}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::string lowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Parses "min-max" strings used by the short damage keys.
std::optional<DamageRange> parseRangeString(const std::string& s) {
    const auto dash = s.find('-', 1);
    if (dash == std::string::npos) return std::nullopt;
    const std::string lo = s.substr(0, dash);
    const std::string hi = s.substr(dash + 1);
    char* end = nullptr;
    const float mn = std::strtof(lo.c_str(), &end);
    if (end == lo.c_str()) return std::nullopt;
    const float mx = std::strtof(hi.c_str(), &end);
    if (end == hi.c_str()) return std::nullopt;
    return DamageRange{mn, mx};
}

std::optional<DamageRange> parseRange(const json& v) {
    if (v.is_array() && v.size() >= 2 && v[0].is_number() && v[1].is_number()) {
        return DamageRange{v[0].get<float>(), v[1].get<float>()};
    }
    if (v.is_string()) return parseRangeString(v.get<std::string>());
    return std::nullopt;
}

WeaponStats parseWeaponStats(const json& it) {
    WeaponStats w{};
    auto assign = [&](const std::string& channel, const DamageRange& r) {
        if (channel == "neutral") {
            w.neutral = r;
            w.hasDamage = true;
            return;
        }
        if (auto el = parseElementKey(channel)) {
            w.elemental[static_cast<std::size_t>(*el)] = r;
            w.hasDamage = true;
        }
    };

    for (const char* key : {"damage", "damages"}) {
        auto d = it.find(key);
        if (d == it.end() || !d->is_object()) continue;
        for (const auto& kv : d->items()) {
            if (auto r = parseRange(kv.value())) assign(lowerCopy(kv.key()), *r);
        }
    }
    static const std::array<std::pair<const char*, const char*>, 6> kShortDamageKeys = {{
        {"nDam", "neutral"}, {"eDam", "earth"}, {"tDam", "thunder"},
        {"wDam", "water"}, {"fDam", "fire"}, {"aDam", "air"},
    }};
    for (const auto& [shortKey, channel] : kShortDamageKeys) {
        auto d = it.find(shortKey);
        if (d == it.end()) continue;
        if (auto r = parseRange(*d)) assign(channel, *r);
    }

    std::string speed = stringOr(it, "attack_speed");
    if (speed.empty()) speed = stringOr(it, "atkSpd");
    if (!speed.empty()) {
        auto parsed = parseAttackSpeedKey(speed);
        if (parsed.has_value()) {
            w.attackSpeed = *parsed;
        } else {
            Forge::logDebug("Unknown attack speed '" + speed + "'; defaulting to Normal.");
        }
    }
    return w;
}

std::optional<EquipmentSlot> deriveSlot(const json& it, const std::optional<WeaponType>& weaponType) {
    if (lowerCopy(stringOr(it, "category")) == "weapon" || weaponType.has_value()) return EquipmentSlot::Weapon;
    return parseSlotKey(stringOr(it, "type"));
}

void readIdentifications(const json& obj, Item& item, bool topLevel) {
    for (const auto& kv : obj.items()) {
        if (!kv.value().is_number()) continue;
        auto id = parseStatKey(kv.key());
        if (topLevel) {
            // Base hp/mana are item fields; unknown top-level keys are record metadata.
            if (!id.has_value() || *id == StatId::Health || *id == StatId::Mana) continue;
            item.identifications.add(*id, kv.value().get<float>());
            continue;
        }
        if (id.has_value()) {
            item.identifications.add(*id, kv.value().get<float>());
        } else {
            item.extraIdentifications[kv.key()] += kv.value().get<float>();
        }
    }
}

ItemParseResult parseItem(const json& it) {
    if (!it.is_object()) return fail(IngestError::NotAnObject, "record is not an object");

    Item item{};
    item.name = stringOr(it, "name");
    if (item.name.empty()) return fail(IngestError::MissingName, "missing or empty 'name'");

    const std::string typeKey = stringOr(it, "type");
    item.weaponType = parseWeaponTypeKey(typeKey);

    const std::string slotKey = stringOr(it, "slot");
    if (!slotKey.empty()) {
        auto slot = parseSlotKey(slotKey);
        if (!slot.has_value()) return fail(IngestError::UnknownSlot, "unknown slot '" + slotKey + "'");
        item.slot = *slot;
    } else {
        auto slot = deriveSlot(it, item.weaponType);
        if (!slot.has_value()) {
            return typeKey.empty() ? fail(IngestError::MissingSlot, "no 'slot' or 'type'")
                                   : fail(IngestError::UnknownSlot, "unknown type '" + typeKey + "'");
        }
        item.slot = *slot;
    }
    if (item.slot == EquipmentSlot::Weapon && !item.weaponType.has_value()) {
        return fail(IngestError::InvalidField, "weapon without a weapon type");
    }
    if (item.slot != EquipmentSlot::Weapon) item.weaponType.reset();

    std::string tierKey = stringOr(it, "tier");
    if (tierKey.empty()) tierKey = stringOr(it, "rarity");
    if (!tierKey.empty()) {
        auto tier = parseTierKey(tierKey);
        if (tier.has_value()) {
            item.tier = *tier;
        } else {
            Forge::logDebug("Unknown tier '" + tierKey + "' for " + item.name + "; defaulting to Normal.");
        }
    }

    const char* levelKey = it.contains("lvl") ? "lvl" : "level";
    if (it.contains(levelKey)) {
        const auto& lv = it[levelKey];
        if (!lv.is_number()) return fail(IngestError::InvalidLevel, "level is not numeric");
        const double level = lv.get<double>();
        if (level < kMinItemLevel || level > kMaxItemLevel) {
            return fail(IngestError::InvalidLevel, "level " + lv.dump() + " outside 1..106");
        }
        item.level = static_cast<int>(level);
    }

    const std::string classReq = stringOr(it, "classReq");
    if (!classReq.empty()) {
        item.classRequirement = parseClassKey(classReq);
        if (!item.classRequirement.has_value()) {
            return fail(IngestError::InvalidField, "unknown class requirement '" + classReq + "'");
        }
    }

    static const std::array<std::pair<const char*, SkillStat>, kSkillCount> kReqKeys = {{
        {"strReq", SkillStat::Strength},
        {"dexReq", SkillStat::Dexterity},
        {"intReq", SkillStat::Intelligence},
        {"defReq", SkillStat::Defense},
        {"agiReq", SkillStat::Agility},
    }};
    for (const auto& [key, stat] : kReqKeys) {
        auto req = it.find(key);
        if (req == it.end() || !req->is_number()) continue;
        if (!requirementInRange(*req)) return fail(IngestError::InvalidField, std::string(key) + " out of range");
        item.requirements.set(stat, req->get<int>());
    }
    if (it.contains("requirements") && it["requirements"].is_object()) {
        for (const auto& kv : it["requirements"].items()) {
            auto stat = parseSkillKey(kv.key());
            if (!stat.has_value() || !kv.value().is_number()) continue;
            if (!requirementInRange(kv.value())) {
                return fail(IngestError::InvalidField, "requirement " + kv.key() + " out of range");
            }
            item.requirements.set(*stat, kv.value().get<int>());
        }
    }

    item.hp = numberOr(it, "hp", 0.0f);
    item.mana = numberOr(it, "mana", 0.0f);

    readIdentifications(it, item, true);
    if (it.contains("identifications") && it["identifications"].is_object()) {
        readIdentifications(it["identifications"], item, false);
    }

    if (item.slot == EquipmentSlot::Weapon) item.weapon = parseWeaponStats(it);

    std::string quest = stringOr(it, "quest_req");
    if (quest.empty()) quest = stringOr(it, "quest");
    if (!quest.empty()) {
        item.questRequired = true;
        item.questName = quest;
    }
    if (it.contains("untradeable") && it["untradeable"].is_boolean()) {
        item.untradeable = it["untradeable"].get<bool>();
    }
    if (stringOr(it, "drop") == "never") item.untradeable = true;

    ItemParseResult ok{};
    ok.item = std::move(item);
    return ok;
}

}  // namespace

const char* ingestErrorName(IngestError error) {
    switch (error) {
        case IngestError::NotAnObject: return "not-an-object";
        case IngestError::MissingName: return "missing-name";
        case IngestError::MissingSlot: return "missing-slot";
        case IngestError::UnknownSlot: return "unknown-slot";
        case IngestError::InvalidLevel: return "invalid-level";
        case IngestError::InvalidField: return "invalid-field";
        case IngestError::Duplicate: return "duplicate";
        default: return "unknown";
    }
}

std::optional<std::vector<Item>> ingestCatalogText(const std::string& text, IngestReport& report) {
    report = IngestReport{};
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) return std::nullopt;

    const json* records = nullptr;
    if (root.is_array()) {
        records = &root;
    } else if (root.is_object() && root.contains("items") && root["items"].is_array()) {
        records = &root["items"];
    } else {
        return std::nullopt;
    }

    std::vector<Item> items;
    items.reserve(records->size());
    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& rec : *records) {
        report.recordsSeen += 1;
        auto parsed = parseItem(rec);
        if (!parsed.item.has_value()) {
            IngestIssue issue{};
            issue.index = index;
            issue.name = rec.is_object() ? stringOr(rec, "name") : std::string{};
            issue.error = parsed.error;
            issue.detail = std::move(parsed.detail);
            report.issues.push_back(std::move(issue));
        } else if (!seen.insert(lowerCopy(parsed.item->name)).second) {
            report.issues.push_back({index, parsed.item->name, IngestError::Duplicate, "duplicate item name"});
        } else {
            items.push_back(std::move(*parsed.item));
        }
        index += 1;
    }
    report.accepted = items.size();
    return items;
}

std::optional<std::vector<Item>> loadCatalog(const std::string& path, IngestReport& report) {
    report = IngestReport{};
    if (!std::filesystem::exists(path)) {
        Forge::logError("Catalog file not found: " + path);
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        Forge::logError("Could not open catalog file: " + path);
        return std::nullopt;
    }
    std::stringstream buf;
    buf << f.rdbuf();

    auto items = ingestCatalogText(buf.str(), report);
    if (!items.has_value()) {
        Forge::logError("Catalog file is not a JSON item list: " + path);
        return std::nullopt;
    }

    Forge::logInfo("Loaded " + std::to_string(report.accepted) + " items from " + path + " (" +
                   std::to_string(report.skipped()) + " skipped)");
    for (std::size_t i = 0; i < report.issues.size(); ++i) {
        const auto& issue = report.issues[i];
        std::string line = "Skipped record #" + std::to_string(issue.index) +
                           (issue.name.empty() ? std::string{} : " '" + issue.name + "'") + ": " +
                           ingestErrorName(issue.error) + " (" + issue.detail + ")";
        if (i < kLoggedIssueLimit) {
            Forge::logWarn(line);
        } else {
            Forge::logDebug(line);
        }
    }
    return items;
}

CatalogSummary summarizeCatalog(const std::vector<Item>& items) {
    CatalogSummary s{};
    s.total = items.size();
    bool first = true;
    for (const auto& item : items) {
        s.bySlot[static_cast<std::size_t>(item.slot)] += 1;
        s.byTier[static_cast<std::size_t>(item.tier)] += 1;
        if (first) {
            s.minLevel = item.level;
            s.maxLevel = item.level;
            first = false;
        } else {
            s.minLevel = std::min(s.minLevel, item.level);
            s.maxLevel = std::max(s.maxLevel, item.level);
        }
    }
    return s;
}

}  // namespace Loadout
