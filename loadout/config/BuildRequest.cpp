#include "BuildRequest.h"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Loadout {

using nlohmann::json;

namespace {

// Integer JSON values outside T's range are rejected before conversion.
template <typename T>
bool toNumber(const json& v, T& out) {
    if (!v.is_number()) return false;
    if constexpr (std::is_integral_v<T>) {
        const double d = v.get<double>();
        if (d < static_cast<double>(std::numeric_limits<T>::min()) ||
            d > static_cast<double>(std::numeric_limits<T>::max())) {
            return false;
        }
        out = static_cast<T>(d);
    } else {
        out = v.get<T>();
    }
    return true;
}

template <typename T>
void readNumber(const json& j, const char* key, T& out) {
    if (!j.contains(key) || !j[key].is_number()) return;
    if (!toNumber(j[key], out)) Forge::logWarn(std::string("Build request: '") + key + "' out of range; ignored.");
}

void readBool(const json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean()) out = j[key].get<bool>();
}

}  // namespace

std::optional<BuildRequest> parseBuildRequestText(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        Forge::logError("Build request is not a JSON object.");
        return std::nullopt;
    }

    BuildRequest req{};
    if (j.contains("class")) {
        auto cls = j["class"].is_string() ? parseClassKey(j["class"].get<std::string>()) : std::nullopt;
        if (!cls.has_value()) {
            Forge::logError("Build request: unknown class.");
            return std::nullopt;
        }
        req.playerClass = *cls;
    }
    if (j.contains("playstyle")) {
        auto style = j["playstyle"].is_string() ? parsePlaystyleKey(j["playstyle"].get<std::string>()) : std::nullopt;
        if (!style.has_value()) {
            Forge::logError("Build request: unknown playstyle.");
            return std::nullopt;
        }
        req.playstyle = *style;
    }
    if (j.contains("elements") && j["elements"].is_array()) {
        for (const auto& e : j["elements"]) {
            auto el = e.is_string() ? parseElementKey(e.get<std::string>()) : std::nullopt;
            if (!el.has_value()) {
                Forge::logError("Build request: unknown element " + e.dump());
                return std::nullopt;
            }
            req.elements.push_back(*el);
        }
    }
    readBool(j, "strictElements", req.strictElements);
    readNumber(j, "maxSkillPoints", req.maxSkillPoints);
    readBool(j, "noMythics", req.noMythics);
    if (j.contains("levelRange") && j["levelRange"].is_array() && j["levelRange"].size() == 2) {
        const auto& r = j["levelRange"];
        int lo = 0;
        int hi = 0;
        if (toNumber(r[0], lo) && toNumber(r[1], hi)) {
            req.minLevel = lo;
            req.maxLevel = hi;
        }
    }
    readNumber(j, "minLevel", req.minLevel);
    readNumber(j, "maxLevel", req.maxLevel);
    readNumber(j, "playerLevel", req.playerLevel);
    readNumber(j, "minDps", req.minDps);
    readNumber(j, "minManaRegen", req.minManaRegen);
    if (j.contains("maxCost") && j["maxCost"].is_number()) req.maxCost = j["maxCost"].get<float>();
    readNumber(j, "topN", req.topN);
    readNumber(j, "maxBuilds", req.maxBuilds);
    readNumber(j, "maxChecks", req.maxChecks);
    readNumber(j, "maxItemsPerSlot", req.maxItemsPerSlot);
    if (j.contains("excludeItems") && j["excludeItems"].is_array()) {
        for (const auto& n : j["excludeItems"]) {
            if (n.is_string()) req.excludeItems.push_back(n.get<std::string>());
        }
    }
    if (j.contains("weights") && j["weights"].is_object()) {
        const auto& w = j["weights"];
        ScoreWeights sw{0.0f, 0.0f, 0.0f, 0.0f};
        const std::pair<const char*, float*> fields[] = {
            {"dps", &sw.dps}, {"ehp", &sw.ehp}, {"mana", &sw.mana}, {"bonus", &sw.bonus}};
        for (const auto& [key, out] : fields) {
            if (!w.contains(key)) continue;
            if (!w[key].is_number()) {
                Forge::logError(std::string("Build request: weight '") + key + "' is not a number.");
                return std::nullopt;
            }
            *out = w[key].get<float>();
        }
        req.weights = sw;
    }

    if (req.minLevel > req.maxLevel) {
        Forge::logWarn("Build request: minLevel above maxLevel; no item will pass the level filter.");
    }
    if (req.topN < 0) req.topN = 0;
    return req;
}

std::optional<BuildRequest> loadBuildRequest(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Forge::logError("Build request file not found: " + path);
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        Forge::logError("Could not open build request file: " + path);
        return std::nullopt;
    }
    std::stringstream buf;
    buf << f.rdbuf();
    return parseBuildRequestText(buf.str());
}

}  // namespace Loadout
