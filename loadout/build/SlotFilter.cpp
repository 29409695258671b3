#include "SlotFilter.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <utility>

namespace Loadout {

namespace {

std::string lowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int countNonZero(const Item& item, std::initializer_list<StatId> ids) {
    int n = 0;
    for (StatId id : ids) n += item.hasStat(id) ? 1 : 0;
    return n;
}

int countPositiveElemental(const Item& item, StatId (*statFor)(Element)) {
    int n = 0;
    for (std::size_t i = 0; i < kElementCount; ++i) {
        n += item.hasPositive(statFor(static_cast<Element>(i))) ? 1 : 0;
    }
    return n;
}

// Stable descending sort by a precomputed key.
void stableSortByScore(std::vector<std::pair<const Item*, int>>& scored) {
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
}

}  // namespace

bool passesRequestFilters(const Item& item, const BuildRequest& request) {
    if (!item.usableBy(request.playerClass)) return false;
    if (item.level < request.minLevel || item.level > request.maxLevel) return false;
    if (request.noMythics && item.tier == Tier::Mythic) return false;
    return true;
}

int playstyleScore(const Item& item, Playstyle style) {
    switch (style) {
        case Playstyle::Spellspam:
            return countNonZero(item, {StatId::SpellDamagePct, StatId::SpellDamageRaw, StatId::ManaRegen,
                                       StatId::ManaSteal, StatId::Intelligence}) +
                   countPositiveElemental(item, elementDamagePct);
        case Playstyle::Melee:
            return countNonZero(item, {StatId::MeleeDamagePct, StatId::MeleeDamageRaw, StatId::AttackSpeedBonus,
                                       StatId::Strength, StatId::Dexterity});
        case Playstyle::Tank:
            return (item.hp != 0.0f ? 1 : 0) +
                   countNonZero(item, {StatId::HealthBonus, StatId::Defense, StatId::HealthRegenRaw}) +
                   countPositiveElemental(item, elementDefensePct);
        case Playstyle::Hybrid:
            return countNonZero(item, {StatId::SpellDamagePct, StatId::MeleeDamagePct, StatId::ManaRegen,
                                       StatId::Strength, StatId::Dexterity, StatId::Intelligence,
                                       StatId::Defense, StatId::Agility}) +
                   (item.hp != 0.0f ? 1 : 0);
        default:
            return 0;
    }
}

int elementScore(const Item& item, const std::vector<Element>& preferred, bool strict) {
    int score = 0;
    for (Element el : preferred) {
        if (item.hasPositive(elementDamagePct(el))) score += 2;
        if (item.hasPositive(elementDefensePct(el))) score += 2;
    }
    if (score == 0 && !strict) score = 1;
    return score;
}

SlotCandidates filterCandidates(const std::vector<Item>& catalog, const BuildRequest& request) {
    std::unordered_set<std::string> excluded;
    for (const auto& name : request.excludeItems) excluded.insert(lowerCopy(name));

    std::array<std::vector<std::pair<const Item*, int>>, kSlotCount> scored{};
    for (const auto& item : catalog) {
        if (!passesRequestFilters(item, request)) continue;
        if (!excluded.empty() && excluded.count(lowerCopy(item.name)) > 0) continue;
        scored[static_cast<std::size_t>(item.slot)].emplace_back(&item, playstyleScore(item, request.playstyle));
    }

    SlotCandidates out{};
    const std::size_t cap = request.maxItemsPerSlot > 0 ? static_cast<std::size_t>(request.maxItemsPerSlot) : 0;
    for (std::size_t s = 0; s < kSlotCount; ++s) {
        auto& list = scored[s];
        stableSortByScore(list);

        if (!request.elements.empty()) {
            for (auto& entry : list) {
                entry.second = elementScore(*entry.first, request.elements, request.strictElements);
            }
            if (request.strictElements) {
                list.erase(std::remove_if(list.begin(), list.end(), [](const auto& e) { return e.second <= 0; }),
                           list.end());
            }
            stableSortByScore(list);
        }

        if (list.size() > cap) list.resize(cap);
        auto& dst = out.bySlot[s];
        dst.reserve(list.size());
        for (const auto& entry : list) dst.push_back(entry.first);
    }
    return out;
}

}  // namespace Loadout
