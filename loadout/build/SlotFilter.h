// Per-slot candidate filtering and prioritization ahead of enumeration.
#pragma once

#include <array>
#include <vector>

#include "../config/BuildRequest.h"

namespace Loadout {

struct SlotCandidates {
    std::array<std::vector<const Item*>, kSlotCount> bySlot{};

    const std::vector<const Item*>& operator[](EquipmentSlot slot) const {
        return bySlot[static_cast<std::size_t>(slot)];
    }
    std::vector<const Item*>& operator[](EquipmentSlot slot) { return bySlot[static_cast<std::size_t>(slot)]; }
};

// Class, level, tier and name filters.
bool passesRequestFilters(const Item& item, const BuildRequest& request);

// +1 per nonzero member of the playstyle's stat subset (elemental members count only when positive).
int playstyleScore(const Item& item, Playstyle style);

// +2 per positive damage%/defense% of a preferred element. With no match the item gets 1, or 0 in strict mode.
int elementScore(const Item& item, const std::vector<Element>& preferred, bool strict);

// Filters, stably sorts (playstyle, then element preference) and caps each slot list.
SlotCandidates filterCandidates(const std::vector<Item>& catalog, const BuildRequest& request);

}  // namespace Loadout
