// Lazy bounded cross-product over the per-slot candidate lists.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "SlotFilter.h"

namespace Loadout {

// Enumerates weapon x helmet x chestplate x leggings x boots x ring pair x bracelet x necklace,
// rightmost dimension fastest. Ring pairs are index-ordered 2-combinations, or one empty pair when
// fewer than two rings are available; empty bracelet/necklace lists yield one empty position.
class CombinationGenerator {
public:
    CombinationGenerator(const SlotCandidates& candidates, PlayerClass playerClass, std::size_t maxChecks);

    // Writes the next combination into `out`. False once exhausted, capped, or a mandatory slot is empty.
    bool next(Build& out);

    std::size_t checked() const { return checked_; }
    // True when the check cap stopped generation with combinations left over.
    bool capped() const { return capped_; }
    bool exhausted() const { return exhausted_; }
    // First mandatory slot (helmet..weapon) with no candidates.
    std::optional<EquipmentSlot> missingSlot() const { return missingSlot_; }
    // Size of the full cross-product, saturating at UINT64_MAX.
    std::uint64_t totalCombinations() const { return total_; }

private:
    enum Dim : std::size_t { DWeapon = 0, DHelmet, DChest, DLegs, DBoots, DRings, DBracelet, DNecklace, DimCount };

    std::size_t dimSize(std::size_t d) const;
    void advance();

    PlayerClass playerClass_{PlayerClass::Mage};
    std::size_t maxChecks_{0};
    std::array<std::vector<const Item*>, DimCount> lists_{};
    std::vector<std::pair<const Item*, const Item*>> ringPairs_;
    std::array<std::size_t, DimCount> index_{};
    std::size_t checked_{0};
    std::uint64_t total_{0};
    bool capped_{false};
    bool exhausted_{false};
    std::optional<EquipmentSlot> missingSlot_;
};

}  // namespace Loadout
