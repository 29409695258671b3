#include "CombinationGenerator.h"

#include <limits>

namespace Loadout {

namespace {

std::uint64_t saturatingMul(std::uint64_t a, std::uint64_t b) {
    if (a == 0 || b == 0) return 0;
    if (a > std::numeric_limits<std::uint64_t>::max() / b) return std::numeric_limits<std::uint64_t>::max();
    return a * b;
}

}  // namespace

CombinationGenerator::CombinationGenerator(const SlotCandidates& candidates,
                                           PlayerClass playerClass,
                                           std::size_t maxChecks)
    : playerClass_(playerClass), maxChecks_(maxChecks) {
    static const std::array<EquipmentSlot, 5> kMandatory = {EquipmentSlot::Helmet, EquipmentSlot::Chestplate,
                                                            EquipmentSlot::Leggings, EquipmentSlot::Boots,
                                                            EquipmentSlot::Weapon};
    for (EquipmentSlot slot : kMandatory) {
        if (candidates[slot].empty()) {
            missingSlot_ = slot;
            exhausted_ = true;
            return;
        }
    }

    lists_[DWeapon] = candidates[EquipmentSlot::Weapon];
    lists_[DHelmet] = candidates[EquipmentSlot::Helmet];
    lists_[DChest] = candidates[EquipmentSlot::Chestplate];
    lists_[DLegs] = candidates[EquipmentSlot::Leggings];
    lists_[DBoots] = candidates[EquipmentSlot::Boots];
    lists_[DBracelet] = candidates[EquipmentSlot::Bracelet];
    lists_[DNecklace] = candidates[EquipmentSlot::Necklace];
    if (lists_[DBracelet].empty()) lists_[DBracelet].push_back(nullptr);
    if (lists_[DNecklace].empty()) lists_[DNecklace].push_back(nullptr);

    const auto& rings = candidates[EquipmentSlot::Ring];
    if (rings.size() < 2) {
        ringPairs_.emplace_back(nullptr, nullptr);
    } else {
        for (std::size_t i = 0; i < rings.size(); ++i) {
            for (std::size_t j = i + 1; j < rings.size(); ++j) ringPairs_.emplace_back(rings[i], rings[j]);
        }
    }

    total_ = 1;
    for (std::size_t d = 0; d < DimCount; ++d) total_ = saturatingMul(total_, dimSize(d));
}

std::size_t CombinationGenerator::dimSize(std::size_t d) const {
    return d == DRings ? ringPairs_.size() : lists_[d].size();
}

bool CombinationGenerator::next(Build& out) {
    if (exhausted_ || capped_) return false;
    if (checked_ >= maxChecks_) {
        capped_ = true;
        return false;
    }

    out = Build{};
    out.playerClass = playerClass_;
    out.setItem(EquipmentSlot::Weapon, lists_[DWeapon][index_[DWeapon]]);
    out.setItem(EquipmentSlot::Helmet, lists_[DHelmet][index_[DHelmet]]);
    out.setItem(EquipmentSlot::Chestplate, lists_[DChest][index_[DChest]]);
    out.setItem(EquipmentSlot::Leggings, lists_[DLegs][index_[DLegs]]);
    out.setItem(EquipmentSlot::Boots, lists_[DBoots][index_[DBoots]]);
    out.setItem(EquipmentSlot::Bracelet, lists_[DBracelet][index_[DBracelet]]);
    out.setItem(EquipmentSlot::Necklace, lists_[DNecklace][index_[DNecklace]]);
    const auto& pair = ringPairs_[index_[DRings]];
    out.rings = {pair.first, pair.second};

    checked_ += 1;
    advance();
    return true;
}

void CombinationGenerator::advance() {
    for (std::size_t d = DimCount; d-- > 0;) {
        index_[d] += 1;
        if (index_[d] < dimSize(d)) return;
        index_[d] = 0;
    }
    exhausted_ = true;
}

}  // namespace Loadout
