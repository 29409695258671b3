#include "Build.h"

namespace Loadout {

std::vector<const Item*> Build::items() const {
    std::vector<const Item*> out;
    out.reserve(kSlotCount + 1);
    for (std::size_t i = 0; i < kSlotCount; ++i) {
        if (static_cast<EquipmentSlot>(i) == EquipmentSlot::Ring) continue;
        if (equipped[i]) out.push_back(equipped[i]);
    }
    for (const Item* r : rings) {
        if (r) out.push_back(r);
    }
    return out;
}

int Build::ringCount() const {
    int n = 0;
    for (const Item* r : rings) n += r ? 1 : 0;
    return n;
}

std::string describeBuild(const Build& build) {
    std::string out;
    auto append = [&](const char* label, const Item* it) {
        if (!it) return;
        if (!out.empty()) out += ", ";
        out += label;
        out += "=";
        out += it->name;
    };
    for (std::size_t i = 0; i < kSlotCount; ++i) {
        const auto slot = static_cast<EquipmentSlot>(i);
        if (slot == EquipmentSlot::Ring) continue;
        append(slotName(slot), build.equipped[i]);
    }
    for (const Item* r : build.rings) append(slotName(EquipmentSlot::Ring), r);
    return out;
}

}  // namespace Loadout
