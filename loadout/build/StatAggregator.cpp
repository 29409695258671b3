#include "StatAggregator.h"

namespace Loadout {

AggregatedStats aggregate(const Build& build) {
    AggregatedStats agg{};
    for (const Item* item : build.items()) {
        agg.stats += item->identifications;
        agg.stats.add(StatId::Health, item->hp);
        agg.stats.add(StatId::Mana, item->mana);
        agg.requirements += item->requirements;
        agg.itemCount += 1;
    }
    return agg;
}

}  // namespace Loadout
