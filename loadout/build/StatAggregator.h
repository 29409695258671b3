// Sums item contributions for a build.
#pragma once

#include "Build.h"

namespace Loadout {

// Base hp/mana fold into StatId::Health / StatId::Mana; requirements are summed per attribute.
AggregatedStats aggregate(const Build& build);

}  // namespace Loadout
