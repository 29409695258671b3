// Derived-stat calculators: damage, mana sustain, effective HP, spell costs and build cost.
// All functions are pure over the aggregated stats and the class table.
#pragma once

#include <vector>

#include "../config/ClassTable.h"
#include "Build.h"

namespace Loadout {

// Sum of per-channel averages, or the level estimate when the weapon has no damage data. 0 for no weapon.
float weaponAverageDamage(const Item* weapon);

DamageBreakdown computeDamage(const Build& build,
                              const AggregatedStats& agg,
                              const ClassProfile& profile,
                              const Forge::Gameplay::FormulaConstants& cfg = {});

float computeManaSustain(const AggregatedStats& agg, const Forge::Gameplay::FormulaConstants& cfg = {});

Forge::Gameplay::EffectiveHp computeBuildEhp(const AggregatedStats& agg,
                                             const ClassProfile& profile,
                                             int playerLevel,
                                             const Forge::Gameplay::FormulaConstants& cfg = {});

std::vector<SpellCostResult> computeSpellCosts(const AggregatedStats& agg,
                                               const ClassProfile& profile,
                                               const Forge::Gameplay::FormulaConstants& cfg = {});

// Sum of itemCostEstimate over the build's items.
float computeBuildCost(const Build& build);

DerivedStats deriveStats(const Build& build, const AggregatedStats& agg, const ClassTable& classes, int playerLevel);

}  // namespace Loadout
