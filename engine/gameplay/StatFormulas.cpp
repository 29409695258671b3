// Implementation of the average-case stat formulas.
#include "StatFormulas.h"

#include <algorithm>
#include <cmath>

namespace Forge::Gameplay {

namespace {

float safeDenominator(float v, const FormulaConstants& cfg) {
    return std::max(cfg.denominatorFloor, v);
}

}  // namespace

float attackSpeedMultiplier(AttackSpeed speed, float attackTierBonus, const FormulaConstants& cfg) {
    const auto idx = static_cast<std::size_t>(speed);
    float base = idx < cfg.attackSpeedMultipliers.size()
                     ? cfg.attackSpeedMultipliers[idx]
                     : cfg.attackSpeedMultipliers[static_cast<std::size_t>(AttackSpeed::Normal)];
    if (attackTierBonus != 0.0f) {
        base *= 1.0f + attackTierBonus * cfg.attackTierStep;
    }
    return base;
}

EffectiveHp computeEffectiveHp(float totalHp,
                               float defensePoints,
                               float agilityPoints,
                               float classDefenseMultiplier,
                               const FormulaConstants& cfg) {
    EffectiveHp out{};
    out.totalHp = totalHp;
    out.defenseReduction = std::clamp(defensePoints * cfg.defenseReductionPerPoint, 0.0f, cfg.defenseReductionCap);
    out.dodgeChance = std::clamp(agilityPoints * cfg.dodgePerAgility, 0.0f, cfg.dodgeCap);

    const float keptAfterDefense = 1.0f - out.defenseReduction;
    const float keptAfterDodge = 1.0f - out.dodgeChance;
    out.defenseEhp = totalHp / safeDenominator(keptAfterDefense * classDefenseMultiplier, cfg);
    out.agilityEhp = totalHp / safeDenominator(keptAfterDodge, cfg);
    out.combinedEhp = totalHp / safeDenominator(keptAfterDefense * keptAfterDodge * classDefenseMultiplier, cfg);
    return out;
}

float manaSustain(float manaRegen, float manaSteal, const FormulaConstants& cfg) {
    const float fromSteal = manaSteal * cfg.manaStealHitsPerSecond * cfg.manaStealProcFactor;
    return std::max(0.0f, manaRegen + fromSteal);
}

int intelligenceCostReduction(int intelligence, int baseCost, const FormulaConstants& cfg) {
    if (intelligence <= 0 || baseCost <= 1) return 0;
    const int step = std::max(1, cfg.intelligencePerCostStep);
    return std::min(intelligence / step, baseCost - 1);
}

int spellCost(int baseCost, int intelligence, int rawCostModifier, float costPct, const FormulaConstants& cfg) {
    const int afterInt = baseCost - intelligenceCostReduction(intelligence, baseCost, cfg);
    const float scaled = static_cast<float>(afterInt + rawCostModifier) * (1.0f - costPct / 100.0f);
    return std::max(1, static_cast<int>(std::floor(scaled)));
}

float poisonDps(float poison, const FormulaConstants& cfg) {
    if (poison <= 0.0f || cfg.poisonTickSeconds <= 0.0f) return 0.0f;
    return poison / cfg.poisonTickSeconds;
}

}  // namespace Forge::Gameplay
