// Average-case stat formulas used by the build calculators.
// Everything here is a pure function of its arguments plus a constants bundle.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace Forge::Gameplay {

// Discrete weapon attack speed tiers, slowest first.
enum class AttackSpeed : std::uint8_t {
    SuperSlow = 0,
    VerySlow,
    Slow,
    Normal,
    Fast,
    VeryFast,
    SuperFast,
    Count
};

constexpr std::size_t kAttackSpeedCount = static_cast<std::size_t>(AttackSpeed::Count);

// Tunable constants; defaults match the in-game averages.
struct FormulaConstants {
    std::array<float, kAttackSpeedCount> attackSpeedMultipliers{{0.51f, 0.83f, 1.5f, 2.05f, 2.5f, 3.1f, 4.3f}};
    float attackTierStep{0.15f};          // +15% per attack speed tier bonus
    float defenseReductionPerPoint{0.003f};
    float defenseReductionCap{0.8f};
    float dodgePerAgility{0.002f};
    float dodgeCap{0.75f};
    float denominatorFloor{0.01f};
    float manaStealHitsPerSecond{2.0f};   // estimate, not game telemetry
    float manaStealProcFactor{0.01f};
    int intelligencePerCostStep{2};
    float poisonTickSeconds{3.0f};
    float meleeEstimateFactor{0.5f};
};

// Effective HP snapshot; reduction/dodge are fractions (0..1).
struct EffectiveHp {
    float totalHp{0.0f};
    float defenseReduction{0.0f};
    float dodgeChance{0.0f};
    float defenseEhp{0.0f};
    float agilityEhp{0.0f};
    float combinedEhp{0.0f};
};

float attackSpeedMultiplier(AttackSpeed speed, float attackTierBonus, const FormulaConstants& cfg = {});

EffectiveHp computeEffectiveHp(float totalHp,
                               float defensePoints,
                               float agilityPoints,
                               float classDefenseMultiplier,
                               const FormulaConstants& cfg = {});

// Mana regen plus mana steal converted to an approximate per-second gain.
float manaSustain(float manaRegen, float manaSteal, const FormulaConstants& cfg = {});

// One point of cost per `intelligencePerCostStep` intelligence, never below a cost of 1.
int intelligenceCostReduction(int intelligence, int baseCost, const FormulaConstants& cfg = {});

// max(1, floor((base - intReduction + raw) * (1 - pct/100)))
int spellCost(int baseCost, int intelligence, int rawCostModifier, float costPct, const FormulaConstants& cfg = {});

float poisonDps(float poison, const FormulaConstants& cfg = {});

}  // namespace Forge::Gameplay
