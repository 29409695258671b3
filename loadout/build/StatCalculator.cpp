#include "StatCalculator.h"

#include <algorithm>

namespace Loadout {

using Forge::Gameplay::FormulaConstants;

float weaponAverageDamage(const Item* weapon) {
    if (!weapon) return 0.0f;
    if (weapon->weapon.has_value() && weapon->weapon->hasDamage) return weapon->weapon->averageDamage();
    if (!weapon->weaponType.has_value()) return 0.0f;
    return estimatedWeaponDamage(*weapon->weaponType, weapon->level);
}

DamageBreakdown computeDamage(const Build& build,
                              const AggregatedStats& agg,
                              const ClassProfile& profile,
                              const FormulaConstants& cfg) {
    DamageBreakdown out{};
    out.poisonDps = Forge::Gameplay::poisonDps(agg.stats.get(StatId::Poison), cfg);

    const Item* weapon = build.weapon();
    if (!weapon) return out;

    const float avg = weaponAverageDamage(weapon);
    const AttackSpeed speed = weapon->weapon.has_value() ? weapon->weapon->attackSpeed : AttackSpeed::Normal;
    const float speedMult =
        Forge::Gameplay::attackSpeedMultiplier(speed, agg.stats.get(StatId::AttackSpeedBonus), cfg);

    float elementalPct = 0.0f;
    float elementalRaw = 0.0f;
    for (std::size_t i = 0; i < kElementCount; ++i) {
        const auto el = static_cast<Element>(i);
        elementalPct += agg.stats.get(elementDamagePct(el));
        elementalRaw += agg.stats.get(elementDamageRaw(el));
    }

    const float base = avg * profile.baseSpellMultiplier * profile.conversionFactor();
    const float bonus = 1.0f + agg.stats.get(StatId::SpellDamagePct) / 100.0f + elementalPct / 100.0f;
    const float perCast = base * bonus + agg.stats.get(StatId::SpellDamageRaw) + elementalRaw;
    out.spellDps = std::max(0.0f, perCast * speedMult);

    const float meleePct = agg.stats.get(StatId::MeleeDamagePct);
    if (meleePct > 0.0f) {
        out.meleeDps = avg * (1.0f + meleePct / 100.0f) * speedMult * cfg.meleeEstimateFactor;
    }
    return out;
}

float computeManaSustain(const AggregatedStats& agg, const FormulaConstants& cfg) {
    return Forge::Gameplay::manaSustain(agg.stats.get(StatId::ManaRegen), agg.stats.get(StatId::ManaSteal), cfg);
}

Forge::Gameplay::EffectiveHp computeBuildEhp(const AggregatedStats& agg,
                                             const ClassProfile& profile,
                                             int playerLevel,
                                             const FormulaConstants& cfg) {
    const float totalHp = profile.healthPerLevel * static_cast<float>(playerLevel) +
                          agg.stats.get(StatId::Health) + agg.stats.get(StatId::HealthBonus);
    const float defense = agg.stats.get(skillBonusStat(SkillStat::Defense));
    const float agility = agg.stats.get(skillBonusStat(SkillStat::Agility));
    return Forge::Gameplay::computeEffectiveHp(totalHp, defense, agility, profile.defenseMultiplier, cfg);
}

std::vector<SpellCostResult> computeSpellCosts(const AggregatedStats& agg,
                                               const ClassProfile& profile,
                                               const FormulaConstants& cfg) {
    const int intelligence = static_cast<int>(agg.stats.get(skillBonusStat(SkillStat::Intelligence)));
    const int raw = static_cast<int>(agg.stats.get(StatId::SpellCostRaw));
    const float pct = agg.stats.get(StatId::SpellCostPct);

    std::vector<SpellCostResult> out;
    out.reserve(profile.spellCosts.size());
    for (const auto& spell : profile.spellCosts) {
        SpellCostResult r{};
        r.name = spell.name;
        r.baseCost = spell.baseCost;
        r.cost = Forge::Gameplay::spellCost(spell.baseCost, intelligence, raw, pct, cfg);
        out.push_back(r);
    }
    return out;
}

float computeBuildCost(const Build& build) {
    float total = 0.0f;
    for (const Item* item : build.items()) total += itemCostEstimate(*item);
    return total;
}

DerivedStats deriveStats(const Build& build, const AggregatedStats& agg, const ClassTable& classes, int playerLevel) {
    const ClassProfile& profile = classes.profile(build.playerClass);
    DerivedStats d{};
    d.damage = computeDamage(build, agg, profile);
    d.dps = d.damage.spellDps;
    d.manaSustain = computeManaSustain(agg);
    d.ehp = computeBuildEhp(agg, profile, playerLevel);
    d.cost = computeBuildCost(build);
    d.spellCosts = computeSpellCosts(agg, profile);
    d.skillPoints = agg.requirements;
    d.skillPointTotal = agg.requirements.total();
    return d;
}

}  // namespace Loadout
