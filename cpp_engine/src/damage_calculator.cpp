/**
 * Tail Glow Battle Engine - Damage Calculator Implementation
 */

#include "damage_calculator.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace tailglow {

namespace {

constexpr double TERRAIN_BOOST = 5325.0 / 4096.0;

// Hit-count distribution of a multi-hit move: (hits, probability)
std::vector<std::pair<int, double>> hit_distribution(int min_hits, int max_hits) {
    std::vector<std::pair<int, double>> dist;
    if (min_hits >= max_hits) {
        dist.emplace_back(max_hits, 1.0);
    } else if (min_hits == 2 && max_hits == 5) {
        dist = {{2, 0.35}, {3, 0.35}, {4, 0.15}, {5, 0.15}};
    } else {
        double p = 1.0 / (max_hits - min_hits + 1);
        for (int h = min_hits; h <= max_hits; h++) {
            dist.emplace_back(h, p);
        }
    }
    return dist;
}

double to_percent(int damage, int max_hp) {
    if (max_hp <= 0) return 0.0;
    return damage * 100.0 / max_hp;
}

} // anonymous namespace

DamageCalculator::DamageCalculator(const MoveDatabase& moves, const EffectRegistry& effects)
    : moves_(moves)
    , effects_(effects)
{}

// ============================================================================
// FIXED-POINT HELPERS
// ============================================================================

int DamageCalculator::chain_modifier(int value, double multiplier) {
    int64_t mod = static_cast<int64_t>(std::lround(multiplier * 4096.0));
    return static_cast<int>((static_cast<int64_t>(value) * mod + 2047) / 4096);
}

int DamageCalculator::apply_effectiveness(int damage, double effectiveness) {
    if (effectiveness <= 0.0) {
        return 0;
    }
    double e = effectiveness;
    while (e >= 2.0) {
        damage *= 2;
        e /= 2.0;
    }
    while (e <= 0.5) {
        damage /= 2;
        e *= 2.0;
    }
    return damage;
}

// ============================================================================
// PUBLIC API
// ============================================================================

DamageResult DamageCalculator::compute_damage(const Combatant& attacker,
                                              const MoveID& move_id,
                                              const Combatant& defender,
                                              const FieldState& field) const {
    const MoveDef* move = moves_.get_move(move_id);
    if (!move) {
        DamageResult result;
        result.success = false;
        result.error = AnalysisError::INSUFFICIENT_DATA;
        result.move_id = move_id;
        result.note = "Unknown move: " + move_id;
        return result;
    }
    return compute_damage(attacker, *move, defender, field);
}

DamageResult DamageCalculator::compute_damage(const Combatant& attacker,
                                              const MoveDef& move,
                                              const Combatant& defender,
                                              const FieldState& field) const {
    DamageResult result;
    result.move_id = move.id;
    result.move_type = move.type;

    if (move.is_status()) {
        result.success = false;
        result.error = AnalysisError::INVALID_MOVE_KIND;
        result.note = "Status move deals no damage";
        return result;
    }

    if (!attacker.has_stats() || !defender.has_stats()) {
        result.success = false;
        result.error = AnalysisError::INSUFFICIENT_DATA;
        result.note = "Missing stats for " + (attacker.has_stats() ? defender.id : attacker.id);
        return result;
    }

    Type move_type = resolve_move_type(attacker, move, field);
    result.move_type = move_type;

    // Iron Ball and similar effects let Ground moves hit grounded Flying types
    std::vector<Type> def_types = defender.defensive_types();
    if (move_type == Type::GROUND && effects_.is_grounded(defender)) {
        def_types.erase(std::remove(def_types.begin(), def_types.end(), Type::FLYING), def_types.end());
    }
    double effectiveness = type_effectiveness(move_type, def_types);
    result.type_effectiveness = effectiveness;

    ResolvedPower power = resolve_power(attacker, move, defender, field);
    result.resolved_power = power.power;
    if (power.estimated) {
        result.error = AnalysisError::INSUFFICIENT_DATA;
        result.is_estimated = true;
        result.note = power.note;
    }

    DamageContext ctx{attacker, defender, move, move_type, power.power, field, effectiveness};

    std::string reason;
    if (is_immune(ctx, reason)) {
        result.immune = true;
        result.note = reason;
        return result;
    }

    if (move.ohko) {
        return ohko_damage(attacker, move, defender, std::move(result));
    }
    if (move.is_fixed_damage()) {
        return fixed_damage(attacker, move, defender, std::move(result));
    }

    result.range.rolls = compute_rolls(ctx);
    if (move.is_multi_hit()) {
        if (effects_.has_trait(attacker, effect_traits::MAX_HITS)) {
            result.hits_min = move.max_hits;
        } else {
            result.hits_min = move.min_hits;
        }
        result.hits_max = move.max_hits;
    }

    fill_range(attacker, defender, move, result);
    return result;
}

// ============================================================================
// MOVE CHOICE
// ============================================================================

ChosenMove DamageCalculator::strongest_move(const Combatant& attacker, const Combatant& defender,
                                            const FieldState& field) const {
    ChosenMove best;
    for (const MoveID& move_id : attacker.all_moves()) {
        const MoveDef* move = moves_.get_move(move_id);
        if (!move || move->is_status()) {
            continue;
        }
        DamageResult damage = compute_damage(attacker, *move, defender, field);
        if (!damage.success || damage.range.expected_percent <= 0.0) {
            continue;
        }

        double expected = damage.range.expected_percent;
        int accuracy = move->accuracy_rank();
        bool better = !best.found ||
                      expected > best.expected_percent ||
                      (expected == best.expected_percent && accuracy > best.accuracy_rank) ||
                      (expected == best.expected_percent && accuracy == best.accuracy_rank &&
                       move->id < best.move_id);
        if (better) {
            best.move_id = move->id;
            best.expected_percent = expected;
            best.accuracy_rank = accuracy;
            best.found = true;
        }
    }
    return best;
}

Type DamageCalculator::resolve_move_type(const Combatant& attacker, const MoveDef& move,
                                         const FieldState& field) const {
    if (move.power_kind == VariablePowerKind::WEATHER_BALL) {
        switch (field.weather) {
            case Weather::SUN: return Type::FIRE;
            case Weather::RAIN: return Type::WATER;
            case Weather::SAND: return Type::ROCK;
            case Weather::SNOW: return Type::ICE;
            default: break;
        }
    }
    if (move.id == "terablast" && attacker.terastallized && attacker.tera_type.has_value()) {
        return *attacker.tera_type;
    }
    return move.type;
}

int DamageCalculator::staged_stat(const Combatant& holder, Stat stat, const Combatant& opponent) const {
    int value = holder.stat(stat);
    int stage = holder.boosts.get(stat);
    if (effects_.has_trait(opponent, effect_traits::IGNORES_OPPONENT_BOOSTS)) {
        stage = 0;
    }
    return apply_stage(value, stage);
}

// ============================================================================
// POWER RESOLUTION
// ============================================================================

DamageCalculator::ResolvedPower DamageCalculator::resolve_power(const Combatant& attacker,
                                                                const MoveDef& move,
                                                                const Combatant& defender,
                                                                const FieldState& field) const {
    ResolvedPower resolved;
    resolved.power = move.base_power;

    auto estimate = [&](const std::string& why) {
        resolved.power = move.min_power;
        resolved.estimated = true;
        resolved.note = why + "; using minimum power " + std::to_string(move.min_power);
    };

    int att_max = attacker.max_hp();
    int att_cur = attacker.current_hp();

    switch (move.power_kind) {
        case VariablePowerKind::NONE:
            break;

        case VariablePowerKind::ERUPTION:
            resolved.power = att_max > 0 ? std::max(1, 150 * att_cur / att_max) : move.min_power;
            break;

        case VariablePowerKind::REVERSAL: {
            int ratio = att_max > 0 ? 48 * att_cur / att_max : 48;
            if (ratio <= 1) resolved.power = 200;
            else if (ratio <= 4) resolved.power = 150;
            else if (ratio <= 9) resolved.power = 100;
            else if (ratio <= 16) resolved.power = 80;
            else if (ratio <= 32) resolved.power = 40;
            else resolved.power = 20;
            break;
        }

        case VariablePowerKind::HEX:
            resolved.power = defender.status != Status::NONE ? move.max_power : move.min_power;
            break;

        case VariablePowerKind::FACADE: {
            bool boosted = attacker.status == Status::BURN || attacker.status == Status::PARALYSIS ||
                           attacker.status == Status::POISON || attacker.status == Status::TOXIC;
            resolved.power = boosted ? move.max_power : move.min_power;
            break;
        }

        case VariablePowerKind::ACROBATICS:
            if (!attacker.item_known()) {
                estimate("Attacker item unknown");
            } else {
                resolved.power = attacker.item_known_empty() ? move.max_power : move.min_power;
            }
            break;

        case VariablePowerKind::KNOCK_OFF:
            if (!defender.item_known()) {
                estimate("Target item unknown");
            } else {
                resolved.power = defender.item_known_empty() ? move.min_power : move.max_power;
            }
            break;

        case VariablePowerKind::WEATHER_BALL:
            resolved.power = field.weather != Weather::NONE ? move.max_power : move.min_power;
            break;

        case VariablePowerKind::STORED_POWER:
            resolved.power = 20 + 20 * attacker.boosts.positive_total();
            break;

        case VariablePowerKind::GYRO_BALL: {
            int user = apply_stage(attacker.stat(Stat::SPE), attacker.boosts.get(Stat::SPE));
            int target = apply_stage(defender.stat(Stat::SPE), defender.boosts.get(Stat::SPE));
            resolved.power = user > 0 ? std::min(150, 25 * target / user + 1) : 1;
            break;
        }

        case VariablePowerKind::ELECTRO_BALL: {
            int user = apply_stage(attacker.stat(Stat::SPE), attacker.boosts.get(Stat::SPE));
            int target = apply_stage(defender.stat(Stat::SPE), defender.boosts.get(Stat::SPE));
            int ratio = target > 0 ? user / target : 4;
            if (ratio >= 4) resolved.power = 150;
            else if (ratio >= 3) resolved.power = 120;
            else if (ratio >= 2) resolved.power = 80;
            else if (ratio >= 1) resolved.power = 60;
            else resolved.power = 40;
            break;
        }

        case VariablePowerKind::TARGET_WEIGHT: {
            double w = defender.weight_kg;
            if (w <= 0.0) {
                estimate("Target weight unknown");
            } else if (w < 10.0) resolved.power = 20;
            else if (w < 25.0) resolved.power = 40;
            else if (w < 50.0) resolved.power = 60;
            else if (w < 100.0) resolved.power = 80;
            else if (w < 200.0) resolved.power = 100;
            else resolved.power = 120;
            break;
        }

        case VariablePowerKind::WEIGHT_RATIO: {
            if (attacker.weight_kg <= 0.0 || defender.weight_kg <= 0.0) {
                estimate("Weight unknown");
                break;
            }
            double ratio = attacker.weight_kg / defender.weight_kg;
            if (ratio >= 5.0) resolved.power = 120;
            else if (ratio >= 4.0) resolved.power = 100;
            else if (ratio >= 3.0) resolved.power = 80;
            else if (ratio >= 2.0) resolved.power = 60;
            else resolved.power = 40;
            break;
        }
    }

    return resolved;
}

// ============================================================================
// IMMUNITY
// ============================================================================

bool DamageCalculator::is_immune(const DamageContext& ctx, std::string& reason) const {
    if (ctx.type_effectiveness <= 0.0) {
        Type immune_type = ctx.defender.type1;
        for (Type t : ctx.defender.defensive_types()) {
            if (type_effectiveness(ctx.move_type, t) <= 0.0) {
                immune_type = t;
                break;
            }
        }
        reason = std::string(to_string(immune_type)) + " type is immune to " + to_string(ctx.move_type);
        return true;
    }

    if (ctx.move_type == Type::GROUND && !effects_.is_grounded(ctx.defender)) {
        reason = "Target is not grounded";
        return true;
    }

    if (ctx.move.ohko && ctx.move.type == Type::ICE && ctx.defender.has_defensive_type(Type::ICE)) {
        reason = "Ice types are immune to Sheer Cold";
        return true;
    }

    if (effects_.grants_immunity(ctx)) {
        reason = "Blocked by " + ctx.defender.ability.value_or("ability");
        return true;
    }

    return false;
}

// ============================================================================
// DAMAGE ROLLS
// ============================================================================

std::array<int, DAMAGE_ROLL_COUNT> DamageCalculator::compute_rolls(const DamageContext& ctx) const {
    const Combatant& att = ctx.attacker;
    const Combatant& def = ctx.defender;
    const FieldState& field = ctx.field;

    bool physical = ctx.move.category == MoveCategory::PHYSICAL;
    Stat atk_stat = physical ? Stat::ATK : Stat::SPA;
    Stat def_stat = physical ? Stat::DEF : Stat::SPD;

    // Stats after stages, weather and item/ability modifiers
    int attack = staged_stat(att, atk_stat, def);
    int defense = staged_stat(def, def_stat, att);

    if (field.weather == Weather::SAND && def_stat == Stat::SPD && def.has_defensive_type(Type::ROCK)) {
        defense = chain_modifier(defense, 1.5);
    }
    if (field.weather == Weather::SNOW && def_stat == Stat::DEF && def.has_defensive_type(Type::ICE)) {
        defense = chain_modifier(defense, 1.5);
    }

    attack = std::max(1, chain_modifier(attack, effects_.offensive_stat_modifier(ctx, atk_stat)));
    defense = std::max(1, chain_modifier(defense, effects_.defensive_stat_modifier(ctx, def_stat)));

    // Base power after item/ability and terrain modifiers
    double power_mod = effects_.base_power_modifier(ctx);
    if (effects_.is_grounded(att)) {
        if ((field.terrain == Terrain::ELECTRIC && ctx.move_type == Type::ELECTRIC) ||
            (field.terrain == Terrain::GRASSY && ctx.move_type == Type::GRASS) ||
            (field.terrain == Terrain::PSYCHIC && ctx.move_type == Type::PSYCHIC)) {
            power_mod *= TERRAIN_BOOST;
        }
    }
    if (field.terrain == Terrain::MISTY && ctx.move_type == Type::DRAGON && effects_.is_grounded(def)) {
        power_mod *= 0.5;
    }
    int power = std::max(1, chain_modifier(ctx.power, power_mod));

    int64_t level_factor = 2 * att.level / 5 + 2;
    int64_t base = level_factor * power * attack / defense;
    int base_damage = static_cast<int>(base / 50) + 2;

    // Weather
    if (field.weather == Weather::SUN) {
        if (ctx.move_type == Type::FIRE) base_damage = chain_modifier(base_damage, 1.5);
        else if (ctx.move_type == Type::WATER) base_damage = chain_modifier(base_damage, 0.5);
    } else if (field.weather == Weather::RAIN) {
        if (ctx.move_type == Type::WATER) base_damage = chain_modifier(base_damage, 1.5);
        else if (ctx.move_type == Type::FIRE) base_damage = chain_modifier(base_damage, 0.5);
    }

    // STAB (tera into an original type stacks to 2x)
    double stab = 1.0;
    if (att.has_stab(ctx.move_type)) {
        stab = effects_.stab_multiplier(att);
        bool original = ctx.move_type == att.type1 || ctx.move_type == att.type2;
        if (att.terastallized && att.tera_type == ctx.move_type && original) {
            stab = stab >= 2.0 ? 2.25 : 2.0;
        }
    }

    bool burn_halved = att.status == Status::BURN && physical &&
                       !effects_.has_trait(att, effect_traits::IGNORES_BURN_PENALTY) &&
                       ctx.move.power_kind != VariablePowerKind::FACADE;

    // Final modifiers: screens, then items and abilities
    std::vector<double> finals;
    const SideConditions& def_side = field.side(def.side);
    if (def_side.has_aurora_veil() ||
        (physical && def_side.has_reflect()) ||
        (!physical && def_side.has_light_screen())) {
        finals.push_back(0.5);
    }
    for (double m : effects_.final_modifiers(ctx)) {
        finals.push_back(m);
    }

    std::array<int, DAMAGE_ROLL_COUNT> rolls{};
    for (int i = 0; i < DAMAGE_ROLL_COUNT; i++) {
        int damage = base_damage * (85 + i) / 100;
        if (stab != 1.0) {
            damage = chain_modifier(damage, stab);
        }
        damage = apply_effectiveness(damage, ctx.type_effectiveness);
        if (burn_halved) {
            damage = chain_modifier(damage, 0.5);
        }
        for (double m : finals) {
            damage = chain_modifier(damage, m);
        }
        rolls[i] = std::max(1, damage);
    }
    return rolls;
}

// ============================================================================
// SPECIAL MOVE KINDS
// ============================================================================

DamageResult DamageCalculator::fixed_damage(const Combatant& attacker, const MoveDef& move,
                                            const Combatant& defender, DamageResult result) const {
    int amount = 0;
    switch (move.fixed_kind) {
        case FixedDamageKind::LEVEL:
            amount = attacker.level;
            break;
        case FixedDamageKind::HALF_HP:
            amount = std::max(1, defender.current_hp() / 2);
            break;
        case FixedDamageKind::CONSTANT:
            amount = move.fixed_amount;
            break;
        case FixedDamageKind::NONE:
            break;
    }
    result.range.rolls.fill(amount);
    fill_range(attacker, defender, move, result);
    return result;
}

DamageResult DamageCalculator::ohko_damage(const Combatant& attacker, const MoveDef& /*move*/,
                                           const Combatant& defender, DamageResult result) const {
    if (effects_.has_trait(defender, effect_traits::BLOCKS_OHKO)) {
        result.immune = true;
        result.note = "Blocked by " + defender.ability.value_or("ability");
        return result;
    }
    if (attacker.level < defender.level) {
        result.note = "Fails against a higher-level target";
        return result;
    }

    int hp = defender.current_hp();
    double percent = to_percent(hp, defender.max_hp());
    double chance = std::min(1.0, std::max(0.0, (30 + attacker.level - defender.level) / 100.0));

    result.range.rolls.fill(hp);
    result.range.min_damage = hp;
    result.range.max_damage = hp;
    result.range.min_percent = percent;
    result.range.max_percent = percent;
    result.range.expected_percent = percent * chance;
    result.range.ko_probability = hp > 0 ? chance : 0.0;
    return result;
}

void DamageCalculator::fill_range(const Combatant& /*attacker*/, const Combatant& defender,
                                  const MoveDef& /*move*/, DamageResult& result) const {
    DamageRange& range = result.range;
    int max_hp = defender.max_hp();
    int hp = defender.current_hp();

    // Sturdy / Focus Sash leave a single hit one HP short from full
    bool survives = result.hits_max == 1 && defender.hp_percent >= 100.0 &&
                    effects_.has_trait(defender, effect_traits::SURVIVES_AT_FULL_HP);
    if (survives) {
        for (int& r : range.rolls) {
            r = std::min(r, std::max(0, hp - 1));
        }
    }

    double mean_roll = 0.0;
    for (int r : range.rolls) {
        mean_roll += r;
    }
    mean_roll /= DAMAGE_ROLL_COUNT;

    double ko = 0.0;
    double expected_hits = 0.0;
    for (const auto& entry : hit_distribution(result.hits_min, result.hits_max)) {
        int hits = entry.first;
        double p = entry.second;
        int kos = 0;
        for (int r : range.rolls) {
            if (hp > 0 && r * hits >= hp) {
                kos++;
            }
        }
        ko += p * static_cast<double>(kos) / DAMAGE_ROLL_COUNT;
        expected_hits += p * hits;
    }

    range.min_damage = range.rolls.front() * result.hits_min;
    range.max_damage = range.rolls.back() * result.hits_max;
    range.min_percent = to_percent(range.min_damage, max_hp);
    range.max_percent = to_percent(range.max_damage, max_hp);
    range.expected_percent = mean_roll * expected_hits * 100.0 / std::max(1, max_hp);
    range.ko_probability = std::min(1.0, ko);
}

} // namespace tailglow
