/**
 * Built-in Abilities
 *
 * Abilities that change damage, immunities, speed, priority or
 * end-of-turn behaviour.
 */

#include "effects/builtin_effects.hpp"

namespace tailglow {
namespace effects {

namespace {

constexpr double TOUGH_CLAWS_MULTIPLIER = 5325.0 / 4096.0;
constexpr double IRON_FIST_MULTIPLIER = 4915.0 / 4096.0;
constexpr double SAND_FORCE_MULTIPLIER = 5325.0 / 4096.0;

// ============================================================================
// IMMUNITIES
// ============================================================================

void register_type_immunity(EffectRegistry& registry, const char* id, const char* name, Type immune) {
    EffectDef effect = make_effect(id, name, EffectKind::ABILITY,
                                   std::string("Immune to ") + to_string(immune) + " moves");
    effect.immunity = [immune](const DamageContext& ctx) {
        return ctx.move_type == immune;
    };
    registry.register_ability(std::move(effect));
}

void register_immunity_abilities(EffectRegistry& registry) {
    register_type_immunity(registry, "flashfire", "Flash Fire", Type::FIRE);
    register_type_immunity(registry, "wellbakedbody", "Well-Baked Body", Type::FIRE);
    register_type_immunity(registry, "waterabsorb", "Water Absorb", Type::WATER);
    register_type_immunity(registry, "stormdrain", "Storm Drain", Type::WATER);
    register_type_immunity(registry, "dryskin", "Dry Skin", Type::WATER);
    register_type_immunity(registry, "voltabsorb", "Volt Absorb", Type::ELECTRIC);
    register_type_immunity(registry, "lightningrod", "Lightning Rod", Type::ELECTRIC);
    register_type_immunity(registry, "motordrive", "Motor Drive", Type::ELECTRIC);
    register_type_immunity(registry, "sapsipper", "Sap Sipper", Type::GRASS);
    register_type_immunity(registry, "eartheater", "Earth Eater", Type::GROUND);

    EffectDef levitate = make_effect("levitate", "Levitate", EffectKind::ABILITY,
                                     "Ungrounded: immune to Ground moves and terrain");
    levitate.traits = effect_traits::UNGROUNDED;
    registry.register_ability(std::move(levitate));

    EffectDef soundproof = make_effect("soundproof", "Soundproof", EffectKind::ABILITY,
                                       "Immune to sound moves");
    soundproof.immunity = [](const DamageContext& ctx) {
        return ctx.move.has_flag(move_flags::SOUND);
    };
    registry.register_ability(std::move(soundproof));

    EffectDef bulletproof = make_effect("bulletproof", "Bulletproof", EffectKind::ABILITY,
                                        "Immune to ball and bomb moves");
    bulletproof.immunity = [](const DamageContext& ctx) {
        return ctx.move.has_flag(move_flags::BULLET);
    };
    registry.register_ability(std::move(bulletproof));

    EffectDef wonder_guard = make_effect("wonderguard", "Wonder Guard", EffectKind::ABILITY,
                                         "Only super-effective moves hit");
    wonder_guard.immunity = [](const DamageContext& ctx) {
        return ctx.type_effectiveness <= 1.0;
    };
    registry.register_ability(std::move(wonder_guard));
}

// ============================================================================
// OFFENSE
// ============================================================================

void register_power_ability(EffectRegistry& registry, const char* id, const char* name,
                            uint32_t flag, double multiplier, const char* description) {
    EffectDef effect = make_effect(id, name, EffectKind::ABILITY, description);
    effect.base_power = [flag, multiplier](const DamageContext& ctx) {
        return ctx.move.has_flag(flag) ? multiplier : 1.0;
    };
    registry.register_ability(std::move(effect));
}

void register_offensive_abilities(EffectRegistry& registry) {
    for (const char* id : {"hugepower", "purepower"}) {
        EffectDef effect = make_effect(id, id[0] == 'h' ? "Huge Power" : "Pure Power",
                                       EffectKind::ABILITY, "2x Attack");
        effect.attacker_stat = [](const DamageContext& ctx, Stat stat) {
            return (stat == Stat::ATK && ctx.move.category == MoveCategory::PHYSICAL) ? 2.0 : 1.0;
        };
        registry.register_ability(std::move(effect));
    }

    EffectDef guts = make_effect("guts", "Guts", EffectKind::ABILITY,
                                 "1.5x Attack while statused, ignores burn halving");
    guts.attacker_stat = [](const DamageContext& ctx, Stat stat) {
        bool statused = ctx.attacker.status != Status::NONE;
        return (statused && stat == Stat::ATK) ? 1.5 : 1.0;
    };
    guts.traits = effect_traits::IGNORES_BURN_PENALTY;
    registry.register_ability(std::move(guts));

    EffectDef adaptability = make_effect("adaptability", "Adaptability", EffectKind::ABILITY,
                                         "STAB is 2x");
    adaptability.stab_multiplier = 2.0;
    registry.register_ability(std::move(adaptability));

    EffectDef technician = make_effect("technician", "Technician", EffectKind::ABILITY,
                                       "1.5x power for moves of 60 BP or less");
    technician.base_power = [](const DamageContext& ctx) {
        return ctx.power <= 60 ? 1.5 : 1.0;
    };
    registry.register_ability(std::move(technician));

    register_power_ability(registry, "toughclaws", "Tough Claws", move_flags::CONTACT,
                           TOUGH_CLAWS_MULTIPLIER, "1.3x power for contact moves");
    register_power_ability(registry, "ironfist", "Iron Fist", move_flags::PUNCH,
                           IRON_FIST_MULTIPLIER, "1.2x power for punching moves");
    register_power_ability(registry, "strongjaw", "Strong Jaw", move_flags::BITE,
                           1.5, "1.5x power for biting moves");
    register_power_ability(registry, "sharpness", "Sharpness", move_flags::SLICING,
                           1.5, "1.5x power for slicing moves");
    register_power_ability(registry, "megalauncher", "Mega Launcher", move_flags::PULSE,
                           1.5, "1.5x power for pulse moves");

    EffectDef sand_force = make_effect("sandforce", "Sand Force", EffectKind::ABILITY,
                                       "1.3x Rock/Ground/Steel power in sand, sand immunity");
    sand_force.base_power = [](const DamageContext& ctx) {
        bool boosted = ctx.move_type == Type::ROCK || ctx.move_type == Type::GROUND ||
                       ctx.move_type == Type::STEEL;
        return (boosted && ctx.field.weather == Weather::SAND) ? SAND_FORCE_MULTIPLIER : 1.0;
    };
    sand_force.traits = effect_traits::WEATHER_IMMUNE;
    registry.register_ability(std::move(sand_force));

    EffectDef skill_link = make_effect("skilllink", "Skill Link", EffectKind::ABILITY,
                                       "Multi-hit moves always hit the maximum number of times");
    skill_link.traits = effect_traits::MAX_HITS;
    registry.register_ability(std::move(skill_link));

    EffectDef rock_head = make_effect("rockhead", "Rock Head", EffectKind::ABILITY,
                                      "No recoil damage");
    rock_head.traits = effect_traits::PREVENTS_RECOIL;
    registry.register_ability(std::move(rock_head));
}

// ============================================================================
// DEFENSE
// ============================================================================

void register_defensive_abilities(EffectRegistry& registry) {
    EffectDef thick_fat = make_effect("thickfat", "Thick Fat", EffectKind::ABILITY,
                                      "Halves the attacking stat of Fire and Ice moves");
    thick_fat.source_stat = [](const DamageContext& ctx, Stat) {
        return (ctx.move_type == Type::FIRE || ctx.move_type == Type::ICE) ? 0.5 : 1.0;
    };
    registry.register_ability(std::move(thick_fat));

    EffectDef heatproof = make_effect("heatproof", "Heatproof", EffectKind::ABILITY,
                                      "Halves Fire damage and burn damage");
    heatproof.source_stat = [](const DamageContext& ctx, Stat) {
        return ctx.move_type == Type::FIRE ? 0.5 : 1.0;
    };
    heatproof.traits = effect_traits::HALVES_BURN_DAMAGE;
    registry.register_ability(std::move(heatproof));

    for (const char* id : {"multiscale", "shadowshield"}) {
        EffectDef effect = make_effect(id, id[0] == 'm' ? "Multiscale" : "Shadow Shield",
                                       EffectKind::ABILITY, "Halves damage taken at full HP");
        effect.defender_final = [](const DamageContext& ctx) {
            return ctx.defender.hp_percent >= 100.0 ? 0.5 : 1.0;
        };
        registry.register_ability(std::move(effect));
    }

    struct Filter {
        const char* id;
        const char* name;
    };
    static const Filter filters[] = {
        {"filter", "Filter"}, {"solidrock", "Solid Rock"}, {"prismarmor", "Prism Armor"},
    };
    for (const auto& f : filters) {
        EffectDef effect = make_effect(f.id, f.name, EffectKind::ABILITY,
                                       "0.75x super-effective damage taken");
        effect.defender_final = [](const DamageContext& ctx) {
            return ctx.type_effectiveness > 1.0 ? 0.75 : 1.0;
        };
        registry.register_ability(std::move(effect));
    }

    EffectDef fur_coat = make_effect("furcoat", "Fur Coat", EffectKind::ABILITY,
                                     "2x Defense");
    fur_coat.defender_stat = [](const DamageContext&, Stat stat) {
        return stat == Stat::DEF ? 2.0 : 1.0;
    };
    registry.register_ability(std::move(fur_coat));

    EffectDef ice_scales = make_effect("icescales", "Ice Scales", EffectKind::ABILITY,
                                       "Halves special damage taken");
    ice_scales.defender_final = [](const DamageContext& ctx) {
        return ctx.move.category == MoveCategory::SPECIAL ? 0.5 : 1.0;
    };
    registry.register_ability(std::move(ice_scales));

    EffectDef fluffy = make_effect("fluffy", "Fluffy", EffectKind::ABILITY,
                                   "Halves contact damage, doubles Fire damage");
    fluffy.defender_final = [](const DamageContext& ctx) {
        double m = 1.0;
        if (ctx.move.has_flag(move_flags::CONTACT)) m *= 0.5;
        if (ctx.move_type == Type::FIRE) m *= 2.0;
        return m;
    };
    registry.register_ability(std::move(fluffy));

    EffectDef sturdy = make_effect("sturdy", "Sturdy", EffectKind::ABILITY,
                                   "Survives one hit from full HP, immune to OHKO moves");
    sturdy.traits = effect_traits::SURVIVES_AT_FULL_HP | effect_traits::BLOCKS_OHKO;
    registry.register_ability(std::move(sturdy));

    EffectDef unaware = make_effect("unaware", "Unaware", EffectKind::ABILITY,
                                    "Ignores the opponent's stat stages");
    unaware.traits = effect_traits::IGNORES_OPPONENT_BOOSTS;
    registry.register_ability(std::move(unaware));

    for (const char* id : {"roughskin", "ironbarbs"}) {
        EffectDef effect = make_effect(id, id[0] == 'r' ? "Rough Skin" : "Iron Barbs",
                                       EffectKind::ABILITY, "Contact attackers lose 1/8 of their HP");
        effect.contact_damage_percent = 12.5;
        registry.register_ability(std::move(effect));
    }
}

// ============================================================================
// SPEED AND PRIORITY
// ============================================================================

void register_weather_speed(EffectRegistry& registry, const char* id, const char* name,
                            Weather weather) {
    EffectDef effect = make_effect(id, name, EffectKind::ABILITY,
                                   std::string("2x Speed in ") + to_string(weather));
    effect.speed = [weather](const Combatant&, const FieldState& field) {
        return field.weather == weather ? 2.0 : 1.0;
    };
    if (weather == Weather::SAND) {
        effect.traits = effect_traits::WEATHER_IMMUNE;
    }
    registry.register_ability(std::move(effect));
}

void register_speed_abilities(EffectRegistry& registry) {
    register_weather_speed(registry, "swiftswim", "Swift Swim", Weather::RAIN);
    register_weather_speed(registry, "chlorophyll", "Chlorophyll", Weather::SUN);
    register_weather_speed(registry, "sandrush", "Sand Rush", Weather::SAND);
    register_weather_speed(registry, "slushrush", "Slush Rush", Weather::SNOW);

    EffectDef surge_surfer = make_effect("surgesurfer", "Surge Surfer", EffectKind::ABILITY,
                                         "2x Speed in Electric Terrain");
    surge_surfer.speed = [](const Combatant&, const FieldState& field) {
        return field.terrain == Terrain::ELECTRIC ? 2.0 : 1.0;
    };
    registry.register_ability(std::move(surge_surfer));

    EffectDef quick_feet = make_effect("quickfeet", "Quick Feet", EffectKind::ABILITY,
                                       "1.5x Speed while statused, ignores paralysis slowdown");
    quick_feet.speed = [](const Combatant& holder, const FieldState&) {
        return holder.status != Status::NONE ? 1.5 : 1.0;
    };
    quick_feet.traits = effect_traits::IGNORES_PARALYSIS_SPEED;
    registry.register_ability(std::move(quick_feet));

    EffectDef prankster = make_effect("prankster", "Prankster", EffectKind::ABILITY,
                                      "+1 priority for status moves");
    prankster.priority = [](const Combatant&, const MoveDef& move, const FieldState&) {
        return move.is_status() ? 1 : 0;
    };
    registry.register_ability(std::move(prankster));

    EffectDef gale_wings = make_effect("galewings", "Gale Wings", EffectKind::ABILITY,
                                       "+1 priority for Flying moves at full HP");
    gale_wings.priority = [](const Combatant& holder, const MoveDef& move, const FieldState&) {
        return (move.type == Type::FLYING && holder.hp_percent >= 100.0) ? 1 : 0;
    };
    registry.register_ability(std::move(gale_wings));

    EffectDef triage = make_effect("triage", "Triage", EffectKind::ABILITY,
                                   "+3 priority for healing moves");
    triage.priority = [](const Combatant&, const MoveDef& move, const FieldState&) {
        bool heals = move.has_flag(move_flags::HEALING) || move.drain_fraction > 0.0;
        return heals ? 3 : 0;
    };
    registry.register_ability(std::move(triage));
}

// ============================================================================
// RESIDUAL
// ============================================================================

void register_residual_abilities(EffectRegistry& registry) {
    EffectDef magic_guard = make_effect("magicguard", "Magic Guard", EffectKind::ABILITY,
                                        "Only takes damage from attacks");
    magic_guard.traits = effect_traits::BLOCKS_INDIRECT | effect_traits::WEATHER_IMMUNE;
    registry.register_ability(std::move(magic_guard));

    EffectDef poison_heal = make_effect("poisonheal", "Poison Heal", EffectKind::ABILITY,
                                        "Heals 1/8 HP per turn while poisoned");
    poison_heal.traits = effect_traits::POISON_HEAL;
    registry.register_ability(std::move(poison_heal));

    EffectDef overcoat = make_effect("overcoat", "Overcoat", EffectKind::ABILITY,
                                     "Immune to weather damage");
    overcoat.traits = effect_traits::WEATHER_IMMUNE;
    registry.register_ability(std::move(overcoat));

    EffectDef sand_veil = make_effect("sandveil", "Sand Veil", EffectKind::ABILITY,
                                      "Immune to sandstorm damage");
    sand_veil.traits = effect_traits::WEATHER_IMMUNE;
    registry.register_ability(std::move(sand_veil));
}

} // anonymous namespace

void register_builtin_abilities(EffectRegistry& registry) {
    register_immunity_abilities(registry);
    register_offensive_abilities(registry);
    register_defensive_abilities(registry);
    register_speed_abilities(registry);
    register_residual_abilities(registry);
}

} // namespace effects
} // namespace tailglow
