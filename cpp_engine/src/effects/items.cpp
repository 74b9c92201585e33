/**
 * Built-in Items
 *
 * Held items that change damage, speed, grounding or end-of-turn HP.
 * Multipliers use the 4096-based values the battle simulator uses
 * (Life Orb 5324/4096, Expert Belt 4915/4096, type boosters 4915/4096).
 */

#include "effects/builtin_effects.hpp"

namespace tailglow {
namespace effects {

namespace {

constexpr double LIFE_ORB_MULTIPLIER = 5324.0 / 4096.0;
constexpr double BOOSTER_MULTIPLIER = 4915.0 / 4096.0;

bool is_physical(const DamageContext& ctx) {
    return ctx.move.category == MoveCategory::PHYSICAL;
}

bool is_special(const DamageContext& ctx) {
    return ctx.move.category == MoveCategory::SPECIAL;
}

void register_choice_items(EffectRegistry& registry) {
    EffectDef band = make_effect("choiceband", "Choice Band", EffectKind::ITEM,
                                 "1.5x Attack, locked into one move");
    band.attacker_stat = [](const DamageContext& ctx, Stat stat) {
        return (stat == Stat::ATK && is_physical(ctx)) ? 1.5 : 1.0;
    };
    band.traits = effect_traits::CHOICE_LOCK;
    registry.register_item(std::move(band));

    EffectDef specs = make_effect("choicespecs", "Choice Specs", EffectKind::ITEM,
                                  "1.5x Special Attack, locked into one move");
    specs.attacker_stat = [](const DamageContext& ctx, Stat stat) {
        return (stat == Stat::SPA && is_special(ctx)) ? 1.5 : 1.0;
    };
    specs.traits = effect_traits::CHOICE_LOCK;
    registry.register_item(std::move(specs));

    EffectDef scarf = make_effect("choicescarf", "Choice Scarf", EffectKind::ITEM,
                                  "1.5x Speed, locked into one move");
    scarf.speed = [](const Combatant&, const FieldState&) { return 1.5; };
    scarf.traits = effect_traits::CHOICE_LOCK;
    registry.register_item(std::move(scarf));
}

void register_damage_items(EffectRegistry& registry) {
    EffectDef life_orb = make_effect("lifeorb", "Life Orb", EffectKind::ITEM,
                                     "1.3x damage, loses 10% HP per attack");
    life_orb.attacker_final = [](const DamageContext&) { return LIFE_ORB_MULTIPLIER; };
    life_orb.attack_recoil_percent = 10.0;
    registry.register_item(std::move(life_orb));

    EffectDef expert_belt = make_effect("expertbelt", "Expert Belt", EffectKind::ITEM,
                                        "1.2x damage on super-effective hits");
    expert_belt.attacker_final = [](const DamageContext& ctx) {
        return ctx.type_effectiveness > 1.0 ? BOOSTER_MULTIPLIER : 1.0;
    };
    registry.register_item(std::move(expert_belt));

    // Type-boosting held items
    struct Booster {
        const char* id;
        const char* name;
        Type type;
    };
    static const Booster boosters[] = {
        {"charcoal", "Charcoal", Type::FIRE},
        {"mysticwater", "Mystic Water", Type::WATER},
        {"magnet", "Magnet", Type::ELECTRIC},
        {"miracleseed", "Miracle Seed", Type::GRASS},
        {"nevermeltice", "Never-Melt Ice", Type::ICE},
        {"blackbelt", "Black Belt", Type::FIGHTING},
        {"poisonbarb", "Poison Barb", Type::POISON},
        {"softsand", "Soft Sand", Type::GROUND},
        {"sharpbeak", "Sharp Beak", Type::FLYING},
        {"twistedspoon", "Twisted Spoon", Type::PSYCHIC},
        {"silverpowder", "Silver Powder", Type::BUG},
        {"hardstone", "Hard Stone", Type::ROCK},
        {"spelltag", "Spell Tag", Type::GHOST},
        {"dragonfang", "Dragon Fang", Type::DRAGON},
        {"blackglasses", "Black Glasses", Type::DARK},
        {"metalcoat", "Metal Coat", Type::STEEL},
        {"fairyfeather", "Fairy Feather", Type::FAIRY},
        {"silkscarf", "Silk Scarf", Type::NORMAL},
    };
    for (const auto& b : boosters) {
        Type boosted = b.type;
        EffectDef item = make_effect(b.id, b.name, EffectKind::ITEM,
                                     std::string("1.2x power for ") + to_string(boosted) + " moves");
        item.base_power = [boosted](const DamageContext& ctx) {
            return ctx.move_type == boosted ? BOOSTER_MULTIPLIER : 1.0;
        };
        registry.register_item(std::move(item));
    }
}

void register_defensive_items(EffectRegistry& registry) {
    EffectDef vest = make_effect("assaultvest", "Assault Vest", EffectKind::ITEM,
                                 "1.5x Special Defense");
    vest.defender_stat = [](const DamageContext&, Stat stat) {
        return stat == Stat::SPD ? 1.5 : 1.0;
    };
    registry.register_item(std::move(vest));

    // The holder carrying Eviolite implies it can still evolve
    EffectDef eviolite = make_effect("eviolite", "Eviolite", EffectKind::ITEM,
                                     "1.5x Defense and Special Defense");
    eviolite.defender_stat = [](const DamageContext&, Stat stat) {
        return (stat == Stat::DEF || stat == Stat::SPD) ? 1.5 : 1.0;
    };
    registry.register_item(std::move(eviolite));

    EffectDef helmet = make_effect("rockyhelmet", "Rocky Helmet", EffectKind::ITEM,
                                   "Contact attackers lose 1/6 of their HP");
    helmet.contact_damage_percent = 100.0 / 6.0;
    registry.register_item(std::move(helmet));

    EffectDef sash = make_effect("focussash", "Focus Sash", EffectKind::ITEM,
                                 "Survives one hit from full HP");
    sash.traits = effect_traits::SURVIVES_AT_FULL_HP;
    registry.register_item(std::move(sash));

    EffectDef boots = make_effect("heavydutyboots", "Heavy-Duty Boots", EffectKind::ITEM,
                                  "Immune to entry hazards");
    boots.traits = effect_traits::IGNORES_HAZARDS;
    registry.register_item(std::move(boots));

    EffectDef balloon = make_effect("airballoon", "Air Balloon", EffectKind::ITEM,
                                    "Ungrounded until hit");
    balloon.traits = effect_traits::UNGROUNDED;
    registry.register_item(std::move(balloon));

    EffectDef iron_ball = make_effect("ironball", "Iron Ball", EffectKind::ITEM,
                                      "Halves Speed and grounds the holder");
    iron_ball.speed = [](const Combatant&, const FieldState&) { return 0.5; };
    iron_ball.traits = effect_traits::GROUNDED;
    registry.register_item(std::move(iron_ball));
}

void register_residual_items(EffectRegistry& registry) {
    EffectDef leftovers = make_effect("leftovers", "Leftovers", EffectKind::ITEM,
                                      "Restores 1/16 HP each turn");
    leftovers.residual = [](const Combatant&, const FieldState&) { return 6.25; };
    registry.register_item(std::move(leftovers));

    EffectDef sludge = make_effect("blacksludge", "Black Sludge", EffectKind::ITEM,
                                   "Poison types heal 1/16, others lose 1/8");
    sludge.residual = [](const Combatant& holder, const FieldState&) {
        return holder.has_defensive_type(Type::POISON) ? 6.25 : -12.5;
    };
    registry.register_item(std::move(sludge));
}

} // anonymous namespace

void register_builtin_items(EffectRegistry& registry) {
    register_choice_items(registry);
    register_damage_items(registry);
    register_defensive_items(registry);
    register_residual_items(registry);
}

} // namespace effects
} // namespace tailglow
