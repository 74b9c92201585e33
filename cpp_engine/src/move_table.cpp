/**
 * Tail Glow Battle Engine - Built-in Move Table
 *
 * One record per move. Covers the damaging and status moves that appear
 * most often in random-battle sets; anything else can be supplied through
 * MoveDatabase::load_from_json().
 */

#include "move_database.hpp"

namespace tailglow {

namespace {

constexpr MoveCategory PHYS = MoveCategory::PHYSICAL;
constexpr MoveCategory SPEC = MoveCategory::SPECIAL;
constexpr int ALWAYS = 0;   // Accuracy placeholder for moves that never miss

MoveDef damaging(const std::string& name, Type type, MoveCategory category,
                 int base_power, int accuracy, uint32_t flags = 0, int priority = 0) {
    MoveDef m;
    m.id = to_id(name);
    m.name = name;
    m.type = type;
    m.category = category;
    m.base_power = base_power;
    m.min_power = base_power;
    m.max_power = base_power;
    m.always_hits = (accuracy == ALWAYS);
    m.accuracy = m.always_hits ? 100 : accuracy;
    m.flags = flags;
    m.priority = priority;
    return m;
}

MoveDef status(const std::string& name, Type type, int accuracy,
               Status inflicts = Status::NONE, uint32_t flags = 0, int priority = 0) {
    MoveDef m = damaging(name, type, MoveCategory::STATUS, 0, accuracy, flags, priority);
    m.inflicts = inflicts;
    return m;
}

MoveDef with_hits(MoveDef m, int min_hits, int max_hits) {
    m.min_hits = min_hits;
    m.max_hits = max_hits;
    return m;
}

MoveDef with_recoil(MoveDef m, double fraction) {
    m.recoil_fraction = fraction;
    return m;
}

MoveDef with_drain(MoveDef m, double fraction) {
    m.drain_fraction = fraction;
    return m;
}

MoveDef with_power(MoveDef m, VariablePowerKind kind, int min_power, int max_power) {
    m.power_kind = kind;
    m.min_power = min_power;
    m.max_power = max_power;
    return m;
}

MoveDef with_fixed(MoveDef m, FixedDamageKind kind, int amount = 0) {
    m.fixed_kind = kind;
    m.fixed_amount = amount;
    return m;
}

MoveDef as_ohko(MoveDef m) {
    m.ohko = true;
    return m;
}

} // anonymous namespace

std::vector<MoveDef> builtin_move_table() {
    using namespace move_flags;

    return {
        // ====================================================================
        // NORMAL
        // ====================================================================
        damaging("Body Slam", Type::NORMAL, PHYS, 85, 100, CONTACT),
        with_recoil(damaging("Double-Edge", Type::NORMAL, PHYS, 120, 100, CONTACT), 0.33),
        damaging("Extreme Speed", Type::NORMAL, PHYS, 80, 100, CONTACT, 2),
        with_power(damaging("Facade", Type::NORMAL, PHYS, 70, 100, CONTACT),
                   VariablePowerKind::FACADE, 70, 140),
        damaging("Return", Type::NORMAL, PHYS, 102, 100, CONTACT),
        damaging("Hyper Voice", Type::NORMAL, SPEC, 90, 100, SOUND),
        damaging("Boomburst", Type::NORMAL, SPEC, 140, 100, SOUND),
        damaging("Quick Attack", Type::NORMAL, PHYS, 40, 100, CONTACT, 1),
        damaging("Fake Out", Type::NORMAL, PHYS, 40, 100, CONTACT, 3),
        damaging("Rapid Spin", Type::NORMAL, PHYS, 50, 100, CONTACT),
        damaging("Hyper Beam", Type::NORMAL, SPEC, 150, 90),
        damaging("Tri Attack", Type::NORMAL, SPEC, 80, 100),
        damaging("Tera Blast", Type::NORMAL, SPEC, 80, 100),
        with_fixed(damaging("Super Fang", Type::NORMAL, PHYS, 0, 90, CONTACT),
                   FixedDamageKind::HALF_HP),
        with_power(damaging("Weather Ball", Type::NORMAL, SPEC, 50, 100, BULLET),
                   VariablePowerKind::WEATHER_BALL, 50, 100),
        status("Swords Dance", Type::NORMAL, ALWAYS, Status::NONE, SETUP),
        status("Recover", Type::NORMAL, ALWAYS, Status::NONE, HEALING),
        status("Soft-Boiled", Type::NORMAL, ALWAYS, Status::NONE, HEALING),
        status("Slack Off", Type::NORMAL, ALWAYS, Status::NONE, HEALING),
        status("Protect", Type::NORMAL, ALWAYS, Status::NONE, 0, 4),
        status("Substitute", Type::NORMAL, ALWAYS),
        status("Shell Smash", Type::NORMAL, ALWAYS, Status::NONE, SETUP),
        status("Haze", Type::ICE, ALWAYS),
        status("Encore", Type::NORMAL, 100),
        status("Glare", Type::NORMAL, 100, Status::PARALYSIS),
        status("Whirlwind", Type::NORMAL, ALWAYS, Status::NONE, 0, -6),
        status("Roar", Type::NORMAL, ALWAYS, Status::NONE, SOUND, -6),

        // ====================================================================
        // FIRE
        // ====================================================================
        damaging("Flamethrower", Type::FIRE, SPEC, 90, 100),
        damaging("Fire Blast", Type::FIRE, SPEC, 110, 85),
        with_recoil(damaging("Flare Blitz", Type::FIRE, PHYS, 120, 100, CONTACT), 0.33),
        damaging("Fire Punch", Type::FIRE, PHYS, 75, 100, CONTACT | PUNCH),
        damaging("Fire Fang", Type::FIRE, PHYS, 65, 95, CONTACT | BITE),
        damaging("Overheat", Type::FIRE, SPEC, 130, 90),
        damaging("Heat Wave", Type::FIRE, SPEC, 95, 90),
        damaging("Sacred Fire", Type::FIRE, PHYS, 100, 95),
        with_power(damaging("Eruption", Type::FIRE, SPEC, 150, 100),
                   VariablePowerKind::ERUPTION, 1, 150),
        with_power(damaging("Heat Crash", Type::FIRE, PHYS, 40, 100, CONTACT),
                   VariablePowerKind::WEIGHT_RATIO, 40, 120),
        status("Will-O-Wisp", Type::FIRE, 85, Status::BURN),
        status("Sunny Day", Type::FIRE, ALWAYS),

        // ====================================================================
        // WATER
        // ====================================================================
        damaging("Surf", Type::WATER, SPEC, 90, 100),
        damaging("Hydro Pump", Type::WATER, SPEC, 110, 80),
        damaging("Scald", Type::WATER, SPEC, 80, 100),
        damaging("Waterfall", Type::WATER, PHYS, 80, 100, CONTACT),
        damaging("Aqua Jet", Type::WATER, PHYS, 40, 100, CONTACT, 1),
        damaging("Liquidation", Type::WATER, PHYS, 85, 100, CONTACT),
        damaging("Crabhammer", Type::WATER, PHYS, 100, 90, CONTACT),
        with_recoil(damaging("Wave Crash", Type::WATER, PHYS, 120, 100, CONTACT), 0.33),
        damaging("Flip Turn", Type::WATER, PHYS, 60, 100, CONTACT | PIVOT),
        with_hits(damaging("Surging Strikes", Type::WATER, PHYS, 25, 100, CONTACT | PUNCH), 3, 3),
        with_hits(damaging("Water Shuriken", Type::WATER, SPEC, 15, 100, 0, 1), 2, 5),
        with_power(damaging("Water Spout", Type::WATER, SPEC, 150, 100),
                   VariablePowerKind::ERUPTION, 1, 150),
        status("Rain Dance", Type::WATER, ALWAYS),

        // ====================================================================
        // ELECTRIC
        // ====================================================================
        damaging("Thunderbolt", Type::ELECTRIC, SPEC, 90, 100),
        damaging("Thunder", Type::ELECTRIC, SPEC, 110, 70),
        damaging("Volt Switch", Type::ELECTRIC, SPEC, 70, 100, PIVOT),
        damaging("Discharge", Type::ELECTRIC, SPEC, 80, 100),
        with_recoil(damaging("Wild Charge", Type::ELECTRIC, PHYS, 90, 100, CONTACT), 0.25),
        damaging("Thunder Punch", Type::ELECTRIC, PHYS, 75, 100, CONTACT | PUNCH),
        damaging("Supercell Slam", Type::ELECTRIC, PHYS, 100, 95, CONTACT),
        with_power(damaging("Electro Ball", Type::ELECTRIC, SPEC, 40, 100, BULLET),
                   VariablePowerKind::ELECTRO_BALL, 40, 150),
        status("Thunder Wave", Type::ELECTRIC, 90, Status::PARALYSIS),

        // ====================================================================
        // GRASS
        // ====================================================================
        with_drain(damaging("Giga Drain", Type::GRASS, SPEC, 75, 100), 0.5),
        damaging("Energy Ball", Type::GRASS, SPEC, 90, 100, BULLET),
        damaging("Leaf Storm", Type::GRASS, SPEC, 130, 90),
        with_recoil(damaging("Wood Hammer", Type::GRASS, PHYS, 120, 100, CONTACT), 0.33),
        damaging("Power Whip", Type::GRASS, PHYS, 120, 85, CONTACT),
        damaging("Seed Bomb", Type::GRASS, PHYS, 80, 100, BULLET),
        with_hits(damaging("Bullet Seed", Type::GRASS, PHYS, 25, 100, BULLET), 2, 5),
        damaging("Grassy Glide", Type::GRASS, PHYS, 55, 100, CONTACT),
        damaging("Flower Trick", Type::GRASS, PHYS, 70, ALWAYS),
        with_power(damaging("Grass Knot", Type::GRASS, SPEC, 20, 100, CONTACT),
                   VariablePowerKind::TARGET_WEIGHT, 20, 120),
        status("Spore", Type::GRASS, 100, Status::SLEEP),
        status("Sleep Powder", Type::GRASS, 75, Status::SLEEP),
        status("Leech Seed", Type::GRASS, 90),

        // ====================================================================
        // ICE
        // ====================================================================
        damaging("Ice Beam", Type::ICE, SPEC, 90, 100),
        damaging("Blizzard", Type::ICE, SPEC, 110, 70),
        damaging("Ice Shard", Type::ICE, PHYS, 40, 100, 0, 1),
        damaging("Icicle Crash", Type::ICE, PHYS, 85, 90),
        damaging("Ice Punch", Type::ICE, PHYS, 75, 100, CONTACT | PUNCH),
        with_hits(damaging("Icicle Spear", Type::ICE, PHYS, 25, 100), 2, 5),
        as_ohko(damaging("Sheer Cold", Type::ICE, SPEC, 0, 30)),

        // ====================================================================
        // FIGHTING
        // ====================================================================
        damaging("Close Combat", Type::FIGHTING, PHYS, 120, 100, CONTACT),
        damaging("Superpower", Type::FIGHTING, PHYS, 120, 100, CONTACT),
        with_drain(damaging("Drain Punch", Type::FIGHTING, PHYS, 75, 100, CONTACT | PUNCH), 0.5),
        damaging("Mach Punch", Type::FIGHTING, PHYS, 40, 100, CONTACT | PUNCH, 1),
        damaging("Aura Sphere", Type::FIGHTING, SPEC, 80, ALWAYS, PULSE | BULLET),
        damaging("Focus Blast", Type::FIGHTING, SPEC, 120, 70, BULLET),
        damaging("Body Press", Type::FIGHTING, PHYS, 80, 100, CONTACT),
        with_power(damaging("Low Kick", Type::FIGHTING, PHYS, 20, 100, CONTACT),
                   VariablePowerKind::TARGET_WEIGHT, 20, 120),
        with_power(damaging("Reversal", Type::FIGHTING, PHYS, 20, 100, CONTACT),
                   VariablePowerKind::REVERSAL, 20, 200),
        with_fixed(damaging("Seismic Toss", Type::FIGHTING, PHYS, 0, 100, CONTACT),
                   FixedDamageKind::LEVEL),
        status("Bulk Up", Type::FIGHTING, ALWAYS, Status::NONE, SETUP),

        // ====================================================================
        // POISON
        // ====================================================================
        damaging("Sludge Bomb", Type::POISON, SPEC, 90, 100, BULLET),
        damaging("Sludge Wave", Type::POISON, SPEC, 95, 100),
        damaging("Gunk Shot", Type::POISON, PHYS, 120, 80),
        damaging("Poison Jab", Type::POISON, PHYS, 80, 100, CONTACT),
        status("Toxic", Type::POISON, 90, Status::TOXIC),
        status("Toxic Spikes", Type::POISON, ALWAYS, Status::NONE, HAZARD),

        // ====================================================================
        // GROUND
        // ====================================================================
        damaging("Earthquake", Type::GROUND, PHYS, 100, 100),
        damaging("Earth Power", Type::GROUND, SPEC, 90, 100),
        damaging("High Horsepower", Type::GROUND, PHYS, 95, 95, CONTACT),
        damaging("Headlong Rush", Type::GROUND, PHYS, 120, 100, CONTACT | PUNCH),
        damaging("Scorching Sands", Type::GROUND, SPEC, 70, 100),
        as_ohko(damaging("Fissure", Type::GROUND, PHYS, 0, 30)),
        status("Spikes", Type::GROUND, ALWAYS, Status::NONE, HAZARD),

        // ====================================================================
        // FLYING
        // ====================================================================
        with_recoil(damaging("Brave Bird", Type::FLYING, PHYS, 120, 100, CONTACT), 0.33),
        damaging("Hurricane", Type::FLYING, SPEC, 110, 70),
        damaging("Air Slash", Type::FLYING, SPEC, 75, 95, SLICING),
        damaging("Aerial Ace", Type::FLYING, PHYS, 60, ALWAYS, CONTACT | SLICING),
        with_hits(damaging("Dual Wingbeat", Type::FLYING, PHYS, 40, 90, CONTACT), 2, 2),
        with_power(damaging("Acrobatics", Type::FLYING, PHYS, 55, 100, CONTACT),
                   VariablePowerKind::ACROBATICS, 55, 110),
        status("Roost", Type::FLYING, ALWAYS, Status::NONE, HEALING),
        status("Defog", Type::FLYING, ALWAYS),
        status("Tailwind", Type::FLYING, ALWAYS),

        // ====================================================================
        // PSYCHIC
        // ====================================================================
        damaging("Psychic", Type::PSYCHIC, SPEC, 90, 100),
        damaging("Psyshock", Type::PSYCHIC, SPEC, 80, 100),
        damaging("Psycho Cut", Type::PSYCHIC, PHYS, 70, 100, SLICING),
        damaging("Zen Headbutt", Type::PSYCHIC, PHYS, 80, 90, CONTACT),
        damaging("Expanding Force", Type::PSYCHIC, SPEC, 80, 100),
        with_power(damaging("Stored Power", Type::PSYCHIC, SPEC, 20, 100),
                   VariablePowerKind::STORED_POWER, 20, 860),
        status("Calm Mind", Type::PSYCHIC, ALWAYS, Status::NONE, SETUP),
        status("Trick Room", Type::PSYCHIC, ALWAYS, Status::NONE, 0, -7),
        status("Rest", Type::PSYCHIC, ALWAYS, Status::NONE, HEALING),

        // ====================================================================
        // BUG
        // ====================================================================
        damaging("U-turn", Type::BUG, PHYS, 70, 100, CONTACT | PIVOT),
        damaging("Bug Buzz", Type::BUG, SPEC, 90, 100, SOUND),
        with_drain(damaging("Leech Life", Type::BUG, PHYS, 80, 100, CONTACT), 0.5),
        damaging("First Impression", Type::BUG, PHYS, 90, 100, CONTACT, 2),
        damaging("X-Scissor", Type::BUG, PHYS, 80, 100, CONTACT | SLICING),
        with_hits(damaging("Pin Missile", Type::BUG, PHYS, 25, 95), 2, 5),
        status("Sticky Web", Type::BUG, ALWAYS, Status::NONE, HAZARD),
        status("Quiver Dance", Type::BUG, ALWAYS, Status::NONE, SETUP),

        // ====================================================================
        // ROCK
        // ====================================================================
        damaging("Stone Edge", Type::ROCK, PHYS, 100, 80),
        damaging("Rock Slide", Type::ROCK, PHYS, 75, 90),
        damaging("Power Gem", Type::ROCK, SPEC, 80, 100),
        with_recoil(damaging("Head Smash", Type::ROCK, PHYS, 150, 80, CONTACT), 0.5),
        with_hits(damaging("Rock Blast", Type::ROCK, PHYS, 25, 90, BULLET), 2, 5),
        damaging("Accelerock", Type::ROCK, PHYS, 40, 100, CONTACT, 1),
        status("Stealth Rock", Type::ROCK, ALWAYS, Status::NONE, HAZARD),

        // ====================================================================
        // GHOST
        // ====================================================================
        damaging("Shadow Ball", Type::GHOST, SPEC, 80, 100, BULLET),
        damaging("Shadow Claw", Type::GHOST, PHYS, 70, 100, CONTACT),
        damaging("Poltergeist", Type::GHOST, PHYS, 110, 90),
        damaging("Shadow Sneak", Type::GHOST, PHYS, 40, 100, CONTACT, 1),
        with_power(damaging("Hex", Type::GHOST, SPEC, 65, 100),
                   VariablePowerKind::HEX, 65, 130),
        with_fixed(damaging("Night Shade", Type::GHOST, SPEC, 0, 100),
                   FixedDamageKind::LEVEL),

        // ====================================================================
        // DRAGON
        // ====================================================================
        damaging("Draco Meteor", Type::DRAGON, SPEC, 130, 90),
        damaging("Dragon Claw", Type::DRAGON, PHYS, 80, 100, CONTACT),
        damaging("Outrage", Type::DRAGON, PHYS, 120, 100, CONTACT),
        damaging("Dragon Pulse", Type::DRAGON, SPEC, 85, 100, PULSE),
        with_hits(damaging("Dragon Darts", Type::DRAGON, PHYS, 50, 100), 2, 2),
        with_hits(damaging("Scale Shot", Type::DRAGON, PHYS, 25, 90), 2, 5),
        with_fixed(damaging("Dragon Rage", Type::DRAGON, SPEC, 0, 100),
                   FixedDamageKind::CONSTANT, 40),
        status("Dragon Dance", Type::DRAGON, ALWAYS, Status::NONE, SETUP),

        // ====================================================================
        // DARK
        // ====================================================================
        with_power(damaging("Knock Off", Type::DARK, PHYS, 65, 100, CONTACT),
                   VariablePowerKind::KNOCK_OFF, 65, 97),
        damaging("Crunch", Type::DARK, PHYS, 80, 100, CONTACT | BITE),
        damaging("Dark Pulse", Type::DARK, SPEC, 80, 100, PULSE),
        damaging("Sucker Punch", Type::DARK, PHYS, 70, 100, CONTACT, 1),
        damaging("Throat Chop", Type::DARK, PHYS, 80, 100, CONTACT),
        damaging("Kowtow Cleave", Type::DARK, PHYS, 85, ALWAYS, CONTACT | SLICING),
        status("Nasty Plot", Type::DARK, ALWAYS, Status::NONE, SETUP),
        status("Taunt", Type::DARK, 100),
        status("Parting Shot", Type::DARK, 100, Status::NONE, SOUND | PIVOT),

        // ====================================================================
        // STEEL
        // ====================================================================
        damaging("Iron Head", Type::STEEL, PHYS, 80, 100, CONTACT),
        damaging("Flash Cannon", Type::STEEL, SPEC, 80, 100),
        damaging("Meteor Mash", Type::STEEL, PHYS, 90, 90, CONTACT | PUNCH),
        damaging("Bullet Punch", Type::STEEL, PHYS, 40, 100, CONTACT | PUNCH, 1),
        damaging("Make It Rain", Type::STEEL, SPEC, 120, 100),
        with_power(damaging("Gyro Ball", Type::STEEL, PHYS, 1, 100, CONTACT | BULLET),
                   VariablePowerKind::GYRO_BALL, 1, 150),
        with_power(damaging("Heavy Slam", Type::STEEL, PHYS, 40, 100, CONTACT),
                   VariablePowerKind::WEIGHT_RATIO, 40, 120),
        status("Iron Defense", Type::STEEL, ALWAYS, Status::NONE, SETUP),

        // ====================================================================
        // FAIRY
        // ====================================================================
        damaging("Moonblast", Type::FAIRY, SPEC, 95, 100),
        damaging("Play Rough", Type::FAIRY, PHYS, 90, 90, CONTACT),
        damaging("Dazzling Gleam", Type::FAIRY, SPEC, 80, 100),
        damaging("Spirit Break", Type::FAIRY, PHYS, 75, 100, CONTACT),
        with_drain(damaging("Draining Kiss", Type::FAIRY, SPEC, 50, 100, CONTACT), 0.75),
        status("Moonlight", Type::FAIRY, ALWAYS, Status::NONE, HEALING),
    };
}

} // namespace tailglow
