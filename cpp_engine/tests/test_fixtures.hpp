/**
 * Shared fixtures for the engine tests.
 */

#pragma once

#include "tailglow_engine.hpp"

namespace tailglow {
namespace testing {

inline StatBlock base_stats(int hp, int atk, int def, int spa, int spd, int spe) {
    StatBlock block;
    block.hp = hp;
    block.atk = atk;
    block.def = def;
    block.spa = spa;
    block.spd = spd;
    block.spe = spe;
    return block;
}

/**
 * Level 100 combatant with revealed-empty item and ability so no effect
 * applies unless a test sets one.
 */
inline Combatant make_mon(const CombatantID& id, SideID side, Type type1, Type type2,
                          const StatBlock& base, int level = 100) {
    Combatant c(id, id, side);
    c.type1 = type1;
    c.type2 = type2;
    c.base_stats = base;
    c.level = level;
    c.item = std::string();
    c.ability = std::string();
    return c;
}

// Ground attacker: base Atk 130 -> 317 at level 100
inline Combatant ground_attacker(SideID side = OUR_SIDE) {
    Combatant c = make_mon("Digger", side, Type::GROUND, Type::NONE,
                           base_stats(100, 130, 100, 80, 100, 90));
    c.known_moves = {"earthquake"};
    return c;
}

// Fire defender: 300 HP, 251 Def at level 100
inline Combatant fire_defender(SideID side = THEIR_SIDE) {
    Combatant c = make_mon("Ember", side, Type::FIRE, Type::NONE,
                           base_stats(69, 60, 97, 80, 97, 80));
    return c;
}

/**
 * Move table, registry and config wired together the way the analyzer does.
 */
struct EngineFixture {
    MoveDatabase moves;
    EffectRegistry effects;
    AnalysisConfig config;

    EngineFixture() {
        effects::register_all_effects(effects);
    }

    DamageCalculator calculator() const { return DamageCalculator(moves, effects); }
    SpeedResolver speed() const { return SpeedResolver(moves, effects); }
};

struct SimulatorFixture {
    EngineFixture engine;
    DamageCalculator calculator;
    SpeedResolver speed;
    MatchupSimulator simulator;

    SimulatorFixture()
        : calculator(engine.moves, engine.effects)
        , speed(engine.moves, engine.effects)
        , simulator(calculator, speed, engine.config)
    {}
};

// Bulky, weak attacker: Body Slam does about 1.3% per turn to another wall
inline Combatant make_wall(const CombatantID& id, SideID side, int speed_base) {
    Combatant c = make_mon(id, side, Type::WATER, Type::NONE,
                           base_stats(250, 5, 250, 5, 250, speed_base));
    c.known_moves = {"bodyslam"};
    return c;
}

} // namespace testing
} // namespace tailglow
