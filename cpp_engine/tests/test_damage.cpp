/**
 * Tests for Stats, Type Chart and Damage Calculator
 */

#include "test_fixtures.hpp"

using namespace tailglow;
using namespace tailglow::testing;

// ============================================================================
// STAT FORMULA TESTS
// ============================================================================

TEST(Stats, HpFormula) {
    TEST_ASSERT_EQ(300, calc_hp_stat(69, 100));
    TEST_ASSERT_EQ(1, calc_hp_stat(1, 100));
}

TEST(Stats, OtherStatFormula) {
    TEST_ASSERT_EQ(317, calc_stat(130, 100));
    TEST_ASSERT_EQ(251, calc_stat(97, 100));
    TEST_ASSERT_EQ(237, calc_stat(90, 100));
}

TEST(Stats, StageMultipliers) {
    TEST_ASSERT_EQ(475, apply_stage(317, 1));
    TEST_ASSERT_EQ(634, apply_stage(317, 2));
    TEST_ASSERT_EQ(200, apply_stage(300, -1));
    TEST_ASSERT_EQ(75, apply_stage(300, -6));
    TEST_ASSERT_EQ(apply_stage(100, 6), apply_stage(100, 9));
}

TEST(Stats, CombatantUsesKnownStatsFirst) {
    Combatant c = ground_attacker();
    TEST_ASSERT_EQ(317, c.stat(Stat::ATK));

    StatBlock exact = base_stats(341, 359, 226, 176, 206, 333);
    c.known_stats = exact;
    TEST_ASSERT_EQ(359, c.stat(Stat::ATK));
    TEST_ASSERT_EQ(341, c.max_hp());
}

TEST(Stats, CurrentHpRoundsAndStaysPositive) {
    Combatant c = fire_defender();
    c.hp_percent = 50.0;
    TEST_ASSERT_EQ(150, c.current_hp());

    c.hp_percent = 0.1;
    TEST_ASSERT_EQ(1, c.current_hp());

    c.fainted = true;
    TEST_ASSERT_EQ(0, c.current_hp());
}

// ============================================================================
// TYPE CHART TESTS
// ============================================================================

TEST(TypeChart, SingleTypes) {
    TEST_ASSERT_NEAR(2.0, type_effectiveness(Type::GROUND, Type::FIRE), 1e-9);
    TEST_ASSERT_NEAR(0.0, type_effectiveness(Type::GROUND, Type::FLYING), 1e-9);
    TEST_ASSERT_NEAR(0.0, type_effectiveness(Type::NORMAL, Type::GHOST), 1e-9);
    TEST_ASSERT_NEAR(0.5, type_effectiveness(Type::FIRE, Type::WATER), 1e-9);
    TEST_ASSERT_NEAR(1.0, type_effectiveness(Type::FIRE, Type::NONE), 1e-9);
}

TEST(TypeChart, DualTypesMultiply) {
    TEST_ASSERT_NEAR(4.0, type_effectiveness(Type::ELECTRIC, Type::WATER, Type::FLYING), 1e-9);
    TEST_ASSERT_NEAR(0.25, type_effectiveness(Type::FIRE, Type::WATER, Type::ROCK), 1e-9);
    TEST_ASSERT_NEAR(0.0, type_effectiveness(Type::ELECTRIC, std::vector<Type>{Type::WATER, Type::GROUND}), 1e-9);
}

TEST(TypeChart, ParseTypeNames) {
    TEST_ASSERT_TRUE(parse_type("Fire") == Type::FIRE);
    TEST_ASSERT_TRUE(parse_type("fairy") == Type::FAIRY);
    TEST_ASSERT_TRUE(parse_type("???") == Type::NONE);
}

// ============================================================================
// FIXED-POINT HELPER TESTS
// ============================================================================

TEST(DamageCalculator, ChainModifierRoundsHalfDown) {
    TEST_ASSERT_EQ(136, DamageCalculator::chain_modifier(91, 1.5));
    TEST_ASSERT_EQ(162, DamageCalculator::chain_modifier(324, 0.5));
    TEST_ASSERT_EQ(100, DamageCalculator::chain_modifier(100, 1.0));
}

TEST(DamageCalculator, EffectivenessByDoubling) {
    TEST_ASSERT_EQ(272, DamageCalculator::apply_effectiveness(136, 2.0));
    TEST_ASSERT_EQ(544, DamageCalculator::apply_effectiveness(136, 4.0));
    TEST_ASSERT_EQ(25, DamageCalculator::apply_effectiveness(101, 0.25));
    TEST_ASSERT_EQ(0, DamageCalculator::apply_effectiveness(101, 0.0));
}

// ============================================================================
// STANDARD DAMAGE TESTS
// ============================================================================

TEST(DamageCalculator, SuperEffectiveStabRolls) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", fire_defender(), field);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_TRUE(r.error == AnalysisError::NONE);
    TEST_ASSERT_TRUE(r.move_type == Type::GROUND);
    TEST_ASSERT_NEAR(2.0, r.type_effectiveness, 1e-9);
    TEST_ASSERT_FALSE(r.immune);

    const int expected[DAMAGE_ROLL_COUNT] = {
        272, 276, 278, 284, 288, 290, 294, 296,
        300, 302, 306, 308, 312, 314, 318, 324
    };
    for (int i = 0; i < DAMAGE_ROLL_COUNT; i++) {
        TEST_ASSERT_EQ(expected[i], r.range.rolls[i]);
    }

    TEST_ASSERT_EQ(272, r.range.min_damage);
    TEST_ASSERT_EQ(324, r.range.max_damage);
    TEST_ASSERT_NEAR(90.6667, r.range.min_percent, 1e-3);
    TEST_ASSERT_NEAR(108.0, r.range.max_percent, 1e-9);
    TEST_ASSERT_NEAR(0.5, r.range.ko_probability, 1e-9);
}

TEST(DamageCalculator, RollsAreMonotonic) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.known_moves = {"stoneedge", "knockoff", "closecombat"};
    Combatant defender = fire_defender();

    for (const MoveID& move : attacker.known_moves) {
        DamageResult r = calc.compute_damage(attacker, move, defender, field);
        TEST_ASSERT_TRUE(r.success);
        for (int i = 1; i < DAMAGE_ROLL_COUNT; i++) {
            TEST_ASSERT_TRUE(r.range.rolls[i - 1] <= r.range.rolls[i]);
        }
        TEST_ASSERT_TRUE(r.range.min_percent <= r.range.expected_percent);
        TEST_ASSERT_TRUE(r.range.expected_percent <= r.range.max_percent);
    }
}

TEST(DamageCalculator, KoProbabilityRisesAtLowerHp) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.hp_percent = 50.0;
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_NEAR(1.0, r.range.ko_probability, 1e-9);

    // Percentages stay relative to max HP
    TEST_ASSERT_NEAR(108.0, r.range.max_percent, 1e-9);
}

// ============================================================================
// ERROR CASE TESTS
// ============================================================================

TEST(DamageCalculator, StatusMoveIsInvalidKind) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    DamageResult r = calc.compute_damage(ground_attacker(), "swordsdance", fire_defender(), field);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_TRUE(r.error == AnalysisError::INVALID_MOVE_KIND);
}

TEST(DamageCalculator, UnknownMoveIsInsufficientData) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    DamageResult r = calc.compute_damage(ground_attacker(), "notarealmove", fire_defender(), field);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_TRUE(r.error == AnalysisError::INSUFFICIENT_DATA);
}

TEST(DamageCalculator, MissingStatsIsInsufficientData) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.base_stats = StatBlock();
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_TRUE(r.error == AnalysisError::INSUFFICIENT_DATA);
    TEST_ASSERT_TRUE(r.note.find("Ember") != std::string::npos);
}

// ============================================================================
// IMMUNITY TESTS
// ============================================================================

TEST(DamageCalculator, FlyingTypeIgnoresGroundMoves) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.type2 = Type::FLYING;
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_TRUE(r.immune);
    TEST_ASSERT_TRUE(r.range.is_zero());
    TEST_ASSERT_NEAR(0.0, r.range.ko_probability, 1e-9);
}

TEST(DamageCalculator, LevitateIgnoresGroundMoves) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.ability = std::string("levitate");
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_TRUE(r.immune);
    TEST_ASSERT_EQ(0, r.range.max_damage);
}

TEST(DamageCalculator, IronBallGroundsFlyingType) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.type2 = Type::FLYING;
    defender.item = std::string("ironball");
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_FALSE(r.immune);
    TEST_ASSERT_TRUE(r.range.max_damage > 0);
}

TEST(DamageCalculator, UnrevealedAbilityGrantsNothing) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.ability = std::nullopt;
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_FALSE(r.immune);
    TEST_ASSERT_EQ(324, r.range.max_damage);
}

// ============================================================================
// MODIFIER TESTS
// ============================================================================

TEST(DamageCalculator, FocusSashLeavesOneHp) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.item = std::string("focussash");
    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_EQ(299, r.range.max_damage);
    TEST_ASSERT_NEAR(0.0, r.range.ko_probability, 1e-9);

    // Not at full HP: no protection
    defender.hp_percent = 99.0;
    r = calc.compute_damage(ground_attacker(), "earthquake", defender, field);
    TEST_ASSERT_EQ(324, r.range.max_damage);
    TEST_ASSERT_NEAR(0.5, r.range.ko_probability, 1e-9);
}

TEST(DamageCalculator, ReflectHalvesPhysicalDamage) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;
    field.side(THEIR_SIDE).reflect_turns = 5;

    DamageResult r = calc.compute_damage(ground_attacker(), "earthquake", fire_defender(), field);
    TEST_ASSERT_EQ(162, r.range.max_damage);
    TEST_ASSERT_NEAR(0.0, r.range.ko_probability, 1e-9);

    // Screens on the attacker's own side change nothing
    FieldState own_side;
    own_side.side(OUR_SIDE).reflect_turns = 5;
    r = calc.compute_damage(ground_attacker(), "earthquake", fire_defender(), own_side);
    TEST_ASSERT_EQ(324, r.range.max_damage);
}

TEST(DamageCalculator, BurnHalvesPhysicalDamage) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.status = Status::BURN;
    DamageResult r = calc.compute_damage(attacker, "earthquake", fire_defender(), field);
    TEST_ASSERT_EQ(162, r.range.max_damage);

    attacker.ability = std::string("guts");
    r = calc.compute_damage(attacker, "earthquake", fire_defender(), field);
    TEST_ASSERT_TRUE(r.range.max_damage > 324);
}

TEST(DamageCalculator, LifeOrbBoostsFinalDamage) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.item = std::string("lifeorb");
    DamageResult r = calc.compute_damage(attacker, "earthquake", fire_defender(), field);
    TEST_ASSERT_EQ(421, r.range.max_damage);
    TEST_ASSERT_NEAR(1.0, r.range.ko_probability, 1e-9);
}

TEST(DamageCalculator, TeraIntoOriginalTypeDoublesStab) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.tera_type = Type::GROUND;
    attacker.terastallized = true;
    DamageResult r = calc.compute_damage(attacker, "earthquake", fire_defender(), field);
    TEST_ASSERT_EQ(364, r.range.rolls[0]);

    // Declared but not yet used
    attacker.terastallized = false;
    r = calc.compute_damage(attacker, "earthquake", fire_defender(), field);
    TEST_ASSERT_EQ(272, r.range.rolls[0]);
}

TEST(DamageCalculator, UnawareIgnoresAttackBoosts) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.boosts.set(Stat::ATK, 2);
    Combatant defender = fire_defender();

    DamageResult boosted = calc.compute_damage(attacker, "earthquake", defender, field);
    TEST_ASSERT_TRUE(boosted.range.max_damage > 324);

    defender.ability = std::string("unaware");
    DamageResult ignored = calc.compute_damage(attacker, "earthquake", defender, field);
    TEST_ASSERT_EQ(324, ignored.range.max_damage);
}

TEST(DamageCalculator, WeatherBallChangesTypeInRain) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;
    field.weather = Weather::RAIN;

    const MoveDef* weather_ball = fx.moves.get_move("weatherball");
    TEST_ASSERT_NOT_NULL(weather_ball);
    TEST_ASSERT_TRUE(calc.resolve_move_type(ground_attacker(), *weather_ball, field) == Type::WATER);

    DamageResult r = calc.compute_damage(ground_attacker(), *weather_ball, fire_defender(), field);
    TEST_ASSERT_TRUE(r.move_type == Type::WATER);
    TEST_ASSERT_EQ(100, r.resolved_power);
    TEST_ASSERT_NEAR(2.0, r.type_effectiveness, 1e-9);

    FieldState clear;
    r = calc.compute_damage(ground_attacker(), *weather_ball, fire_defender(), clear);
    TEST_ASSERT_TRUE(r.move_type == Type::NORMAL);
    TEST_ASSERT_EQ(50, r.resolved_power);
}

// ============================================================================
// VARIABLE POWER TESTS
// ============================================================================

TEST(DamageCalculator, KnockOffEstimatesUnknownItem) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.item = std::nullopt;
    DamageResult r = calc.compute_damage(ground_attacker(), "knockoff", defender, field);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_TRUE(r.is_estimated);
    TEST_ASSERT_TRUE(r.error == AnalysisError::INSUFFICIENT_DATA);
    TEST_ASSERT_EQ(65, r.resolved_power);
    TEST_ASSERT_TRUE(r.range.max_damage > 0);
}

TEST(DamageCalculator, KnockOffBoostsAgainstKnownItem) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.item = std::string("leftovers");
    DamageResult r = calc.compute_damage(ground_attacker(), "knockoff", defender, field);
    TEST_ASSERT_FALSE(r.is_estimated);
    TEST_ASSERT_TRUE(r.error == AnalysisError::NONE);
    TEST_ASSERT_EQ(97, r.resolved_power);

    defender.item = std::string();
    r = calc.compute_damage(ground_attacker(), "knockoff", defender, field);
    TEST_ASSERT_EQ(65, r.resolved_power);
}

TEST(DamageCalculator, LowKickNeedsTargetWeight) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    DamageResult r = calc.compute_damage(ground_attacker(), "lowkick", defender, field);
    TEST_ASSERT_TRUE(r.is_estimated);
    TEST_ASSERT_EQ(20, r.resolved_power);

    defender.weight_kg = 95.0;
    r = calc.compute_damage(ground_attacker(), "lowkick", defender, field);
    TEST_ASSERT_FALSE(r.is_estimated);
    TEST_ASSERT_EQ(80, r.resolved_power);
}

// ============================================================================
// MULTI-HIT TESTS
// ============================================================================

TEST(DamageCalculator, MultiHitRange) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    DamageResult r = calc.compute_damage(ground_attacker(), "rockblast", fire_defender(), field);
    TEST_ASSERT_EQ(2, r.hits_min);
    TEST_ASSERT_EQ(5, r.hits_max);
    TEST_ASSERT_EQ(r.range.rolls[0] * 2, r.range.min_damage);
    TEST_ASSERT_EQ(r.range.rolls[15] * 5, r.range.max_damage);

    // 2-5 hits average 3.1
    double mean = 0.0;
    for (int roll : r.range.rolls) mean += roll;
    mean /= DAMAGE_ROLL_COUNT;
    TEST_ASSERT_NEAR(mean * 3.1 * 100.0 / 300.0, r.range.expected_percent, 1e-6);
}

TEST(DamageCalculator, SkillLinkAlwaysMaxHits) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.ability = std::string("skilllink");
    DamageResult r = calc.compute_damage(attacker, "rockblast", fire_defender(), field);
    TEST_ASSERT_EQ(5, r.hits_min);
    TEST_ASSERT_EQ(5, r.hits_max);
    TEST_ASSERT_EQ(r.range.rolls[0] * 5, r.range.min_damage);
}

// ============================================================================
// FIXED DAMAGE AND OHKO TESTS
// ============================================================================

TEST(DamageCalculator, SeismicTossDealsLevel) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.level = 88;
    DamageResult r = calc.compute_damage(attacker, "seismictoss", fire_defender(), field);
    TEST_ASSERT_EQ(88, r.range.min_damage);
    TEST_ASSERT_EQ(88, r.range.max_damage);
    TEST_ASSERT_NEAR(88.0 / 3.0, r.range.expected_percent, 1e-6);
    TEST_ASSERT_NEAR(0.0, r.range.ko_probability, 1e-9);
}

TEST(DamageCalculator, SuperFangHalvesCurrentHp) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.hp_percent = 50.0;
    DamageResult r = calc.compute_damage(ground_attacker(), "superfang", defender, field);
    TEST_ASSERT_EQ(75, r.range.max_damage);
    TEST_ASSERT_NEAR(25.0, r.range.max_percent, 1e-9);
}

TEST(DamageCalculator, SheerColdChanceScalesWithLevel) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant defender = fire_defender();
    defender.level = 90;
    DamageResult r = calc.compute_damage(ground_attacker(), "sheercold", defender, field);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_NEAR(0.4, r.range.ko_probability, 1e-9);
    TEST_ASSERT_NEAR(100.0, r.range.max_percent, 1e-9);
    TEST_ASSERT_NEAR(40.0, r.range.expected_percent, 1e-9);
}

TEST(DamageCalculator, SheerColdFailsAgainstHigherLevel) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.level = 80;
    DamageResult r = calc.compute_damage(attacker, "sheercold", fire_defender(), field);
    TEST_ASSERT_NEAR(0.0, r.range.ko_probability, 1e-9);
    TEST_ASSERT_TRUE(r.range.is_zero());
}

TEST(DamageCalculator, SheerColdBlockedByIceAndSturdy) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant ice = make_mon("Frost", THEIR_SIDE, Type::ICE, Type::NONE,
                             base_stats(70, 70, 70, 70, 70, 70));
    DamageResult r = calc.compute_damage(ground_attacker(), "sheercold", ice, field);
    TEST_ASSERT_TRUE(r.immune);

    Combatant sturdy = fire_defender();
    sturdy.ability = std::string("sturdy");
    r = calc.compute_damage(ground_attacker(), "sheercold", sturdy, field);
    TEST_ASSERT_TRUE(r.immune);
}

// ============================================================================
// MOVE CHOICE TESTS
// ============================================================================

TEST(DamageCalculator, StrongestMovePrefersExpectedDamage) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.known_moves = {"swordsdance", "stoneedge", "earthquake"};

    ChosenMove vs_fire = calc.strongest_move(attacker, fire_defender(), field);
    TEST_ASSERT_TRUE(vs_fire.found);
    TEST_ASSERT_EQ(std::string("earthquake"), vs_fire.move_id);

    Combatant bird = fire_defender();
    bird.type2 = Type::FLYING;
    ChosenMove vs_bird = calc.strongest_move(attacker, bird, field);
    TEST_ASSERT_EQ(std::string("stoneedge"), vs_bird.move_id);
    TEST_ASSERT_EQ(80, vs_bird.accuracy_rank);
}

TEST(DamageCalculator, StrongestMoveIncludesInferredMoves) {
    EngineFixture fx;
    DamageCalculator calc = fx.calculator();
    FieldState field;

    Combatant attacker = ground_attacker();
    attacker.known_moves = {"swordsdance"};
    TEST_ASSERT_FALSE(calc.strongest_move(attacker, fire_defender(), field).found);

    attacker.inferred_moves = {"earthquake"};
    ChosenMove chosen = calc.strongest_move(attacker, fire_defender(), field);
    TEST_ASSERT_TRUE(chosen.found);
    TEST_ASSERT_EQ(std::string("earthquake"), chosen.move_id);
}
