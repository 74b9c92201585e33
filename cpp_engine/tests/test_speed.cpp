/**
 * Tests for the Speed/Priority Resolver
 */

#include <random>
#include "test_fixtures.hpp"

using namespace tailglow;
using namespace tailglow::testing;

// ============================================================================
// EFFECTIVE SPEED TESTS
// ============================================================================

TEST(SpeedResolver, BaseAndStagedSpeed) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    Combatant mon = ground_attacker();
    TEST_ASSERT_EQ(237, speed.effective_speed(mon, field));

    mon.boosts.set(Stat::SPE, 1);
    TEST_ASSERT_EQ(355, speed.effective_speed(mon, field));

    mon.boosts.set(Stat::SPE, -1);
    TEST_ASSERT_EQ(158, speed.effective_speed(mon, field));
}

TEST(SpeedResolver, ChoiceScarfAndTailwind) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    Combatant mon = ground_attacker();
    mon.item = std::string("choicescarf");
    TEST_ASSERT_EQ(355, speed.effective_speed(mon, field));

    field.side(OUR_SIDE).tailwind_turns = 3;
    TEST_ASSERT_EQ(710, speed.effective_speed(mon, field));

    // Tailwind only helps its own side
    Combatant foe = fire_defender();
    TEST_ASSERT_EQ(217, speed.effective_speed(foe, field));
}

TEST(SpeedResolver, ParalysisHalvesSpeed) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    Combatant mon = ground_attacker();
    mon.status = Status::PARALYSIS;
    TEST_ASSERT_EQ(118, speed.effective_speed(mon, field));

    mon.ability = std::string("quickfeet");
    TEST_ASSERT_EQ(355, speed.effective_speed(mon, field));
}

TEST(SpeedResolver, UnrevealedItemAddsNothing) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    Combatant mon = ground_attacker();
    mon.item = std::nullopt;
    TEST_ASSERT_EQ(237, speed.effective_speed(mon, field));
}

// ============================================================================
// PRIORITY TESTS
// ============================================================================

TEST(SpeedResolver, MovePriorityTiers) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;
    Combatant mon = ground_attacker();

    TEST_ASSERT_EQ(0, speed.move_priority(mon, *fx.moves.get_move("earthquake"), field));
    TEST_ASSERT_EQ(1, speed.move_priority(mon, *fx.moves.get_move("aquajet"), field));
    TEST_ASSERT_EQ(2, speed.move_priority(mon, *fx.moves.get_move("extremespeed"), field));
    TEST_ASSERT_EQ(-7, speed.move_priority(mon, *fx.moves.get_move("trickroom"), field));
}

TEST(SpeedResolver, PranksterBoostsStatusMoves) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    Combatant mon = ground_attacker();
    mon.ability = std::string("prankster");
    TEST_ASSERT_EQ(1, speed.move_priority(mon, *fx.moves.get_move("thunderwave"), field));
    TEST_ASSERT_EQ(0, speed.move_priority(mon, *fx.moves.get_move("earthquake"), field));
}

TEST(SpeedResolver, GrassyGlideInGrassyTerrain) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;
    Combatant mon = ground_attacker();
    const MoveDef* glide = fx.moves.get_move("grassyglide");
    TEST_ASSERT_NOT_NULL(glide);

    TEST_ASSERT_EQ(0, speed.move_priority(mon, *glide, field));
    field.terrain = Terrain::GRASSY;
    TEST_ASSERT_EQ(1, speed.move_priority(mon, *glide, field));
}

TEST(SpeedResolver, UnknownMoveActsAtPriorityZero) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    BattleAction action = speed.make_move_action(ground_attacker(), "mysterymove", field);
    TEST_ASSERT_EQ(0, action.priority);
    TEST_ASSERT_EQ(std::string("mysterymove"), action.move_id);
    TEST_ASSERT_EQ(237, action.speed);
}

TEST(SpeedResolver, SwitchActionPriority) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    BattleAction sw = speed.make_switch_action(fire_defender(), field);
    TEST_ASSERT_TRUE(sw.kind == OptionKind::SWITCH);
    TEST_ASSERT_EQ(SWITCH_PRIORITY, sw.priority);

    BattleAction fast = speed.make_move_action(ground_attacker(), "extremespeed", field);
    OrderResult order = SpeedResolver::resolve_order(fast, sw, field);
    TEST_ASSERT_TRUE(order.b_first());
}

// ============================================================================
// ORDERING TESTS
// ============================================================================

TEST(SpeedResolver, FasterMovesFirst) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    OrderResult order = speed.order_moves(ground_attacker(), "earthquake",
                                          fire_defender(), "flamethrower", field);
    TEST_ASSERT_TRUE(order.success);
    TEST_ASSERT_TRUE(order.a_first());
    TEST_ASSERT_EQ(237, order.speed_a);
    TEST_ASSERT_EQ(217, order.speed_b);
}

TEST(SpeedResolver, PriorityBeatsSpeed) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    OrderResult order = speed.order_moves(ground_attacker(), "earthquake",
                                          fire_defender(), "aquajet", field);
    TEST_ASSERT_TRUE(order.b_first());
    TEST_ASSERT_EQ(1, order.priority_b);
}

TEST(SpeedResolver, TrickRoomInvertsSpeedOnly) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;
    field.trick_room_turns = 4;

    OrderResult order = speed.order_moves(ground_attacker(), "earthquake",
                                          fire_defender(), "flamethrower", field);
    TEST_ASSERT_TRUE(order.trick_room);
    TEST_ASSERT_TRUE(order.b_first());

    // Priority still decides first
    order = speed.order_moves(ground_attacker(), "aquajet",
                              fire_defender(), "flamethrower", field);
    TEST_ASSERT_TRUE(order.a_first());
}

TEST(SpeedResolver, SpeedTieIsUndetermined) {
    EngineFixture fx;
    SpeedResolver speed = fx.speed();
    FieldState field;

    Combatant a = ground_attacker();
    Combatant b = ground_attacker(THEIR_SIDE);
    OrderResult order = speed.order_moves(a, "earthquake", b, "earthquake", field);
    TEST_ASSERT_FALSE(order.success);
    TEST_ASSERT_TRUE(order.error == AnalysisError::UNDETERMINED_ORDER);
    TEST_ASSERT_TRUE(order.undetermined());

    field.trick_room_turns = 2;
    order = speed.order_moves(a, "earthquake", b, "earthquake", field);
    TEST_ASSERT_TRUE(order.undetermined());
}

TEST(SpeedResolver, RandomActionsFollowOrderingRules) {
    std::mt19937 rng(20241019);
    std::uniform_int_distribution<int> priority_dist(-7, 7);
    std::uniform_int_distribution<int> speed_dist(1, 40);
    std::bernoulli_distribution trick_room_dist(0.3);

    for (int i = 0; i < 2000; i++) {
        BattleAction a;
        BattleAction b;
        a.priority = priority_dist(rng);
        b.priority = priority_dist(rng);
        a.speed = speed_dist(rng);
        b.speed = speed_dist(rng);
        b.side = THEIR_SIDE;

        FieldState field;
        field.trick_room_turns = trick_room_dist(rng) ? 3 : 0;

        OrderResult ab = SpeedResolver::resolve_order(a, b, field);
        OrderResult ba = SpeedResolver::resolve_order(b, a, field);

        if (a.priority != b.priority) {
            TEST_ASSERT_EQ(a.priority > b.priority, ab.a_first());
        } else if (a.speed == b.speed) {
            TEST_ASSERT_TRUE(ab.undetermined());
            TEST_ASSERT_TRUE(ab.error == AnalysisError::UNDETERMINED_ORDER);
        } else {
            bool a_faster = a.speed > b.speed;
            TEST_ASSERT_EQ(field.trick_room() ? !a_faster : a_faster, ab.a_first());
        }

        // Swapping the arguments mirrors the result
        TEST_ASSERT_EQ(ab.a_first(), ba.b_first());
        TEST_ASSERT_EQ(ab.undetermined(), ba.undetermined());
    }
}
