/**
 * Tests for the Battle Analyzer and X-Ray logging
 */

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "test_fixtures.hpp"

using namespace tailglow;
using namespace tailglow::testing;

namespace {

// Digger (+ Backup on the bench) vs a lone Ember that knows Flamethrower
BattleSnapshot duel_snapshot(const std::string& battle_id) {
    BattleSnapshot snap;
    snap.battle_id = battle_id;
    snap.turn = 1;

    snap.ours().team.push_back(ground_attacker());
    snap.ours().team.push_back(make_wall("Backup", OUR_SIDE, 50));
    snap.ours().active_index = 0;
    snap.ours().team[0].active = true;

    Combatant ember = fire_defender();
    ember.known_moves = {"flamethrower"};
    ember.active = true;
    snap.theirs().team.push_back(ember);
    snap.theirs().active_index = 0;

    snap.legal_moves = {"earthquake"};
    return snap;
}

const char* const ANALYZER_SPECIES = R"({
  "species": {
    "Garchomp": {
      "types": ["Dragon", "Ground"],
      "baseStats": {"hp": 108, "atk": 130, "def": 95, "spa": 80, "spd": 85, "spe": 102},
      "level": 77,
      "abilities": ["Rough Skin"],
      "moves": ["Earthquake", "Stone Edge", "Swords Dance"]
    },
    "Ember": {
      "types": ["Fire"],
      "baseStats": {"hp": 69, "atk": 60, "def": 97, "spa": 80, "spd": 97, "spe": 80},
      "level": 100,
      "abilities": ["Flash Fire", "Flame Body"],
      "items": ["Leftovers", "Heavy-Duty Boots"],
      "moves": ["Flamethrower"]
    }
  }
})";

} // anonymous namespace

// ============================================================================
// TURN ANALYSIS TESTS
// ============================================================================

TEST(BattleAnalyzer, AnalyzesActiveDuel) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    TurnAnalysis analysis = analyzer.analyze_turn(duel_snapshot("battle-a"));
    TEST_ASSERT_TRUE(analyzer.in_battle());
    TEST_ASSERT_EQ(std::string("battle-a"), analyzer.cache()->battle_id());
    TEST_ASSERT_EQ(std::string("Digger"), analysis.our_active);
    TEST_ASSERT_EQ(std::string("Ember"), analysis.their_active);

    TEST_ASSERT_TRUE(analysis.moves.success);
    TEST_ASSERT_NOT_NULL(analysis.moves.best());
    TEST_ASSERT_EQ(std::string("earthquake"), analysis.moves.best()->identifier);

    TEST_ASSERT_TRUE(analysis.active_matchup.has_value());
    TEST_ASSERT_TRUE(analysis.active_matchup->result == MatchupResult::A_WINS);

    TEST_ASSERT_EQ(std::string("flamethrower"), *analysis.prediction.most_likely_move());
    TEST_ASSERT_TRUE(analysis.speed_order.has_value());
    TEST_ASSERT_TRUE(analysis.speed_order->a_first());
    TEST_ASSERT_EQ(237, analysis.our_speed);
    TEST_ASSERT_EQ(217, analysis.their_speed);

    TEST_ASSERT_EQ(1u, analysis.our_damage.size());
    TEST_ASSERT_EQ(1u, analysis.their_damage.size());
    TEST_ASSERT_EQ(1u, analysis.bench_matchups.size());
    TEST_ASSERT_EQ(std::string("Backup"), analysis.bench_matchups[0].ours);

    TEST_ASSERT_TRUE(analysis.invalidated.empty());
    TEST_ASSERT_TRUE(analysis.summary.find("Best move: earthquake") != std::string::npos);
}

TEST(BattleAnalyzer, RepeatedTurnHitsCache) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    BattleSnapshot snap = duel_snapshot("battle-b");

    analyzer.analyze_turn(snap);
    uint64_t hits_before = analyzer.cache()->stats().hits;
    size_t size_before = analyzer.cache()->size();

    TurnAnalysis again = analyzer.analyze_turn(snap);
    TEST_ASSERT_TRUE(again.invalidated.empty());
    TEST_ASSERT_TRUE(analyzer.cache()->stats().hits > hits_before);
    TEST_ASSERT_EQ(size_before, analyzer.cache()->size());
}

TEST(BattleAnalyzer, RevealedItemInvalidatesMatchups) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    BattleSnapshot snap = duel_snapshot("battle-c");
    analyzer.analyze_turn(snap);
    TEST_ASSERT_TRUE(analyzer.cache()->size() > 0);

    // HP changes alone do not invalidate
    snap.theirs().team[0].hp_percent = 60.0;
    TEST_ASSERT_TRUE(analyzer.observe(snap).empty());

    snap.theirs().team[0].item = std::string("leftovers");
    snap.turn = 2;
    TurnAnalysis analysis = analyzer.analyze_turn(snap);
    TEST_ASSERT_EQ(1u, analysis.invalidated.size());
    TEST_ASSERT_EQ(std::string("Ember"), analysis.invalidated[0]);
    TEST_ASSERT_TRUE(analyzer.cache()->stats().invalidations > 0);
}

TEST(BattleAnalyzer, ForcedSwitchRanksOnlySwitches) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    BattleSnapshot snap = duel_snapshot("battle-d");
    snap.ours().active_index = -1;
    snap.ours().team[0].active = false;
    snap.legal_moves.clear();
    snap.force_switch = true;

    TurnAnalysis analysis = analyzer.analyze_turn(snap);
    TEST_ASSERT_TRUE(analysis.our_active.empty());
    TEST_ASSERT_TRUE(analysis.moves.options.empty());
    TEST_ASSERT_EQ(std::string("Forced switch"), analysis.moves.reason);
    TEST_ASSERT_FALSE(analysis.active_matchup.has_value());
    TEST_ASSERT_FALSE(analysis.speed_order.has_value());
    TEST_ASSERT_EQ(2u, analysis.switches.options.size() + analysis.switches.eliminated.size());
}

TEST(BattleAnalyzer, CallerPredictionIsUsedVerbatim) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    BattleSnapshot snap = duel_snapshot("battle-e");
    snap.theirs().team[0].known_moves = {"flamethrower", "aquajet"};
    PredictedAction jet;
    jet.kind = OptionKind::MOVE;
    jet.target = "aquajet";
    jet.probability = 1.0;
    snap.prediction.actions.push_back(jet);

    TurnAnalysis analysis = analyzer.analyze_turn(snap);
    TEST_ASSERT_EQ(1u, analysis.prediction.actions.size());
    TEST_ASSERT_EQ(std::string("aquajet"), *analysis.prediction.most_likely_move());
    TEST_ASSERT_TRUE(analysis.speed_order->b_first());
}

TEST(BattleAnalyzer, CallerPredictionIsReordered) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    BattleSnapshot snap = duel_snapshot("battle-e2");
    snap.theirs().team[0].known_moves = {"flamethrower", "aquajet"};
    snap.prediction.actions.push_back({OptionKind::MOVE, "flamethrower", 0.25});
    snap.prediction.actions.push_back({OptionKind::MOVE, "aquajet", 0.75});

    TurnAnalysis analysis = analyzer.analyze_turn(snap);
    TEST_ASSERT_EQ(2u, analysis.prediction.actions.size());
    TEST_ASSERT_EQ(std::string("aquajet"), *analysis.prediction.most_likely_move());
    TEST_ASSERT_TRUE(analysis.speed_order->b_first());
}

// ============================================================================
// SPEED SCENARIO TESTS
// ============================================================================

TEST(BattleAnalyzer, ScarfScenarioWhileItemUnknown) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    BattleSnapshot snap = duel_snapshot("battle-scarf");
    snap.theirs().team[0].item.reset();
    TurnAnalysis analysis = analyzer.analyze_turn(snap);

    // 217 * 1.5 = 325.5, floored; Digger's 237 no longer moves first
    TEST_ASSERT_EQ(217, analysis.their_speed);
    TEST_ASSERT_TRUE(analysis.their_speed_with_scarf.has_value());
    TEST_ASSERT_EQ(325, *analysis.their_speed_with_scarf);
    TEST_ASSERT_FALSE(*analysis.we_outspeed_if_they_scarf);
    TEST_ASSERT_TRUE(analysis.summary.find("Choice Scarf") != std::string::npos);
    TEST_ASSERT_EQ(325, analysis_to_json(analysis)["speed"]["their_speed_with_scarf"].get<int>());

    snap.field.trick_room_turns = 3;
    TurnAnalysis room = analyzer.analyze_turn(snap);
    TEST_ASSERT_TRUE(*room.we_outspeed_if_they_scarf);
}

TEST(BattleAnalyzer, NoScarfScenarioWhenRuledOut) {
    EngineFixture fx;

    // Item already revealed as nothing
    BattleAnalyzer plain(fx.moves, fx.effects, fx.config);
    TurnAnalysis known = plain.analyze_turn(duel_snapshot("battle-noscarf-1"));
    TEST_ASSERT_FALSE(known.their_speed_with_scarf.has_value());
    TEST_ASSERT_FALSE(known.we_outspeed_if_they_scarf.has_value());

    // Item unknown, but the species never runs a Scarf
    SpeciesDatabase species;
    TEST_ASSERT_TRUE(species.load_from_json_string(ANALYZER_SPECIES));
    BattleAnalyzer informed(fx.moves, fx.effects, fx.config, &species);
    BattleSnapshot snap = duel_snapshot("battle-noscarf-2");
    snap.theirs().team[0].item.reset();
    TurnAnalysis unknown = informed.analyze_turn(snap);
    TEST_ASSERT_FALSE(unknown.their_speed_with_scarf.has_value());
}

TEST(BattleAnalyzer, ListsPriorityMoves) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    BattleSnapshot snap = duel_snapshot("battle-priority");
    snap.legal_moves = {"earthquake", "quickattack"};
    Combatant& ember = snap.theirs().team[0];
    ember.known_moves = {"flamethrower", "aquajet"};
    ember.inferred_moves = {"extremespeed"};

    TurnAnalysis analysis = analyzer.analyze_turn(snap);
    TEST_ASSERT_EQ(1u, analysis.our_priority_moves.size());
    TEST_ASSERT_EQ(std::string("quickattack"), analysis.our_priority_moves[0].move_id);
    TEST_ASSERT_EQ(1, analysis.our_priority_moves[0].priority);

    TEST_ASSERT_EQ(2u, analysis.their_priority_moves.size());
    TEST_ASSERT_EQ(std::string("extremespeed"), analysis.their_priority_moves[0].move_id);
    TEST_ASSERT_EQ(2, analysis.their_priority_moves[0].priority);
    TEST_ASSERT_TRUE(analysis.their_priority_moves[0].estimated);
    TEST_ASSERT_EQ(std::string("aquajet"), analysis.their_priority_moves[1].move_id);
    TEST_ASSERT_FALSE(analysis.their_priority_moves[1].estimated);
}

// ============================================================================
// LIFECYCLE TESTS
// ============================================================================

TEST(BattleAnalyzer, NewBattleIdStartsFreshCache) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);

    analyzer.analyze_turn(duel_snapshot("battle-f1"));
    TEST_ASSERT_TRUE(analyzer.cache()->size() > 0);

    analyzer.begin_battle("battle-f2");
    TEST_ASSERT_EQ(std::string("battle-f2"), analyzer.cache()->battle_id());
    TEST_ASSERT_EQ(0u, analyzer.cache()->size());

    analyzer.analyze_turn(duel_snapshot("battle-f3"));
    TEST_ASSERT_EQ(std::string("battle-f3"), analyzer.cache()->battle_id());

    analyzer.end_battle("won");
    TEST_ASSERT_FALSE(analyzer.in_battle());
    TEST_ASSERT_NULL(analyzer.cache());
}

TEST(BattleAnalyzer, LookupOutsideBattleStillSimulates) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    FieldState field;

    MatchupOutcome out = analyzer.lookup_matchup(ground_attacker(), fire_defender(), field);
    TEST_ASSERT_TRUE(out.result == MatchupResult::A_WINS);
    TEST_ASSERT_NULL(analyzer.cache());
}

TEST(BattleAnalyzer, HpWithinBucketSharesEntry) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    analyzer.begin_battle("battle-g");
    FieldState field;

    Combatant ours = ground_attacker();
    ours.hp_percent = 96.0;
    MatchupOutcome first = analyzer.lookup_matchup(ours, fire_defender(), field);
    ours.hp_percent = 99.0;
    MatchupOutcome second = analyzer.lookup_matchup(ours, fire_defender(), field);

    TEST_ASSERT_EQ(1u, analyzer.cache()->size());
    TEST_ASSERT_EQ(1u, analyzer.cache()->stats().hits);
    TEST_ASSERT_NEAR(first.a_remaining_hp_percent, second.a_remaining_hp_percent, 1e-12);
}

TEST(BattleAnalyzer, WarmUpPrecomputesMatchups) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    BattleSnapshot snap = duel_snapshot("battle-h");

    analyzer.warm_matchups(snap);
    analyzer.wait_for_warmup();
    TEST_ASSERT_EQ(2u, analyzer.cache()->size());

    analyzer.analyze_turn(snap);
    TEST_ASSERT_TRUE(analyzer.cache()->stats().hits >= 2u);
}

TEST(BattleAnalyzer, WarmUpAfterRevealRecomputes) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    BattleSnapshot snap = duel_snapshot("battle-h2");
    snap.theirs().team[0].known_moves = {"bodyslam"};
    TEST_ASSERT_EQ(std::string("bodyslam"), analyzer.analyze_turn(snap).active_matchup->b_move);
    uint64_t invalidations_before = analyzer.cache()->stats().invalidations;

    // Surf is revealed; the next call is the warm-up, not analyze_turn
    snap.theirs().team[0].known_moves = {"bodyslam", "surf"};
    snap.turn = 2;
    analyzer.warm_matchups(snap);
    analyzer.wait_for_warmup();
    TEST_ASSERT_TRUE(analyzer.cache()->stats().invalidations > invalidations_before);

    MatchupOutcome out = analyzer.lookup_matchup(snap.ours().team[0], snap.theirs().team[0], snap.field);
    TEST_ASSERT_EQ(std::string("surf"), out.b_move);

    // Already observed, so the following turn reports nothing new
    TurnAnalysis analysis = analyzer.analyze_turn(snap);
    TEST_ASSERT_TRUE(analysis.invalidated.empty());
    TEST_ASSERT_EQ(std::string("surf"), analysis.active_matchup->b_move);
}

TEST(BattleAnalyzer, ToxicStageSeparatesCachedMatchups) {
    EngineFixture fx;
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config);
    analyzer.begin_battle("battle-toxic");
    FieldState field;

    Combatant chip = make_wall("Chipper", OUR_SIDE, 60);
    Combatant tank = make_wall("Tank", THEIR_SIDE, 50);
    tank.known_moves = {"protect"};
    tank.status = Status::TOXIC;

    MatchupOutcome early = analyzer.lookup_matchup(chip, tank, field);
    tank.toxic_counter = 8;
    MatchupOutcome late = analyzer.lookup_matchup(chip, tank, field);

    TEST_ASSERT_EQ(2u, analyzer.cache()->size());
    TEST_ASSERT_EQ(0u, analyzer.cache()->stats().hits);
    TEST_ASSERT_EQ(5, early.turns_to_resolve);
    TEST_ASSERT_EQ(2, late.turns_to_resolve);

    SimulatorFixture sf;
    MatchupOutcome direct = sf.simulator.simulate(chip, tank, field);
    TEST_ASSERT_EQ(direct.turns_to_resolve, late.turns_to_resolve);
    TEST_ASSERT_NEAR(direct.a_remaining_hp_percent, late.a_remaining_hp_percent, 1e-9);
}

TEST(BattleAnalyzer, PrepareFillsOpponentFromSpeciesData) {
    EngineFixture fx;
    SpeciesDatabase species;
    TEST_ASSERT_TRUE(species.load_from_json_string(ANALYZER_SPECIES));
    BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config, &species);

    BattleSnapshot snap = duel_snapshot("battle-i");
    Combatant chomp("p2a: Garchomp", "Garchomp", THEIR_SIDE);
    chomp.known_moves = {"earthquake"};
    snap.theirs().team.push_back(chomp);

    BattleSnapshot prepared = analyzer.prepare(snap);
    const Combatant* filled = prepared.theirs().find("p2a: Garchomp");
    TEST_ASSERT_NOT_NULL(filled);
    TEST_ASSERT_TRUE(filled->has_stats());
    TEST_ASSERT_EQ(77, filled->level);
    TEST_ASSERT_EQ(std::string("roughskin"), *filled->ability);
    TEST_ASSERT_EQ(1u, filled->inferred_moves.size());
    TEST_ASSERT_EQ(std::string("stoneedge"), filled->inferred_moves[0]);

    // The snapshot passed in is left untouched
    TEST_ASSERT_FALSE(snap.theirs().find("p2a: Garchomp")->has_stats());
}

// ============================================================================
// X-RAY LOGGER TESTS
// ============================================================================

TEST(AnalysisLogger, WritesTurnTrace) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "tailglow_xray_test";
    std::string log_path;
    {
        AnalysisLogger logger(dir.string());
        TEST_ASSERT_TRUE(logger.is_enabled());
        log_path = logger.get_log_path();

        EngineFixture fx;
        BattleAnalyzer analyzer(fx.moves, fx.effects, fx.config, nullptr, &logger);
        analyzer.analyze_turn(duel_snapshot("battle-log"));
        analyzer.end_battle("test finished");
    }

    std::ifstream file(log_path);
    TEST_ASSERT_TRUE(file.is_open());
    std::stringstream contents;
    contents << file.rdbuf();
    std::string text = contents.str();
    TEST_ASSERT_TRUE(text.find("battle-log") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Digger") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("earthquake") != std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
