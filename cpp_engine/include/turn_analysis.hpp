/**
 * Tail Glow Battle Engine - Turn Analysis
 *
 * Everything the analyzer produces for one decision point, handed to the
 * caller (and to the X-ray logger) as one value.
 */

#pragma once

#include "types.hpp"
#include "damage_calculator.hpp"
#include "speed_resolver.hpp"
#include "matchup_simulator.hpp"
#include "move_ranker.hpp"
#include "switch_ranker.hpp"
#include "battle_snapshot.hpp"

namespace tailglow {

struct DamageLine {
    CombatantID attacker;
    CombatantID defender;
    DamageResult result;
};

struct MatchupSummary {
    CombatantID ours;
    CombatantID theirs;
    MatchupOutcome outcome;        // Ours is side A
};

struct PriorityMove {
    MoveID move_id;
    int priority = 0;
    bool estimated = false;        // From set data rather than revealed
};

struct TurnAnalysis {
    std::string battle_id;
    int turn = 0;
    CombatantID our_active;        // Empty when we have no active (forced switch)
    CombatantID their_active;

    // Our top move against their predicted move
    std::optional<OrderResult> speed_order;
    int our_speed = 0;
    int their_speed = 0;

    // Only while their item is unknown and a Choice Scarf is still possible
    std::optional<int> their_speed_with_scarf;
    std::optional<bool> we_outspeed_if_they_scarf;

    // Non-zero priority moves, highest first
    std::vector<PriorityMove> our_priority_moves;
    std::vector<PriorityMove> their_priority_moves;

    MoveRanking moves;
    SwitchRanking switches;

    std::vector<DamageLine> our_damage;      // Our active's moves into their active
    std::vector<DamageLine> their_damage;    // Their active's moves into our active

    std::optional<MatchupOutcome> active_matchup;
    std::vector<MatchupSummary> bench_matchups;

    OpponentPrediction prediction;
    std::vector<CombatantID> invalidated;

    std::string summary;
};

} // namespace tailglow
