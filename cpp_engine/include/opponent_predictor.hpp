/**
 * Tail Glow Battle Engine - Opponent Predictor
 *
 * Heuristic prediction of the opponent's next action, used when the caller
 * supplies no prediction of its own.
 *
 * - Each opponent move is weighted by its expected damage against our
 *   active combatant (+1); status moves get a flat weight
 * - If the opponent's active loses the matchup, a switch to the bench
 *   member that takes the least damage from us gets SWITCH_PROBABILITY
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "damage_calculator.hpp"
#include "matchup_simulator.hpp"
#include "battle_snapshot.hpp"

namespace tailglow {

class OpponentPredictor {
public:
    static constexpr double STATUS_MOVE_WEIGHT = 5.0;
    static constexpr double SWITCH_PROBABILITY = 0.4;

    explicit OpponentPredictor(const DamageCalculator& calculator);
    ~OpponentPredictor() = default;

    /**
     * @param their_active Opponent's active combatant
     * @param our_active   Our active combatant
     * @param their_bench  Opponent's living bench
     * @param matchup      Our active (A) vs their active (B), if known
     */
    OpponentPrediction predict(const Combatant& their_active,
                               const Combatant& our_active,
                               const std::vector<const Combatant*>& their_bench,
                               const FieldState& field,
                               const std::optional<MatchupOutcome>& matchup) const;

private:
    const DamageCalculator& calculator_;
};

} // namespace tailglow
