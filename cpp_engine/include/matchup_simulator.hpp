/**
 * Tail Glow Battle Engine - Matchup Simulator
 *
 * Deterministic expected-value simulation of a one-on-one exchange between
 * two combatants, used to predict who wins if neither side switches.
 *
 * Each round:
 * 1. Order the two chosen moves (SpeedResolver)
 * 2. Faster side hits, then the slower side if still standing
 *    (undetermined order: both hit simultaneously)
 * 3. Residuals in fixed order: weather chip, item/terrain recovery, status
 *
 * Faints are checked after every HP change. Both sides reaching 0 in the
 * same step is a draw.
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "damage_calculator.hpp"
#include "speed_resolver.hpp"
#include "analysis_config.hpp"
#include <optional>

namespace tailglow {

/**
 * MatchupOutcome - Result of one simulated exchange.
 *
 * winner_remaining_hp_percent is set for every result except DRAW. For
 * UNDETERMINED it holds the HP of the side ahead when the cap was reached,
 * and error is UNDETERMINED_OUTCOME.
 */
struct MatchupOutcome {
    MatchupResult result = MatchupResult::UNDETERMINED;
    std::optional<double> winner_remaining_hp_percent;
    int turns_to_resolve = 0;

    MoveID a_move;                        // Empty if A has no damaging move
    MoveID b_move;
    double a_remaining_hp_percent = 0.0;
    double b_remaining_hp_percent = 0.0;

    AnalysisError error = AnalysisError::NONE;
    std::string note;

    /**
     * Result from one side's point of view.
     */
    MatchupVerdict verdict_for(bool side_a) const;
};

class MatchupSimulator {
public:
    MatchupSimulator(const DamageCalculator& calculator, const SpeedResolver& speed,
                     const AnalysisConfig& config);
    ~MatchupSimulator() = default;

    /**
     * Simulate with the configured turn cap.
     */
    MatchupOutcome simulate(const Combatant& a, const Combatant& b, const FieldState& field) const;

    MatchupOutcome simulate(const Combatant& a, const Combatant& b, const FieldState& field,
                            int turn_cap) const;

    /**
     * End-of-turn HP change of one step for a combatant (percent).
     * step 0 = weather, 1 = item/ability/terrain, 2 = status.
     * toxic_stage is the toxic multiplier n for this turn.
     */
    double residual_step(const Combatant& combatant, const FieldState& field,
                         int step, int toxic_stage) const;

private:
    const DamageCalculator& calculator_;
    const SpeedResolver& speed_;
    const AnalysisConfig& config_;

    struct SideState {
        const Combatant* self = nullptr;
        ChosenMove move;
        const MoveDef* def = nullptr;
        double hp = 0.0;
        double per_turn_percent = 0.0;    // Damage dealt per turn after accuracy and skips
        double hit_factor = 0.0;          // Expected fraction of turns the move lands
        int toxic_stage = 1;
        bool dealt_damage = false;

        bool can_damage() const { return move.found && per_turn_percent > 0.0; }
    };

    SideState prepare(const Combatant& self, const Combatant& opponent, const FieldState& field) const;

    /**
     * Apply one use of attacker's move to defender, plus its side effects
     * (drain, recoil, Life Orb, contact punishment).
     */
    void act(SideState& attacker, SideState& defender) const;

    double to_percent_of(const Combatant& from, double percent, const Combatant& to) const;
};

} // namespace tailglow
