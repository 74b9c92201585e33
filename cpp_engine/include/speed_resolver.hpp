/**
 * Tail Glow Battle Engine - Speed/Priority Resolver
 *
 * Decides which of two actions executes first in a turn.
 *
 * Ordering:
 * 1. Higher priority tier first (switching is +7)
 * 2. Equal priority: higher effective speed first
 * 3. Trick Room inverts step 2 only
 * 4. Exact ties are reported as UNDETERMINED, never guessed
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "move_database.hpp"
#include "effect_registry.hpp"

namespace tailglow {

constexpr int SWITCH_PRIORITY = 7;

/**
 * BattleAction - One side's intended action for the turn.
 */
struct BattleAction {
    SideID side = OUR_SIDE;
    CombatantID actor_id;
    OptionKind kind = OptionKind::MOVE;
    MoveID move_id;               // Empty for switches
    int priority = 0;
    int speed = 0;                // Effective speed of the acting combatant
};

/**
 * Result of ordering two actions.
 */
struct OrderResult {
    bool success = true;
    AnalysisError error = AnalysisError::NONE;
    TurnOrder order = TurnOrder::UNDETERMINED;

    int priority_a = 0;
    int priority_b = 0;
    int speed_a = 0;
    int speed_b = 0;
    bool trick_room = false;

    std::string reason;

    bool a_first() const { return order == TurnOrder::A_FIRST; }
    bool b_first() const { return order == TurnOrder::B_FIRST; }
    bool undetermined() const { return order == TurnOrder::UNDETERMINED; }
};

class SpeedResolver {
public:
    SpeedResolver(const MoveDatabase& moves, const EffectRegistry& effects);
    ~SpeedResolver() = default;

    /**
     * Speed after stage -> item -> ability -> Tailwind -> paralysis,
     * flooring after each step.
     */
    int effective_speed(const Combatant& combatant, const FieldState& field) const;

    /**
     * Move priority tier including Prankster, Gale Wings, Triage and
     * Grassy Glide adjustments.
     */
    int move_priority(const Combatant& user, const MoveDef& move, const FieldState& field) const;

    /**
     * Unknown move ids act at priority 0.
     */
    BattleAction make_move_action(const Combatant& user, const MoveID& move_id,
                                  const FieldState& field) const;

    BattleAction make_switch_action(const Combatant& outgoing, const FieldState& field) const;

    /**
     * Order two prepared actions.
     */
    static OrderResult resolve_order(const BattleAction& a, const BattleAction& b,
                                     const FieldState& field);

    /**
     * Convenience: order two moves used by two combatants.
     */
    OrderResult order_moves(const Combatant& a, const MoveID& move_a,
                            const Combatant& b, const MoveID& move_b,
                            const FieldState& field) const;

private:
    const MoveDatabase& moves_;
    const EffectRegistry& effects_;
};

} // namespace tailglow
