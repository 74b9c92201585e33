/**
 * Tail Glow Battle Engine - Battle Snapshot
 *
 * Everything known at one decision point: both teams, the field, our legal
 * moves, and the opponent prediction supplied by the caller (or by the
 * built-in heuristic predictor).
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include <algorithm>
#include <array>

namespace tailglow {

// ============================================================================
// SIDE
// ============================================================================

struct SideSnapshot {
    std::vector<Combatant> team;
    int active_index = -1;             // -1 = no active combatant (forced switch)

    const Combatant* active() const {
        if (active_index < 0 || active_index >= static_cast<int>(team.size())) {
            return nullptr;
        }
        return &team[active_index];
    }

    /**
     * Non-active team members that are still alive.
     */
    std::vector<const Combatant*> bench() const {
        std::vector<const Combatant*> result;
        for (size_t i = 0; i < team.size(); i++) {
            if (static_cast<int>(i) != active_index && team[i].is_alive()) {
                result.push_back(&team[i]);
            }
        }
        return result;
    }

    /**
     * Returns nullptr if no team member has the id.
     */
    const Combatant* find(const CombatantID& id) const {
        for (const auto& c : team) {
            if (c.id == id) return &c;
        }
        return nullptr;
    }
};

// ============================================================================
// OPPONENT PREDICTION
// ============================================================================

struct PredictedAction {
    OptionKind kind = OptionKind::MOVE;
    std::string target;                // Move id or switch-in combatant id
    double probability = 0.0;
};

/**
 * OpponentPrediction - Actions ordered by decreasing probability.
 */
struct OpponentPrediction {
    std::vector<PredictedAction> actions;

    bool empty() const { return actions.empty(); }

    /**
     * Restore the ordering for actions supplied in any order. Equal
     * probabilities keep their given order.
     */
    void sort_by_probability() {
        std::stable_sort(actions.begin(), actions.end(),
                         [](const PredictedAction& x, const PredictedAction& y) {
            return x.probability > y.probability;
        });
    }

    std::optional<MoveID> most_likely_move() const {
        for (const auto& a : actions) {
            if (a.kind == OptionKind::MOVE) return a.target;
        }
        return std::nullopt;
    }

    std::optional<CombatantID> most_likely_switch_in() const {
        for (const auto& a : actions) {
            if (a.kind == OptionKind::SWITCH) return a.target;
        }
        return std::nullopt;
    }
};

// ============================================================================
// SNAPSHOT
// ============================================================================

struct BattleSnapshot {
    std::string battle_id;
    int turn = 0;

    std::array<SideSnapshot, 2> sides;
    FieldState field;

    // Our decision
    std::vector<MoveID> legal_moves;
    std::optional<MoveID> choice_locked_move;
    bool force_switch = false;

    // Caller-supplied prediction (empty = use the heuristic predictor)
    OpponentPrediction prediction;

    SideSnapshot& ours() { return sides[OUR_SIDE]; }
    const SideSnapshot& ours() const { return sides[OUR_SIDE]; }
    SideSnapshot& theirs() { return sides[THEIR_SIDE]; }
    const SideSnapshot& theirs() const { return sides[THEIR_SIDE]; }
};

} // namespace tailglow
