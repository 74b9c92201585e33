/**
 * Tail Glow Battle Engine - Opponent Predictor Implementation
 */

#include "opponent_predictor.hpp"
#include <algorithm>

namespace tailglow {

OpponentPredictor::OpponentPredictor(const DamageCalculator& calculator)
    : calculator_(calculator)
{}

OpponentPrediction OpponentPredictor::predict(const Combatant& their_active,
                                              const Combatant& our_active,
                                              const std::vector<const Combatant*>& their_bench,
                                              const FieldState& field,
                                              const std::optional<MatchupOutcome>& matchup) const {
    OpponentPrediction prediction;

    // Move weights
    std::vector<PredictedAction> moves;
    double total = 0.0;
    for (const MoveID& move_id : their_active.all_moves()) {
        const MoveDef* move = calculator_.moves().get_move(move_id);
        if (!move) {
            continue;
        }
        double weight = STATUS_MOVE_WEIGHT;
        if (move->is_damaging()) {
            DamageResult damage = calculator_.compute_damage(their_active, *move, our_active, field);
            weight = (damage.success ? damage.range.expected_percent : 0.0) + 1.0;
        }
        moves.push_back({OptionKind::MOVE, move->id, weight});
        total += weight;
    }

    // Switch when the active loses the exchange
    const Combatant* switch_in = nullptr;
    bool losing = matchup.has_value() && matchup->result == MatchupResult::A_WINS;
    if (losing) {
        double least = 0.0;
        for (const Combatant* member : their_bench) {
            if (!member || !member->is_alive()) {
                continue;
            }
            ChosenMove hit = calculator_.strongest_move(our_active, *member, field);
            double taken = hit.found ? hit.expected_percent : 0.0;
            if (!switch_in || taken < least || (taken == least && member->id < switch_in->id)) {
                switch_in = member;
                least = taken;
            }
        }
    }

    double move_share = switch_in ? 1.0 - SWITCH_PROBABILITY : 1.0;
    if (moves.empty() && switch_in) {
        move_share = 0.0;
    }
    if (total > 0.0) {
        for (auto& action : moves) {
            action.probability = action.probability / total * move_share;
            prediction.actions.push_back(action);
        }
    }
    if (switch_in) {
        double p = moves.empty() ? 1.0 : SWITCH_PROBABILITY;
        prediction.actions.push_back({OptionKind::SWITCH, switch_in->id, p});
    }

    std::stable_sort(prediction.actions.begin(), prediction.actions.end(),
                     [](const PredictedAction& x, const PredictedAction& y) {
        if (x.probability != y.probability) return x.probability > y.probability;
        return x.target < y.target;
    });
    return prediction;
}

} // namespace tailglow
