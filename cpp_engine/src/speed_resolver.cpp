/**
 * Tail Glow Battle Engine - Speed/Priority Resolver Implementation
 */

#include "speed_resolver.hpp"
#include <cmath>

namespace tailglow {

SpeedResolver::SpeedResolver(const MoveDatabase& moves, const EffectRegistry& effects)
    : moves_(moves)
    , effects_(effects)
{}

int SpeedResolver::effective_speed(const Combatant& combatant, const FieldState& field) const {
    int speed = apply_stage(combatant.stat(Stat::SPE), combatant.boosts.get(Stat::SPE));
    speed = static_cast<int>(std::floor(speed * effects_.speed_modifier(combatant, field)));

    if (field.side(combatant.side).has_tailwind()) {
        speed *= 2;
    }

    if (combatant.status == Status::PARALYSIS &&
        !effects_.has_trait(combatant, effect_traits::IGNORES_PARALYSIS_SPEED)) {
        speed /= 2;
    }

    return speed;
}

int SpeedResolver::move_priority(const Combatant& user, const MoveDef& move,
                                 const FieldState& field) const {
    int priority = move.priority + effects_.priority_modifier(user, move, field);
    if (move.id == "grassyglide" && field.terrain == Terrain::GRASSY && effects_.is_grounded(user)) {
        priority += 1;
    }
    return priority;
}

BattleAction SpeedResolver::make_move_action(const Combatant& user, const MoveID& move_id,
                                             const FieldState& field) const {
    BattleAction action;
    action.side = user.side;
    action.actor_id = user.id;
    action.kind = OptionKind::MOVE;
    action.speed = effective_speed(user, field);

    const MoveDef* move = moves_.get_move(move_id);
    action.move_id = move ? move->id : move_id;
    action.priority = move ? move_priority(user, *move, field) : 0;
    return action;
}

BattleAction SpeedResolver::make_switch_action(const Combatant& outgoing, const FieldState& field) const {
    BattleAction action;
    action.side = outgoing.side;
    action.actor_id = outgoing.id;
    action.kind = OptionKind::SWITCH;
    action.priority = SWITCH_PRIORITY;
    action.speed = effective_speed(outgoing, field);
    return action;
}

OrderResult SpeedResolver::resolve_order(const BattleAction& a, const BattleAction& b,
                                         const FieldState& field) {
    OrderResult result;
    result.priority_a = a.priority;
    result.priority_b = b.priority;
    result.speed_a = a.speed;
    result.speed_b = b.speed;
    result.trick_room = field.trick_room();

    if (a.priority != b.priority) {
        result.order = a.priority > b.priority ? TurnOrder::A_FIRST : TurnOrder::B_FIRST;
        result.reason = "Priority " + std::to_string(a.priority) + " vs " + std::to_string(b.priority);
        return result;
    }

    if (a.speed == b.speed) {
        result.success = false;
        result.error = AnalysisError::UNDETERMINED_ORDER;
        result.order = TurnOrder::UNDETERMINED;
        result.reason = "Speed tie at " + std::to_string(a.speed);
        return result;
    }

    bool a_faster = a.speed > b.speed;
    if (result.trick_room) {
        a_faster = !a_faster;
    }
    result.order = a_faster ? TurnOrder::A_FIRST : TurnOrder::B_FIRST;
    result.reason = "Speed " + std::to_string(a.speed) + " vs " + std::to_string(b.speed);
    if (result.trick_room) {
        result.reason += " under Trick Room";
    }
    return result;
}

OrderResult SpeedResolver::order_moves(const Combatant& a, const MoveID& move_a,
                                       const Combatant& b, const MoveID& move_b,
                                       const FieldState& field) const {
    return resolve_order(make_move_action(a, move_a, field),
                         make_move_action(b, move_b, field),
                         field);
}

} // namespace tailglow
