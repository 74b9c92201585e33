/**
 * Tail Glow Battle Engine - Matchup Simulator Implementation
 */

#include "matchup_simulator.hpp"
#include <algorithm>

namespace tailglow {

namespace {

constexpr double HP_EPSILON = 1e-9;

bool is_down(double hp) {
    return hp <= HP_EPSILON;
}

} // anonymous namespace

MatchupVerdict MatchupOutcome::verdict_for(bool side_a) const {
    switch (result) {
        case MatchupResult::A_WINS: return side_a ? MatchupVerdict::WIN : MatchupVerdict::LOSE;
        case MatchupResult::B_WINS: return side_a ? MatchupVerdict::LOSE : MatchupVerdict::WIN;
        case MatchupResult::DRAW: return MatchupVerdict::DRAW;
        default: return MatchupVerdict::UNDETERMINED;
    }
}

MatchupSimulator::MatchupSimulator(const DamageCalculator& calculator, const SpeedResolver& speed,
                                   const AnalysisConfig& config)
    : calculator_(calculator)
    , speed_(speed)
    , config_(config)
{}

MatchupSimulator::SideState MatchupSimulator::prepare(const Combatant& self, const Combatant& opponent,
                                                      const FieldState& field) const {
    SideState state;
    state.self = &self;
    state.hp = self.is_alive() ? std::min(100.0, self.hp_percent) : 0.0;
    state.toxic_stage = std::min(MAX_TOXIC_STAGE, std::max(0, self.toxic_counter) + 1);
    state.move = calculator_.strongest_move(self, opponent, field);
    if (state.move.found) {
        state.def = calculator_.moves().get_move(state.move.move_id);
        // OHKO expected damage already carries its own hit chance
        double accuracy = (state.def && !state.def->ohko) ? state.def->effective_accuracy() / 100.0 : 1.0;
        state.hit_factor = accuracy * (1.0 - config_.skip_chance(self.status));
        state.per_turn_percent = state.move.expected_percent * state.hit_factor;
    }
    return state;
}

// ============================================================================
// ACTIONS
// ============================================================================

double MatchupSimulator::to_percent_of(const Combatant& from, double percent, const Combatant& to) const {
    int to_max = to.max_hp();
    if (to_max <= 0) return 0.0;
    return percent * from.max_hp() / to_max;
}

void MatchupSimulator::act(SideState& attacker, SideState& defender) const {
    if (!attacker.can_damage() || is_down(attacker.hp)) {
        return;
    }

    const Combatant& self = *attacker.self;
    const Combatant& target = *defender.self;
    const EffectRegistry& effects = calculator_.effects();

    double dealt = std::min(attacker.per_turn_percent, defender.hp);
    defender.hp -= attacker.per_turn_percent;
    attacker.dealt_damage = true;

    bool magic_guard = effects.has_trait(self, effect_traits::BLOCKS_INDIRECT);
    double dealt_as_own = to_percent_of(target, dealt, self);

    if (attacker.def) {
        if (attacker.def->drain_fraction > 0.0) {
            attacker.hp += attacker.def->drain_fraction * dealt_as_own;
        }
        if (attacker.def->recoil_fraction > 0.0 && !magic_guard &&
            !effects.has_trait(self, effect_traits::PREVENTS_RECOIL)) {
            attacker.hp -= attacker.def->recoil_fraction * dealt_as_own;
        }
        if (attacker.def->has_flag(move_flags::CONTACT) && !magic_guard) {
            attacker.hp -= effects.contact_damage_percent(target) * attacker.hit_factor;
        }
    }

    if (!magic_guard) {
        attacker.hp -= effects.attack_recoil_percent(self) * attacker.hit_factor;
    }

    attacker.hp = std::min(100.0, attacker.hp);
}

// ============================================================================
// RESIDUALS
// ============================================================================

double MatchupSimulator::residual_step(const Combatant& combatant, const FieldState& field,
                                       int step, int toxic_stage) const {
    const EffectRegistry& effects = calculator_.effects();
    bool magic_guard = effects.has_trait(combatant, effect_traits::BLOCKS_INDIRECT);
    double change = 0.0;

    switch (step) {
        case 0:
            if (field.weather == Weather::SAND &&
                !combatant.has_defensive_type(Type::ROCK) &&
                !combatant.has_defensive_type(Type::GROUND) &&
                !combatant.has_defensive_type(Type::STEEL) &&
                !effects.has_trait(combatant, effect_traits::WEATHER_IMMUNE)) {
                change = -6.25;
            }
            break;

        case 1:
            change = effects.residual_percent(combatant, field);
            if (field.terrain == Terrain::GRASSY && effects.is_grounded(combatant)) {
                change += 6.25;
            }
            break;

        case 2: {
            bool poisoned = combatant.status == Status::POISON || combatant.status == Status::TOXIC;
            if (poisoned && effects.has_trait(combatant, effect_traits::POISON_HEAL)) {
                change = 12.5;
            } else if (combatant.status == Status::BURN) {
                change = effects.has_trait(combatant, effect_traits::HALVES_BURN_DAMAGE) ? -3.125 : -6.25;
            } else if (combatant.status == Status::POISON) {
                change = -12.5;
            } else if (combatant.status == Status::TOXIC) {
                change = -6.25 * toxic_stage;
            }
            break;
        }

        default:
            break;
    }

    if (change < 0.0 && magic_guard) {
        change = 0.0;
    }
    return change;
}

// ============================================================================
// SIMULATION
// ============================================================================

MatchupOutcome MatchupSimulator::simulate(const Combatant& a, const Combatant& b,
                                          const FieldState& field) const {
    return simulate(a, b, field, config_.turn_cap);
}

MatchupOutcome MatchupSimulator::simulate(const Combatant& a, const Combatant& b,
                                          const FieldState& field, int turn_cap) const {
    MatchupOutcome outcome;
    SideState sa = prepare(a, b, field);
    SideState sb = prepare(b, a, field);
    outcome.a_move = sa.move.move_id;
    outcome.b_move = sb.move.move_id;

    auto record_hp = [&]() {
        outcome.a_remaining_hp_percent = std::max(0.0, sa.hp);
        outcome.b_remaining_hp_percent = std::max(0.0, sb.hp);
    };

    // Returns true once the exchange is decided
    auto settle = [&](int turn, const char* phase) {
        bool a_down = is_down(sa.hp);
        bool b_down = is_down(sb.hp);
        if (!a_down && !b_down) {
            return false;
        }
        record_hp();
        outcome.turns_to_resolve = turn;
        if (a_down && b_down) {
            outcome.result = MatchupResult::DRAW;
            outcome.note = std::string("Both sides fall during ") + phase;
        } else if (b_down && !sa.can_damage()) {
            outcome.result = MatchupResult::DRAW;
            outcome.note = std::string("B falls during ") + phase + " but A cannot deal damage";
        } else if (a_down && !sb.can_damage()) {
            outcome.result = MatchupResult::DRAW;
            outcome.note = std::string("A falls during ") + phase + " but B cannot deal damage";
        } else if (b_down) {
            outcome.result = MatchupResult::A_WINS;
            outcome.winner_remaining_hp_percent = sa.hp;
            outcome.note = std::string("A wins during ") + phase;
        } else {
            outcome.result = MatchupResult::B_WINS;
            outcome.winner_remaining_hp_percent = sb.hp;
            outcome.note = std::string("B wins during ") + phase;
        }
        return true;
    };

    if (settle(0, "setup")) {
        return outcome;
    }

    if (!sa.can_damage() && !sb.can_damage()) {
        record_hp();
        outcome.result = MatchupResult::DRAW;
        outcome.turns_to_resolve = 0;
        outcome.note = "Neither side can deal damage";
        return outcome;
    }

    OrderResult order = speed_.order_moves(a, sa.move.move_id, b, sb.move.move_id, field);

    for (int turn = 1; turn <= turn_cap; turn++) {
        if (order.undetermined()) {
            // Both act from start-of-turn HP; combine own side effects with damage taken
            double a_start = sa.hp;
            double b_start = sb.hp;
            SideState a_copy = sa;
            SideState b_copy = sb;
            act(sa, sb);
            act(b_copy, a_copy);
            double a_taken = a_start - a_copy.hp;
            double b_taken = b_start - sb.hp;
            sa.hp -= a_taken;
            sb.hp = b_copy.hp - b_taken;
            sb.dealt_damage = b_copy.dealt_damage;
            if (settle(turn, "simultaneous attacks")) {
                return outcome;
            }
        } else {
            SideState& first = order.a_first() ? sa : sb;
            SideState& second = order.a_first() ? sb : sa;
            act(first, second);
            if (settle(turn, "the first attack")) {
                return outcome;
            }
            act(second, first);
            if (settle(turn, "the second attack")) {
                return outcome;
            }
        }

        for (int step = 0; step < 3; step++) {
            sa.hp = std::min(100.0, sa.hp + residual_step(a, field, step, sa.toxic_stage));
            sb.hp = std::min(100.0, sb.hp + residual_step(b, field, step, sb.toxic_stage));
            if (settle(turn, "end-of-turn residuals")) {
                return outcome;
            }
        }
        if (a.status == Status::TOXIC) sa.toxic_stage = std::min(MAX_TOXIC_STAGE, sa.toxic_stage + 1);
        if (b.status == Status::TOXIC) sb.toxic_stage = std::min(MAX_TOXIC_STAGE, sb.toxic_stage + 1);
    }

    // Turn cap reached
    record_hp();
    outcome.turns_to_resolve = turn_cap;

    if (sa.can_damage() && !sb.can_damage() && sa.dealt_damage) {
        outcome.result = MatchupResult::A_WINS;
        outcome.winner_remaining_hp_percent = sa.hp;
        outcome.note = "Only A can deal damage";
        return outcome;
    }
    if (sb.can_damage() && !sa.can_damage() && sb.dealt_damage) {
        outcome.result = MatchupResult::B_WINS;
        outcome.winner_remaining_hp_percent = sb.hp;
        outcome.note = "Only B can deal damage";
        return outcome;
    }

    outcome.result = MatchupResult::UNDETERMINED;
    outcome.error = AnalysisError::UNDETERMINED_OUTCOME;
    outcome.winner_remaining_hp_percent = std::max(sa.hp, sb.hp);
    outcome.note = "No result within " + std::to_string(turn_cap) + " turns";
    return outcome;
}

} // namespace tailglow
