/**
 * Tail Glow Battle Engine - Switch Ranker Implementation
 */

#include "switch_ranker.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tailglow {

namespace {

std::string pct(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

} // anonymous namespace

double entry_hazard_percent(const Combatant& combatant, const SideConditions& side,
                            const EffectRegistry& effects) {
    if (!side.has_hazards() ||
        effects.has_trait(combatant, effect_traits::IGNORES_HAZARDS) ||
        effects.has_trait(combatant, effect_traits::BLOCKS_INDIRECT)) {
        return 0.0;
    }

    double damage = 0.0;
    if (side.stealth_rock) {
        damage += 12.5 * type_effectiveness(Type::ROCK, combatant.defensive_types());
    }
    if (side.spikes > 0 && effects.is_grounded(combatant)) {
        switch (std::min(side.spikes, 3)) {
            case 1: damage += 12.5; break;
            case 2: damage += 100.0 / 6.0; break;
            default: damage += 25.0; break;
        }
    }
    return damage;
}

SwitchRanker::SwitchRanker(const DamageCalculator& calculator)
    : calculator_(calculator)
{}

RankedOption SwitchRanker::evaluate(const SwitchRankRequest& request, const Combatant& candidate) const {
    RankedOption opt;
    opt.kind = OptionKind::SWITCH;
    opt.identifier = candidate.id;

    const FieldState& field = *request.field;
    opt.hazard_percent = entry_hazard_percent(candidate, field.side(candidate.side), calculator_.effects());

    const Combatant* opponent = request.opponent;
    if (opponent && opponent->is_alive()) {
        const MoveDef* predicted = request.predicted_move.has_value()
            ? calculator_.moves().get_move(*request.predicted_move)
            : nullptr;
        if (predicted) {
            opt.incoming_move = predicted->id;
            DamageResult damage = calculator_.compute_damage(*opponent, *predicted, candidate, field);
            if (damage.success) {
                opt.incoming_percent = damage.range.expected_percent;
            }
        } else {
            ChosenMove strongest = calculator_.strongest_move(*opponent, candidate, field);
            if (strongest.found) {
                opt.incoming_move = strongest.move_id;
                opt.incoming_percent = strongest.expected_percent;
            }
        }
    }

    opt.projected_hp_percent = std::min(100.0, candidate.hp_percent) - opt.hazard_percent - opt.incoming_percent;

    std::ostringstream ss;
    ss << "Takes " << pct(opt.hazard_percent) << " from hazards";
    if (!opt.incoming_move.empty()) {
        ss << " and " << pct(opt.incoming_percent) << " from " << opt.incoming_move;
    }
    ss << "; projected HP " << pct(std::max(0.0, opt.projected_hp_percent));
    opt.reasoning = ss.str();
    return opt;
}

SwitchRanking SwitchRanker::rank(const SwitchRankRequest& request) const {
    SwitchRanking ranking;

    if (request.candidates.empty()) {
        ranking.success = false;
        ranking.error = AnalysisError::EMPTY_CANDIDATE_SET;
        ranking.reason = "No bench candidates";
        return ranking;
    }
    if (!request.field) {
        ranking.success = false;
        ranking.error = AnalysisError::INSUFFICIENT_DATA;
        ranking.reason = "Missing field state";
        return ranking;
    }

    for (const Combatant* candidate : request.candidates) {
        if (!candidate || !candidate->is_alive()) {
            continue;
        }
        RankedOption opt = evaluate(request, *candidate);

        if (opt.projected_hp_percent <= 0.0) {
            opt.reasoning = "Eliminated: " + opt.reasoning;
            ranking.eliminated.push_back(std::move(opt));
            continue;
        }

        if (request.matchup && request.opponent && request.opponent->is_alive()) {
            std::optional<MatchupOutcome> outcome = request.matchup(*candidate, *request.opponent,
                                                                    opt.projected_hp_percent);
            if (outcome.has_value()) {
                opt.matchup = outcome->verdict_for(true);
                opt.matchup_remaining_hp_percent = outcome->winner_remaining_hp_percent;
            }
        }
        MatchupVerdict verdict = opt.matchup.value_or(MatchupVerdict::UNDETERMINED);
        opt.reasoning += std::string("; matchup ") + to_string(verdict);
        if (opt.matchup_remaining_hp_percent.has_value()) {
            opt.reasoning += " (" + pct(*opt.matchup_remaining_hp_percent) + " left)";
        }

        ranking.options.push_back(std::move(opt));
    }

    if (ranking.options.empty()) {
        ranking.success = false;
        ranking.error = AnalysisError::EMPTY_CANDIDATE_SET;
        ranking.reason = "Every candidate faints on entry";
        return ranking;
    }

    std::sort(ranking.options.begin(), ranking.options.end(),
              [](const RankedOption& x, const RankedOption& y) {
        MatchupVerdict vx = x.matchup.value_or(MatchupVerdict::UNDETERMINED);
        MatchupVerdict vy = y.matchup.value_or(MatchupVerdict::UNDETERMINED);
        if (vx != vy) return vx < vy;
        if (x.projected_hp_percent != y.projected_hp_percent) {
            return x.projected_hp_percent > y.projected_hp_percent;
        }
        return x.identifier < y.identifier;
    });

    for (size_t i = 0; i < ranking.options.size(); i++) {
        RankedOption& opt = ranking.options[i];
        opt.rank = static_cast<int>(i) + 1;
        std::ostringstream key;
        key << to_string(opt.matchup.value_or(MatchupVerdict::UNDETERMINED)) << "|"
            << std::fixed << std::setprecision(2) << opt.projected_hp_percent << "|" << opt.identifier;
        opt.tie_break_key = key.str();
    }

    ranking.reason = "Ranked " + std::to_string(ranking.options.size()) + " switch(es), " +
                     std::to_string(ranking.eliminated.size()) + " eliminated";
    return ranking;
}

} // namespace tailglow
