/**
 * Tail Glow Battle Engine - Switch Ranker
 *
 * Ranks bench candidates by how well they come in against the opponent's
 * active combatant.
 *
 * For each candidate:
 * 1. Entry hazard damage (Stealth Rock, Spikes)
 * 2. Incoming damage from the opponent's predicted move (or its strongest
 *    known move)
 * 3. Projected HP after entry; <= 0 eliminates the candidate
 *
 * Survivors order by matchup verdict (WIN > DRAW > UNDETERMINED > LOSE),
 * then projected HP, then id.
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "damage_calculator.hpp"
#include "matchup_simulator.hpp"
#include "move_ranker.hpp"
#include <functional>

namespace tailglow {

/**
 * Matchup lookup: (candidate, opponent, candidate HP percent after entry)
 * -> cached outcome with the candidate as side A. nullopt = not available.
 */
using MatchupLookup = std::function<std::optional<MatchupOutcome>(
    const Combatant& candidate, const Combatant& opponent, double projected_hp_percent)>;

/**
 * Percent of max HP lost on entry. Toxic Spikes and Sticky Web deal no damage.
 */
double entry_hazard_percent(const Combatant& combatant, const SideConditions& side,
                            const EffectRegistry& effects);

struct SwitchRankRequest {
    const Combatant* opponent = nullptr;
    std::vector<const Combatant*> candidates;
    const FieldState* field = nullptr;
    std::optional<MoveID> predicted_move;
    MatchupLookup matchup;
};

struct SwitchRanking {
    bool success = true;
    AnalysisError error = AnalysisError::NONE;
    std::string reason;
    std::vector<RankedOption> options;
    std::vector<RankedOption> eliminated;     // Candidates projected to faint on entry

    const RankedOption* best() const { return options.empty() ? nullptr : &options.front(); }
};

class SwitchRanker {
public:
    explicit SwitchRanker(const DamageCalculator& calculator);
    ~SwitchRanker() = default;

    SwitchRanking rank(const SwitchRankRequest& request) const;

private:
    const DamageCalculator& calculator_;

    RankedOption evaluate(const SwitchRankRequest& request, const Combatant& candidate) const;
};

} // namespace tailglow
