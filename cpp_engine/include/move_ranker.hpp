/**
 * Tail Glow Battle Engine - Move Ranker
 *
 * Orders our legal moves into tiers with explainable numeric justification.
 *
 * Tiers (best first): GUARANTEED_KO > PROBABLE_KO > CHIP > STATUS_UTILITY
 * > NO_EFFECT. Within a tier: expected damage to the active opponent, then
 * expected damage to the predicted switch-in, then accuracy (always-hits
 * counts as 101), then move id.
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "damage_calculator.hpp"
#include "speed_resolver.hpp"

namespace tailglow {

/**
 * RankedOption - One ranked move or switch.
 *
 * Move options fill the damage fields; switch options fill the entry and
 * matchup fields. reasoning is generated from these fields only.
 */
struct RankedOption {
    OptionKind kind = OptionKind::MOVE;
    std::string identifier;            // Move id or combatant id
    int rank = 0;                      // 1 = best
    MoveTier tier = MoveTier::NO_EFFECT;

    // Move justification
    double min_percent = 0.0;
    double max_percent = 0.0;
    double expected_percent = 0.0;
    double ko_probability = 0.0;
    std::optional<double> switch_in_expected_percent;
    int accuracy = 0;
    int priority = 0;
    bool is_estimated = false;

    // Switch justification
    double hazard_percent = 0.0;
    double incoming_percent = 0.0;
    double projected_hp_percent = 0.0;
    MoveID incoming_move;
    std::optional<MatchupVerdict> matchup;
    std::optional<double> matchup_remaining_hp_percent;

    std::string reasoning;
    std::string tie_break_key;
};

struct MoveRankRequest {
    const Combatant* user = nullptr;
    const Combatant* target = nullptr;
    const Combatant* switch_in = nullptr;      // Predicted opponent switch-in (optional)
    const FieldState* field = nullptr;
    std::vector<MoveID> legal_moves;
    std::optional<MoveID> choice_locked;
};

struct MoveRanking {
    bool success = true;
    AnalysisError error = AnalysisError::NONE;
    std::string reason;
    std::vector<RankedOption> options;

    const RankedOption* best() const { return options.empty() ? nullptr : &options.front(); }
};

class MoveRanker {
public:
    MoveRanker(const DamageCalculator& calculator, const SpeedResolver& speed);
    ~MoveRanker() = default;

    MoveRanking rank(const MoveRankRequest& request) const;

    /**
     * Tier of a single damage result.
     */
    static MoveTier classify(const DamageResult& damage);

private:
    const DamageCalculator& calculator_;
    const SpeedResolver& speed_;

    RankedOption evaluate(const MoveRankRequest& request, const MoveID& move_id) const;
};

} // namespace tailglow
