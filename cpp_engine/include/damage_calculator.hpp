/**
 * Tail Glow Battle Engine - Damage Calculator
 *
 * Computes the 16-roll damage distribution of one move against one target,
 * as a percentage of the target's maximum HP, plus the probability that the
 * move knocks the target out from its current HP.
 *
 * Formula order follows the battle simulator:
 *   base = floor(floor(floor(2L/5 + 2) * P * A / D) / 50) + 2
 *   -> weather -> random roll (85..100)/100 -> STAB -> type effectiveness
 *   -> burn -> final modifiers (screens, items, abilities)
 * Modifiers are chained in 4096-based fixed point, rounding half down.
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "move_database.hpp"
#include "effect_registry.hpp"
#include <array>

namespace tailglow {

constexpr int DAMAGE_ROLL_COUNT = 16;

/**
 * DamageRange - Damage distribution of one move.
 *
 * Percentages are of the defender's maximum HP. ko_probability is the
 * fraction of rolls (weighted by hit-count probability for multi-hit moves)
 * that bring the defender's current HP to zero.
 */
struct DamageRange {
    double min_percent = 0.0;
    double max_percent = 0.0;
    double expected_percent = 0.0;
    double ko_probability = 0.0;

    int min_damage = 0;
    int max_damage = 0;
    std::array<int, DAMAGE_ROLL_COUNT> rolls{};   // Per-hit damage, lowest roll first

    bool is_zero() const { return max_damage == 0; }
};

/**
 * Result of one damage computation.
 *
 * success = false means no range could be produced (status move, unknown
 * move, missing stats). INSUFFICIENT_DATA with success = true means the
 * range was produced from a conservative estimate.
 */
struct DamageResult {
    bool success = true;
    AnalysisError error = AnalysisError::NONE;

    MoveID move_id;
    Type move_type = Type::NONE;
    int resolved_power = 0;
    double type_effectiveness = 1.0;
    int hits_min = 1;
    int hits_max = 1;

    DamageRange range;
    bool immune = false;
    bool is_estimated = false;
    std::string note;
};

/**
 * The strongest damaging move one combatant has against another.
 */
struct ChosenMove {
    MoveID move_id;
    double expected_percent = 0.0;        // Expected damage per use, before accuracy
    int accuracy_rank = 0;
    bool found = false;
};

/**
 * DamageCalculator - Pure damage computation.
 *
 * Thread-safe: holds only const references to immutable tables.
 */
class DamageCalculator {
public:
    DamageCalculator(const MoveDatabase& moves, const EffectRegistry& effects);
    ~DamageCalculator() = default;

    /**
     * Compute the damage range of a move.
     *
     * Status moves return success = false with INVALID_MOVE_KIND.
     * Immunity returns a zero range with immune = true (not an error).
     */
    DamageResult compute_damage(const Combatant& attacker,
                                const MoveDef& move,
                                const Combatant& defender,
                                const FieldState& field) const;

    /**
     * Look the move up by id first. Unknown ids return INSUFFICIENT_DATA.
     */
    DamageResult compute_damage(const Combatant& attacker,
                                const MoveID& move_id,
                                const Combatant& defender,
                                const FieldState& field) const;

    /**
     * Highest expected-damage move from known plus inferred moves.
     * Ties break by accuracy (always-hits first), then move id.
     * found = false when no move deals damage.
     */
    ChosenMove strongest_move(const Combatant& attacker, const Combatant& defender,
                              const FieldState& field) const;

    /**
     * Move type after type-changing effects (Weather Ball, Tera Blast).
     */
    Type resolve_move_type(const Combatant& attacker, const MoveDef& move,
                           const FieldState& field) const;

    /**
     * Offensive/defensive stat after stages (and Unaware) but before
     * item/ability stat modifiers.
     */
    int staged_stat(const Combatant& holder, Stat stat, const Combatant& opponent) const;

    const MoveDatabase& moves() const { return moves_; }
    const EffectRegistry& effects() const { return effects_; }

    /**
     * Apply a multiplier in 4096-based fixed point, rounding half down.
     */
    static int chain_modifier(int value, double multiplier);

    /**
     * Apply type effectiveness by repeated doubling/halving.
     */
    static int apply_effectiveness(int damage, double effectiveness);

private:
    const MoveDatabase& moves_;
    const EffectRegistry& effects_;

    struct ResolvedPower {
        int power = 0;
        bool estimated = false;
        std::string note;
    };

    ResolvedPower resolve_power(const Combatant& attacker, const MoveDef& move,
                                const Combatant& defender, const FieldState& field) const;

    bool is_immune(const DamageContext& ctx, std::string& reason) const;

    std::array<int, DAMAGE_ROLL_COUNT> compute_rolls(const DamageContext& ctx) const;

    DamageResult fixed_damage(const Combatant& attacker, const MoveDef& move,
                              const Combatant& defender, DamageResult result) const;

    DamageResult ohko_damage(const Combatant& attacker, const MoveDef& move,
                             const Combatant& defender, DamageResult result) const;

    void fill_range(const Combatant& attacker, const Combatant& defender,
                    const MoveDef& move, DamageResult& result) const;
};

} // namespace tailglow
