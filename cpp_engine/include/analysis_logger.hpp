/**
 * Tail Glow Battle Engine - Analysis Logger
 *
 * X-ray trace of every analysed turn for debugging: field, both teams with
 * HP/status/boosts, damage tables, matchup outcomes, ranked options and
 * cache invalidations. One timestamped file per logger.
 */

#pragma once

#include "battle_snapshot.hpp"
#include "turn_analysis.hpp"
#include <string>
#include <fstream>

namespace tailglow {

/**
 * AnalysisLogger - Linear trace of analyzer input and output.
 */
class AnalysisLogger {
public:
    /**
     * Constructor - creates <output_dir>/xray_battle_<timestamp>.log.
     * Logging is disabled if the file cannot be opened.
     */
    explicit AnalysisLogger(const std::string& output_dir = "logs");

    ~AnalysisLogger();

    void log_battle_start(const std::string& battle_id);

    /**
     * Log the snapshot a turn was analysed from, then the analysis.
     */
    void log_turn(const BattleSnapshot& snapshot, const TurnAnalysis& analysis);

    /**
     * Log cache invalidations caused by newly revealed information.
     */
    void log_invalidation(const CombatantID& id, size_t entries_removed);

    void log_battle_end(const std::string& battle_id, const std::string& reason);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format: "ACTIVE:  p2: Garchomp | HP: 63.0% | Status: brn | Boosts: atk+2 | Item: ? | Ability: roughskin"
     */
    std::string format_combatant_line(const Combatant& combatant, const std::string& label) const;

    std::string format_field(const FieldState& field) const;

    std::string format_option(const RankedOption& option) const;

    static std::string timestamp();
};

} // namespace tailglow
