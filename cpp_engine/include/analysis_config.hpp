/**
 * Tail Glow Battle Engine - Analysis Configuration
 *
 * Tunable constants for one analyzer. Defaults match the random-battle
 * format; any subset can be overridden from a JSON file:
 *
 *   {
 *     "default_level": 100, "default_ev": 84, "default_iv": 31,
 *     "turn_cap": 20, "hp_bucket_percent": 5,
 *     "sleep_skip_chance": 0.5, "freeze_skip_chance": 0.8,
 *     "paralysis_skip_chance": 0.25,
 *     "xray_enabled": false, "xray_dir": "logs"
 *   }
 */

#pragma once

#include "stats.hpp"
#include <string>

namespace tailglow {

struct AnalysisConfig {
    int default_level = DEFAULT_LEVEL;
    int default_ev = DEFAULT_EV;
    int default_iv = DEFAULT_IV;

    // Matchup simulation
    int turn_cap = 20;
    int hp_bucket_percent = 5;

    // Expected fraction of turns a statused combatant loses
    double sleep_skip_chance = 0.5;
    double freeze_skip_chance = 0.8;
    double paralysis_skip_chance = 0.25;

    // X-ray trace log
    bool xray_enabled = false;
    std::string xray_dir = "logs";

    /**
     * Load overrides from a JSON file. Missing keys keep their current
     * values; out-of-range values are clamped.
     *
     * @return false if the file cannot be opened or parsed
     */
    bool load_from_json(const std::string& filepath);

    bool load_from_json_string(const std::string& text);

    /**
     * Skip chance for a status (0 for statuses that never skip a turn).
     */
    double skip_chance(Status status) const;

    /**
     * Clamp every field to its valid range. Returns the number of fields changed.
     */
    int clamp();
};

} // namespace tailglow
