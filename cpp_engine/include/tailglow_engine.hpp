/**
 * Tail Glow Battle Engine - C++ Implementation
 *
 * Deterministic analysis engine for random battles: damage ranges,
 * turn order, 1v1 matchups and ranked move/switch recommendations.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "type_chart.hpp"
#include "stats.hpp"

// Data structures
#include "combatant.hpp"
#include "field_state.hpp"
#include "battle_snapshot.hpp"
#include "turn_analysis.hpp"

// Databases
#include "move_database.hpp"
#include "species_database.hpp"

// Item/ability registry
#include "effect_registry.hpp"
#include "effects/builtin_effects.hpp"

// Analysis
#include "analysis_config.hpp"
#include "damage_calculator.hpp"
#include "speed_resolver.hpp"
#include "matchup_simulator.hpp"
#include "matchup_cache.hpp"
#include "move_ranker.hpp"
#include "switch_ranker.hpp"
#include "opponent_predictor.hpp"
#include "battle_analyzer.hpp"

// I/O
#include "snapshot_io.hpp"
#include "analysis_logger.hpp"

namespace tailglow {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace tailglow
