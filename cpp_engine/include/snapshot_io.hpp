/**
 * Tail Glow Battle Engine - Snapshot JSON I/O
 *
 * Reads BattleSnapshot from JSON and writes TurnAnalysis to JSON.
 * See data/example_snapshot.json for the snapshot layout.
 */

#pragma once

#include "analysis_config.hpp"
#include "battle_snapshot.hpp"
#include "turn_analysis.hpp"
#include <nlohmann/json_fwd.hpp>

namespace tailglow {

// ============================================================================
// READING
// ============================================================================

/**
 * Load a snapshot file. Errors are logged; returns nullopt on failure.
 */
std::optional<BattleSnapshot> load_snapshot(const std::string& filepath,
                                            const AnalysisConfig& defaults = AnalysisConfig());

std::optional<BattleSnapshot> parse_snapshot(const std::string& text,
                                             const AnalysisConfig& defaults = AnalysisConfig());

/**
 * Throws nlohmann::json exceptions on malformed documents.
 */
BattleSnapshot snapshot_from_json(const nlohmann::json& data, const AnalysisConfig& defaults);

Combatant combatant_from_json(const nlohmann::json& data, SideID side, const AnalysisConfig& defaults);

FieldState field_from_json(const nlohmann::json& data);

// ============================================================================
// WRITING
// ============================================================================

nlohmann::json damage_to_json(const DamageResult& result);
nlohmann::json outcome_to_json(const MatchupOutcome& outcome);
nlohmann::json option_to_json(const RankedOption& option);
nlohmann::json analysis_to_json(const TurnAnalysis& analysis);

} // namespace tailglow
