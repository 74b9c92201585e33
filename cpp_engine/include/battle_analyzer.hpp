/**
 * Tail Glow Battle Engine - Battle Analyzer
 *
 * Per-battle facade over the analysis pipeline. Owns the matchup cache for
 * one battle, invalidates it incrementally as information is revealed, and
 * assembles a TurnAnalysis for every decision point.
 *
 * Lifecycle:
 *   BattleAnalyzer analyzer(moves, effects, config, &species);
 *   analyzer.begin_battle("battle-gen9randombattle-123");
 *   analyzer.warm_matchups(snapshot);             // optional, background
 *   TurnAnalysis analysis = analyzer.analyze_turn(snapshot);
 *   analyzer.end_battle("won");
 */

#pragma once

#include "types.hpp"
#include "analysis_config.hpp"
#include "battle_snapshot.hpp"
#include "damage_calculator.hpp"
#include "speed_resolver.hpp"
#include "matchup_simulator.hpp"
#include "matchup_cache.hpp"
#include "move_ranker.hpp"
#include "switch_ranker.hpp"
#include "opponent_predictor.hpp"
#include "species_database.hpp"
#include "turn_analysis.hpp"
#include "analysis_logger.hpp"
#include <memory>
#include <thread>
#include <unordered_map>

namespace tailglow {

class BattleAnalyzer {
public:
    /**
     * @param moves   Move table (must outlive the analyzer)
     * @param effects Item/ability registry (must outlive the analyzer)
     * @param config  Tunables, copied
     * @param species Optional set data for filling in opponent stats and moves
     * @param logger  Optional X-ray logger (not owned)
     */
    BattleAnalyzer(const MoveDatabase& moves,
                   const EffectRegistry& effects,
                   AnalysisConfig config = AnalysisConfig(),
                   const SpeciesDatabase* species = nullptr,
                   AnalysisLogger* logger = nullptr);

    ~BattleAnalyzer();

    BattleAnalyzer(const BattleAnalyzer&) = delete;
    BattleAnalyzer& operator=(const BattleAnalyzer&) = delete;

    // ========================================================================
    // BATTLE LIFECYCLE
    // ========================================================================

    /**
     * Start a battle with a fresh, empty cache.
     */
    void begin_battle(const std::string& battle_id);

    /**
     * Discard the battle's cache and information fingerprints.
     */
    void end_battle(const std::string& reason = "");

    bool in_battle() const { return cache_ != nullptr; }

    // ========================================================================
    // ANALYSIS
    // ========================================================================

    /**
     * Full analysis of one decision point. Starts a battle automatically if
     * the snapshot's battle id differs from the current one.
     */
    TurnAnalysis analyze_turn(const BattleSnapshot& snapshot);

    /**
     * Compare every combatant's information fingerprint with the last
     * snapshot and invalidate cache entries of those that changed.
     *
     * @return ids of invalidated combatants
     */
    std::vector<CombatantID> observe(const BattleSnapshot& snapshot);

    /**
     * Fill in species data and inferred moves where the snapshot lacks them.
     */
    BattleSnapshot prepare(const BattleSnapshot& snapshot) const;

    /**
     * Cached matchup of ours (A) vs theirs (B). HP is quantized to the
     * cache bucket so the outcome depends only on the key.
     */
    MatchupOutcome lookup_matchup(const Combatant& ours, const Combatant& theirs,
                                  const FieldState& field);

    /**
     * Precompute every living ours x theirs matchup on a background thread.
     * Revealed information is observed first, on the calling thread.
     */
    void warm_matchups(const BattleSnapshot& snapshot);

    /**
     * Block until a running warm-up finishes.
     */
    void wait_for_warmup();

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    const AnalysisConfig& config() const { return config_; }
    const DamageCalculator& calculator() const { return calculator_; }
    const SpeedResolver& speed_resolver() const { return speed_; }
    const MatchupSimulator& simulator() const { return simulator_; }

    /**
     * Current battle's cache, or nullptr between battles.
     */
    const MatchupCache* cache() const { return cache_.get(); }

    void set_logger(AnalysisLogger* logger) { logger_ = logger; }

private:
    const MoveDatabase& moves_;
    AnalysisConfig config_;
    const SpeciesDatabase* species_ = nullptr;
    AnalysisLogger* logger_ = nullptr;

    DamageCalculator calculator_;
    SpeedResolver speed_;
    MatchupSimulator simulator_;
    MoveRanker move_ranker_;
    SwitchRanker switch_ranker_;
    OpponentPredictor predictor_;

    std::shared_ptr<MatchupCache> cache_;
    std::unordered_map<CombatantID, std::string> fingerprints_;
    std::thread warmup_;

    static MatchupOutcome lookup_in(MatchupCache* cache, const MatchupSimulator& simulator,
                                    const Combatant& ours, const Combatant& theirs,
                                    const FieldState& field, int bucket_size);

    /**
     * Item unknown, and the species' set data (when loaded) lists a Scarf.
     */
    bool could_hold_scarf(const Combatant& combatant) const;

    void add_priority_moves(std::vector<PriorityMove>& out, const Combatant& user,
                            const std::vector<MoveID>& move_ids, bool estimated,
                            const FieldState& field) const;

    std::string summarize(const TurnAnalysis& analysis) const;
};

} // namespace tailglow
