/**
 * Tail Glow Battle Engine - Battle Analyzer Implementation
 */

#include "battle_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace tailglow {

namespace {

constexpr double SCARF_SPEED_MULTIPLIER = 1.5;

} // anonymous namespace

BattleAnalyzer::BattleAnalyzer(const MoveDatabase& moves,
                               const EffectRegistry& effects,
                               AnalysisConfig config,
                               const SpeciesDatabase* species,
                               AnalysisLogger* logger)
    : moves_(moves)
    , config_(std::move(config))
    , species_(species)
    , logger_(logger)
    , calculator_(moves, effects)
    , speed_(moves, effects)
    , simulator_(calculator_, speed_, config_)
    , move_ranker_(calculator_, speed_)
    , switch_ranker_(calculator_)
    , predictor_(calculator_)
{
    config_.clamp();
}

BattleAnalyzer::~BattleAnalyzer() {
    wait_for_warmup();
}

// ============================================================================
// BATTLE LIFECYCLE
// ============================================================================

void BattleAnalyzer::begin_battle(const std::string& battle_id) {
    if (cache_) {
        end_battle("superseded by " + battle_id);
    }
    cache_ = std::make_shared<MatchupCache>(battle_id);
    fingerprints_.clear();
    if (logger_) {
        logger_->log_battle_start(battle_id);
    }
}

void BattleAnalyzer::end_battle(const std::string& reason) {
    wait_for_warmup();
    if (cache_ && logger_) {
        logger_->log_battle_end(cache_->battle_id(), reason);
    }
    cache_.reset();
    fingerprints_.clear();
}

// ============================================================================
// INFORMATION TRACKING
// ============================================================================

std::vector<CombatantID> BattleAnalyzer::observe(const BattleSnapshot& snapshot) {
    std::vector<CombatantID> invalidated;
    for (const SideSnapshot& side : snapshot.sides) {
        for (const Combatant& combatant : side.team) {
            std::string fingerprint = combatant.info_fingerprint();
            auto it = fingerprints_.find(combatant.id);
            if (it == fingerprints_.end()) {
                fingerprints_.emplace(combatant.id, std::move(fingerprint));
                continue;
            }
            if (it->second == fingerprint) {
                continue;
            }
            it->second = std::move(fingerprint);
            size_t removed = cache_ ? cache_->invalidate(combatant.id) : 0;
            if (logger_) {
                logger_->log_invalidation(combatant.id, removed);
            }
            invalidated.push_back(combatant.id);
        }
    }
    return invalidated;
}

BattleSnapshot BattleAnalyzer::prepare(const BattleSnapshot& snapshot) const {
    BattleSnapshot prepared = snapshot;
    if (!species_) {
        return prepared;
    }
    for (SideSnapshot& side : prepared.sides) {
        for (Combatant& combatant : side.team) {
            if (!combatant.has_stats()) {
                species_->apply_species_data(combatant);
            }
            if (combatant.side == THEIR_SIDE && combatant.inferred_moves.empty()) {
                combatant.inferred_moves = species_->infer_moves(combatant, moves_);
            }
        }
    }
    return prepared;
}

// ============================================================================
// MATCHUPS
// ============================================================================

MatchupOutcome BattleAnalyzer::lookup_in(MatchupCache* cache, const MatchupSimulator& simulator,
                                         const Combatant& ours, const Combatant& theirs,
                                         const FieldState& field, int bucket_size) {
    MatchupKey key = make_matchup_key(ours, theirs, field, bucket_size);
    auto compute = [&]() {
        Combatant a = ours.clone();
        Combatant b = theirs.clone();
        a.hp_percent = bucket_representative(key.hp_bucket_a, bucket_size);
        b.hp_percent = bucket_representative(key.hp_bucket_b, bucket_size);
        return simulator.simulate(a, b, field);
    };
    if (!cache) {
        return compute();
    }
    return cache->get_or_compute(key, compute);
}

MatchupOutcome BattleAnalyzer::lookup_matchup(const Combatant& ours, const Combatant& theirs,
                                              const FieldState& field) {
    return lookup_in(cache_.get(), simulator_, ours, theirs, field, config_.hp_bucket_percent);
}

void BattleAnalyzer::warm_matchups(const BattleSnapshot& snapshot) {
    if (!cache_ || cache_->battle_id() != snapshot.battle_id) {
        begin_battle(snapshot.battle_id);
    }
    wait_for_warmup();
    // Drop entries for anything revealed since the last snapshot before warming
    observe(snapshot);

    std::shared_ptr<MatchupCache> cache = cache_;
    BattleSnapshot prepared = prepare(snapshot);
    int bucket_size = config_.hp_bucket_percent;
    const MatchupSimulator& simulator = simulator_;

    warmup_ = std::thread([cache, prepared, bucket_size, &simulator]() {
        size_t computed = 0;
        for (const Combatant& ours : prepared.ours().team) {
            if (!ours.is_alive()) continue;
            for (const Combatant& theirs : prepared.theirs().team) {
                if (!theirs.is_alive()) continue;
                try {
                    lookup_in(cache.get(), simulator, ours, theirs, prepared.field, bucket_size);
                    computed++;
                } catch (const std::exception& e) {
                    std::cerr << "[BattleAnalyzer] Warm-up failed for " << ours.id << " vs "
                              << theirs.id << ": " << e.what() << std::endl;
                }
            }
        }
        std::cout << "[BattleAnalyzer] Warmed " << computed << " matchups" << std::endl;
    });
}

void BattleAnalyzer::wait_for_warmup() {
    if (warmup_.joinable()) {
        warmup_.join();
    }
}

// ============================================================================
// TURN ANALYSIS
// ============================================================================

TurnAnalysis BattleAnalyzer::analyze_turn(const BattleSnapshot& snapshot) {
    if (!cache_ || cache_->battle_id() != snapshot.battle_id) {
        begin_battle(snapshot.battle_id);
    }

    TurnAnalysis analysis;
    analysis.battle_id = snapshot.battle_id;
    analysis.turn = snapshot.turn;
    analysis.invalidated = observe(snapshot);

    BattleSnapshot prepared = prepare(snapshot);
    const FieldState& field = prepared.field;
    const Combatant* ours = prepared.ours().active();
    const Combatant* theirs = prepared.theirs().active();
    if (ours && !ours->is_alive()) ours = nullptr;
    if (theirs && !theirs->is_alive()) theirs = nullptr;
    if (ours) analysis.our_active = ours->id;
    if (theirs) analysis.their_active = theirs->id;

    // Active matchup
    if (ours && theirs) {
        analysis.active_matchup = lookup_matchup(*ours, *theirs, field);
    }

    // Opponent prediction
    if (!snapshot.prediction.empty()) {
        analysis.prediction = snapshot.prediction;
        analysis.prediction.sort_by_probability();
    } else if (ours && theirs) {
        analysis.prediction = predictor_.predict(*theirs, *ours, prepared.theirs().bench(),
                                                 field, analysis.active_matchup);
    }
    std::optional<MoveID> their_move = analysis.prediction.most_likely_move();
    const Combatant* switch_in = nullptr;
    if (auto id = analysis.prediction.most_likely_switch_in()) {
        switch_in = prepared.theirs().find(*id);
    }

    // Damage tables
    if (ours && theirs) {
        for (const MoveID& move_id : ours->all_moves()) {
            analysis.our_damage.push_back({ours->id, theirs->id,
                                           calculator_.compute_damage(*ours, move_id, *theirs, field)});
        }
        for (const MoveID& move_id : theirs->all_moves()) {
            analysis.their_damage.push_back({theirs->id, ours->id,
                                             calculator_.compute_damage(*theirs, move_id, *ours, field)});
        }
    }

    // Moves
    MoveRankRequest move_request;
    move_request.user = ours;
    move_request.target = theirs;
    move_request.switch_in = switch_in;
    move_request.field = &field;
    if (!snapshot.force_switch && ours && theirs) {
        move_request.legal_moves = snapshot.legal_moves;
        move_request.choice_locked = snapshot.choice_locked_move;
    }
    analysis.moves = move_ranker_.rank(move_request);
    if (snapshot.force_switch) {
        analysis.moves.reason = "Forced switch";
    }

    // Turn order of our best move against their predicted move
    if (ours && theirs) {
        analysis.our_speed = speed_.effective_speed(*ours, field);
        analysis.their_speed = speed_.effective_speed(*theirs, field);
        MoveID our_move = analysis.moves.best() ? analysis.moves.best()->identifier : MoveID();
        analysis.speed_order = SpeedResolver::resolve_order(
            speed_.make_move_action(*ours, our_move, field),
            speed_.make_move_action(*theirs, their_move.value_or(MoveID()), field),
            field);

        if (could_hold_scarf(*theirs)) {
            int scarf_speed = static_cast<int>(std::floor(analysis.their_speed * SCARF_SPEED_MULTIPLIER));
            analysis.their_speed_with_scarf = scarf_speed;
            analysis.we_outspeed_if_they_scarf = field.trick_room()
                ? analysis.our_speed < scarf_speed
                : analysis.our_speed > scarf_speed;
        }

        const std::vector<MoveID>& our_options = snapshot.legal_moves.empty()
            ? ours->known_moves : snapshot.legal_moves;
        add_priority_moves(analysis.our_priority_moves, *ours, our_options, false, field);
        add_priority_moves(analysis.their_priority_moves, *theirs, theirs->known_moves, false, field);
        add_priority_moves(analysis.their_priority_moves, *theirs, theirs->inferred_moves, true, field);
    }

    // Switches
    SwitchRankRequest switch_request;
    switch_request.opponent = theirs;
    switch_request.candidates = prepared.ours().bench();
    switch_request.field = &field;
    switch_request.predicted_move = their_move;
    switch_request.matchup = [this, &field](const Combatant& candidate, const Combatant& opponent,
                                            double projected_hp) -> std::optional<MatchupOutcome> {
        Combatant entered = candidate.clone();
        entered.hp_percent = projected_hp;
        return lookup_matchup(entered, opponent, field);
    };
    analysis.switches = switch_ranker_.rank(switch_request);

    // Bench matchups at current HP
    if (theirs) {
        for (const Combatant* member : prepared.ours().bench()) {
            analysis.bench_matchups.push_back({member->id, theirs->id,
                                               lookup_matchup(*member, *theirs, field)});
        }
    }

    analysis.summary = summarize(analysis);
    if (logger_) {
        logger_->log_turn(snapshot, analysis);
    }
    return analysis;
}

bool BattleAnalyzer::could_hold_scarf(const Combatant& combatant) const {
    if (combatant.item_known()) {
        return false;
    }
    if (species_) {
        const SpeciesSet* set = species_->get_species(combatant.species);
        if (set && !set->items.empty()) {
            return std::find(set->items.begin(), set->items.end(), "choicescarf") != set->items.end();
        }
    }
    return true;
}

void BattleAnalyzer::add_priority_moves(std::vector<PriorityMove>& out, const Combatant& user,
                                        const std::vector<MoveID>& move_ids, bool estimated,
                                        const FieldState& field) const {
    for (const MoveID& move_id : move_ids) {
        const MoveDef* def = moves_.get_move(move_id);
        if (!def) continue;
        int priority = speed_.move_priority(user, *def, field);
        if (priority != 0) {
            out.push_back({def->id, priority, estimated});
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const PriorityMove& x, const PriorityMove& y) {
        return x.priority > y.priority;
    });
}

std::string BattleAnalyzer::summarize(const TurnAnalysis& analysis) const {
    std::ostringstream ss;
    if (const RankedOption* best = analysis.moves.best()) {
        ss << "Best move: " << best->identifier << " (" << to_string(best->tier) << ")";
    } else {
        ss << "No move: " << analysis.moves.reason;
    }
    if (const RankedOption* best = analysis.switches.best()) {
        ss << "; best switch: " << best->identifier << " ("
           << to_string(best->matchup.value_or(MatchupVerdict::UNDETERMINED)) << ")";
    }
    if (analysis.active_matchup.has_value()) {
        ss << "; active matchup: " << to_string(analysis.active_matchup->verdict_for(true));
    }
    if (analysis.we_outspeed_if_they_scarf.has_value() && !*analysis.we_outspeed_if_they_scarf) {
        ss << "; outsped if they hold Choice Scarf";
    }
    return ss.str();
}

} // namespace tailglow
