/**
 * Tail Glow Battle Engine - Analysis Logger Implementation
 */

#include "analysis_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace tailglow {

namespace {

std::string pct(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

std::string outcome_line(const MatchupOutcome& outcome) {
    std::ostringstream line;
    line << to_string(outcome.result) << " in " << outcome.turns_to_resolve << " turn(s)";
    if (outcome.winner_remaining_hp_percent.has_value()) {
        line << ", " << pct(*outcome.winner_remaining_hp_percent) << " left";
    }
    line << " [" << (outcome.a_move.empty() ? "-" : outcome.a_move)
         << " vs " << (outcome.b_move.empty() ? "-" : outcome.b_move) << "]";
    if (!outcome.note.empty()) {
        line << " (" << outcome.note << ")";
    }
    return line.str();
}

} // anonymous namespace

AnalysisLogger::AnalysisLogger(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Failed to create directory: " << output_dir
                  << " (" << ec.message() << ")" << std::endl;
        enabled_ = false;
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/xray_battle_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY BATTLE LOG - TURN ANALYSIS TRACE\n";
    log_file_ << "Started: " << timestamp() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[X-Ray Logger] Logging to: " << log_path_ << std::endl;
}

AnalysisLogger::~AnalysisLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string AnalysisLogger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string AnalysisLogger::format_combatant_line(const Combatant& combatant, const std::string& label) const {
    std::ostringstream line;
    line << label << ":  " << combatant.id;
    if (combatant.species != combatant.id) {
        line << " (" << combatant.species << ")";
    }

    if (combatant.fainted) {
        line << " | FAINTED";
        return line.str();
    }

    line << " | HP: " << pct(combatant.hp_percent);
    if (combatant.max_hp() > 0) {
        line << " (" << combatant.current_hp() << "/" << combatant.max_hp() << ")";
    }

    if (combatant.status != Status::NONE) {
        line << " | Status: " << to_string(combatant.status);
    }

    if (!combatant.boosts.is_neutral()) {
        line << " | Boosts:";
        for (int s = static_cast<int>(Stat::ATK); s <= static_cast<int>(Stat::EVASION); s++) {
            int stage = combatant.boosts.get(static_cast<Stat>(s));
            if (stage != 0) {
                line << " " << to_string(static_cast<Stat>(s)) << (stage > 0 ? "+" : "") << stage;
            }
        }
    }

    line << " | Item: " << (combatant.item.has_value() ? (combatant.item->empty() ? "(none)" : *combatant.item) : "?");
    line << " | Ability: " << combatant.ability.value_or("?");
    if (combatant.terastallized && combatant.tera_type.has_value()) {
        line << " | Tera: " << to_string(*combatant.tera_type);
    }

    line << " | Moves: [";
    std::vector<MoveID> moves = combatant.all_moves();
    for (size_t i = 0; i < moves.size(); i++) {
        if (i > 0) line << ", ";
        line << moves[i];
        if (!combatant.knows_move(moves[i])) line << "?";
    }
    line << "]";

    return line.str();
}

std::string AnalysisLogger::format_field(const FieldState& field) const {
    std::ostringstream line;
    line << "Weather: " << to_string(field.weather)
         << " | Terrain: " << to_string(field.terrain)
         << " | Trick Room: " << (field.trick_room() ? std::to_string(field.trick_room_turns) + " turn(s)" : "off");

    for (int s = 0; s < 2; s++) {
        const SideConditions& side = field.sides[s];
        line << "\n  Side " << s << ":";
        if (side.stealth_rock) line << " StealthRock";
        if (side.spikes > 0) line << " Spikes x" << side.spikes;
        if (side.toxic_spikes > 0) line << " ToxicSpikes x" << side.toxic_spikes;
        if (side.sticky_web) line << " StickyWeb";
        if (side.has_reflect()) line << " Reflect(" << side.reflect_turns << ")";
        if (side.has_light_screen()) line << " LightScreen(" << side.light_screen_turns << ")";
        if (side.has_aurora_veil()) line << " AuroraVeil(" << side.aurora_veil_turns << ")";
        if (side.has_tailwind()) line << " Tailwind(" << side.tailwind_turns << ")";
    }
    return line.str();
}

std::string AnalysisLogger::format_option(const RankedOption& option) const {
    std::ostringstream line;
    line << "  #" << option.rank << " " << option.identifier;
    if (option.kind == OptionKind::MOVE) {
        line << " [" << to_string(option.tier) << "]";
    }
    line << " - " << option.reasoning;
    return line.str();
}

// ============================================================================
// LOGGING
// ============================================================================

void AnalysisLogger::log_battle_start(const std::string& battle_id) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE START: " << battle_id << "\n";
    log_file_ << std::string(80, '=') << "\n\n";
    log_file_.flush();
}

void AnalysisLogger::log_turn(const BattleSnapshot& snapshot, const TurnAnalysis& analysis) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << snapshot.turn << " | BATTLE: " << snapshot.battle_id << "]"
              << (snapshot.force_switch ? " FORCED SWITCH" : "") << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    // State
    log_file_ << std::string(80, '=') << "\n";
    for (int s = 0; s < 2; s++) {
        const SideSnapshot& side = snapshot.sides[s];
        log_file_ << (s == OUR_SIDE ? "[OUR SIDE]\n" : "\n[THEIR SIDE]\n");
        if (const Combatant* active = side.active()) {
            log_file_ << format_combatant_line(*active, "ACTIVE") << "\n";
        } else {
            log_file_ << "ACTIVE:  (Empty)\n";
        }
        int bench_index = 1;
        for (size_t i = 0; i < side.team.size(); i++) {
            if (static_cast<int>(i) == side.active_index) continue;
            log_file_ << format_combatant_line(side.team[i], "BENCH " + std::to_string(bench_index++)) << "\n";
        }
    }
    log_file_ << "\n[FIELD]\n" << format_field(snapshot.field) << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    // Invalidations
    if (!analysis.invalidated.empty()) {
        log_file_ << "Invalidated: ";
        for (size_t i = 0; i < analysis.invalidated.size(); i++) {
            if (i > 0) log_file_ << ", ";
            log_file_ << analysis.invalidated[i];
        }
        log_file_ << "\n";
    }

    // Speed
    if (analysis.speed_order.has_value()) {
        log_file_ << "Speed: " << analysis.our_speed << " vs " << analysis.their_speed
                  << " -> " << to_string(analysis.speed_order->order)
                  << " (" << analysis.speed_order->reason << ")\n";
        if (analysis.their_speed_with_scarf.has_value()) {
            log_file_ << "  Scarf: " << *analysis.their_speed_with_scarf
                      << (*analysis.we_outspeed_if_they_scarf ? " (still slower)" : " (outspeeds us)") << "\n";
        }
    }

    // Damage tables
    if (!analysis.our_damage.empty() || !analysis.their_damage.empty()) {
        log_file_ << "\n[DAMAGE]\n";
        for (const auto* table : {&analysis.our_damage, &analysis.their_damage}) {
            for (const DamageLine& line : *table) {
                const DamageResult& r = line.result;
                log_file_ << "  " << line.attacker << " " << r.move_id << " -> " << line.defender << ": ";
                if (!r.success) {
                    log_file_ << to_string(r.error);
                } else if (r.immune) {
                    log_file_ << "immune";
                } else {
                    log_file_ << pct(r.range.min_percent) << "-" << pct(r.range.max_percent)
                              << " (KO " << pct(r.range.ko_probability * 100.0) << ")";
                }
                if (!r.note.empty()) log_file_ << " [" << r.note << "]";
                log_file_ << "\n";
            }
        }
    }

    // Matchups
    if (analysis.active_matchup.has_value() || !analysis.bench_matchups.empty()) {
        log_file_ << "\n[MATCHUPS]\n";
        if (analysis.active_matchup.has_value()) {
            log_file_ << "  " << analysis.our_active << " vs " << analysis.their_active << ": "
                      << outcome_line(*analysis.active_matchup) << "\n";
        }
        for (const MatchupSummary& m : analysis.bench_matchups) {
            log_file_ << "  " << m.ours << " vs " << m.theirs << ": " << outcome_line(m.outcome) << "\n";
        }
    }

    // Prediction
    if (!analysis.prediction.empty()) {
        log_file_ << "\n[PREDICTION]\n";
        for (const PredictedAction& a : analysis.prediction.actions) {
            log_file_ << "  " << to_string(a.kind) << " " << a.target << ": " << pct(a.probability * 100.0) << "\n";
        }
    }

    // Rankings
    log_file_ << "\n[MOVES] " << analysis.moves.reason << "\n";
    for (const RankedOption& opt : analysis.moves.options) {
        log_file_ << format_option(opt) << "\n";
    }
    log_file_ << "\n[SWITCHES] " << analysis.switches.reason << "\n";
    for (const RankedOption& opt : analysis.switches.options) {
        log_file_ << format_option(opt) << "\n";
    }
    for (const RankedOption& opt : analysis.switches.eliminated) {
        log_file_ << "  x " << opt.identifier << " - " << opt.reasoning << "\n";
    }

    if (!analysis.summary.empty()) {
        log_file_ << "\nSummary: " << analysis.summary << "\n";
    }
    log_file_ << "\n";
    log_file_.flush();
}

void AnalysisLogger::log_invalidation(const CombatantID& id, size_t entries_removed) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "[CACHE] New information on " << id << ": dropped "
              << entries_removed << " matchup(s)\n";
    log_file_.flush();
}

void AnalysisLogger::log_battle_end(const std::string& battle_id, const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END: " << battle_id << "\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ended: " << timestamp() << "\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_.flush();
}

} // namespace tailglow
