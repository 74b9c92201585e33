/**
 * Tail Glow Battle Engine - Interactive Analysis Console
 *
 * Loads battle snapshots from JSON and prints the engine's analysis.
 *
 * Usage:
 *   tailglow_console [snapshot.json] [--config file] [--sets file]
 *                    [--moves file] [--xray] [--json]
 *
 * With --json the analysis of the given snapshot is printed as JSON and
 * the console exits; otherwise an interactive prompt starts.
 */

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <memory>

#include <nlohmann/json.hpp>
#include "tailglow_engine.hpp"

using namespace tailglow;
using namespace tailglow::effects;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string pct(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

bool parse_index(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void print_help() {
    std::cout << R"(
=== Tail Glow Battle Engine Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Snapshot:
  load <snapshot.json>    - Load a battle snapshot
  show / s                - Show both teams and the field

Analysis:
  analyze / a             - Full turn analysis (moves, switches, matchups)
  json                    - Turn analysis as JSON
  damage <side> <move>    - Damage of a move from one active to the other
                            (side: ours | theirs)
  speed                   - Effective speeds and turn order
  matchup <i> <j>         - Simulate our team[i] vs their team[j]
  warm                    - Precompute all matchups in the background

Data:
  effects                 - List items and abilities with modeled behaviour

Cache:
  cache                   - Show matchup cache statistics
  end [reason]            - End the battle and drop its cache

Examples:
  load data/example_snapshot.json
  analyze
  damage ours earthquake
  matchup 0 1
)" << std::endl;
}

// ============================================================================
// DISPLAY
// ============================================================================

void show_combatant(const std::string& label, const Combatant& c) {
    std::cout << "  " << label << ": " << c.id;
    if (c.species != c.id) {
        std::cout << " (" << c.species << ")";
    }
    std::cout << " L" << c.level;
    if (c.fainted) {
        std::cout << " | FAINTED" << std::endl;
        return;
    }
    std::cout << " | HP: " << pct(c.hp_percent);
    if (c.max_hp() > 0) {
        std::cout << " (" << c.current_hp() << "/" << c.max_hp() << ")";
    }
    if (c.status != Status::NONE) {
        std::cout << " | " << to_string(c.status);
    }
    std::cout << std::endl;

    std::cout << "    Types: " << to_string(c.type1);
    if (c.type2 != Type::NONE) std::cout << "/" << to_string(c.type2);
    if (c.terastallized && c.tera_type.has_value()) std::cout << " (Tera " << to_string(*c.tera_type) << ")";
    std::cout << " | Item: " << (c.item.has_value() ? (c.item->empty() ? "(none)" : *c.item) : "?")
              << " | Ability: " << c.ability.value_or("?") << std::endl;

    std::cout << "    Moves:";
    for (const MoveID& m : c.all_moves()) {
        std::cout << " " << m << (c.knows_move(m) ? "" : "?");
    }
    std::cout << std::endl;
}

void show_snapshot(const BattleSnapshot& snapshot) {
    std::cout << "\n=== " << snapshot.battle_id << " | Turn " << snapshot.turn;
    if (snapshot.force_switch) std::cout << " | FORCED SWITCH";
    std::cout << " ===" << std::endl;

    for (int s = 0; s < 2; s++) {
        const SideSnapshot& side = snapshot.sides[s];
        std::cout << (s == OUR_SIDE ? "\n[OURS]" : "\n[THEIRS]") << std::endl;
        for (size_t i = 0; i < side.team.size(); i++) {
            std::string label = "[" + std::to_string(i) + "]";
            if (static_cast<int>(i) == side.active_index) label += " ACTIVE";
            show_combatant(label, side.team[i]);
        }
    }

    const FieldState& field = snapshot.field;
    std::cout << "\n[FIELD] Weather: " << to_string(field.weather)
              << " | Terrain: " << to_string(field.terrain)
              << " | Trick Room: " << (field.trick_room() ? "on" : "off") << std::endl;
}

void show_damage(const DamageResult& r) {
    std::cout << "  " << std::left << std::setw(16) << r.move_id << std::right;
    if (!r.success) {
        std::cout << to_string(r.error);
    } else if (r.immune) {
        std::cout << "immune";
    } else {
        std::cout << pct(r.range.min_percent) << " - " << pct(r.range.max_percent)
                  << " | KO " << pct(r.range.ko_probability * 100.0)
                  << " | " << r.range.min_damage << "-" << r.range.max_damage << " HP";
    }
    if (!r.note.empty()) {
        std::cout << " [" << r.note << "]";
    }
    std::cout << std::endl;
}

void show_outcome(const std::string& a, const std::string& b, const MatchupOutcome& outcome) {
    std::cout << "  " << a << " vs " << b << ": " << to_string(outcome.result)
              << " in " << outcome.turns_to_resolve << " turn(s)";
    if (outcome.winner_remaining_hp_percent.has_value()) {
        std::cout << ", " << pct(*outcome.winner_remaining_hp_percent) << " left";
    }
    std::cout << " [" << (outcome.a_move.empty() ? "-" : outcome.a_move)
              << " vs " << (outcome.b_move.empty() ? "-" : outcome.b_move) << "]";
    if (!outcome.note.empty()) {
        std::cout << " (" << outcome.note << ")";
    }
    std::cout << std::endl;
}

void show_analysis(const TurnAnalysis& analysis) {
    std::cout << "\n=== Analysis: turn " << analysis.turn << " ===" << std::endl;

    if (!analysis.invalidated.empty()) {
        std::cout << "New information on:";
        for (const auto& id : analysis.invalidated) std::cout << " " << id;
        std::cout << std::endl;
    }

    if (analysis.speed_order.has_value()) {
        std::cout << "\n[SPEED] " << analysis.our_speed << " vs " << analysis.their_speed
                  << " -> " << to_string(analysis.speed_order->order)
                  << " (" << analysis.speed_order->reason << ")" << std::endl;
        if (analysis.their_speed_with_scarf.has_value()) {
            std::cout << "  With Choice Scarf: " << *analysis.their_speed_with_scarf
                      << (*analysis.we_outspeed_if_they_scarf ? " (we still move first)" : " (they move first)")
                      << std::endl;
        }
        for (const auto& m : analysis.our_priority_moves) {
            std::cout << "  Our priority: " << m.move_id << " (" << (m.priority > 0 ? "+" : "")
                      << m.priority << ")" << std::endl;
        }
        for (const auto& m : analysis.their_priority_moves) {
            std::cout << "  Their priority: " << m.move_id << " (" << (m.priority > 0 ? "+" : "")
                      << m.priority << (m.estimated ? ", estimated" : "") << ")" << std::endl;
        }
    }

    if (!analysis.our_damage.empty()) {
        std::cout << "\n[OUR DAMAGE] " << analysis.our_active << " -> " << analysis.their_active << std::endl;
        for (const auto& line : analysis.our_damage) show_damage(line.result);
    }
    if (!analysis.their_damage.empty()) {
        std::cout << "\n[THEIR DAMAGE] " << analysis.their_active << " -> " << analysis.our_active << std::endl;
        for (const auto& line : analysis.their_damage) show_damage(line.result);
    }

    std::cout << "\n[MATCHUPS]" << std::endl;
    if (analysis.active_matchup.has_value()) {
        show_outcome(analysis.our_active, analysis.their_active, *analysis.active_matchup);
    }
    for (const auto& m : analysis.bench_matchups) {
        show_outcome(m.ours, m.theirs, m.outcome);
    }

    if (!analysis.prediction.empty()) {
        std::cout << "\n[PREDICTION]" << std::endl;
        for (const auto& p : analysis.prediction.actions) {
            std::cout << "  " << to_string(p.kind) << " " << p.target << ": "
                      << pct(p.probability * 100.0) << std::endl;
        }
    }

    std::cout << "\n[MOVES] " << analysis.moves.reason << std::endl;
    for (const auto& opt : analysis.moves.options) {
        std::cout << "  #" << opt.rank << " " << opt.identifier << " [" << to_string(opt.tier) << "] "
                  << opt.reasoning << std::endl;
    }

    std::cout << "\n[SWITCHES] " << analysis.switches.reason << std::endl;
    for (const auto& opt : analysis.switches.options) {
        std::cout << "  #" << opt.rank << " " << opt.identifier << " " << opt.reasoning << std::endl;
    }
    for (const auto& opt : analysis.switches.eliminated) {
        std::cout << "  x " << opt.identifier << " " << opt.reasoning << std::endl;
    }

    std::cout << "\n" << analysis.summary << std::endl;
}

void show_effects(const EffectRegistry& registry) {
    std::cout << "\n=== Modeled Items and Abilities ===" << std::endl;
    for (const auto& e : get_effect_info(registry)) {
        std::cout << "  " << (e.kind == EffectKind::ITEM ? "[item]    " : "[ability] ")
                  << e.id << " - " << e.name;
        if (!e.description.empty()) {
            std::cout << " (" << e.description << ")";
        }
        std::cout << std::endl;
    }
    std::cout << std::endl;
}

/**
 * Revealed items/abilities in a snapshot that the engine treats as inert.
 */
void warn_unmodeled_effects(const EffectRegistry& registry, const BattleSnapshot& snapshot) {
    for (const SideSnapshot& side : snapshot.sides) {
        for (const Combatant& c : side.team) {
            if (c.item.has_value() && !c.item->empty() && !is_effect_implemented(registry, *c.item)) {
                std::cout << "Note: item " << *c.item << " on " << c.id << " is not modeled" << std::endl;
            }
            if (c.ability.has_value() && !c.ability->empty() && !is_effect_implemented(registry, *c.ability)) {
                std::cout << "Note: ability " << *c.ability << " on " << c.id << " is not modeled" << std::endl;
            }
        }
    }
}

// ============================================================================
// CONSOLE
// ============================================================================

struct ConsoleOptions {
    std::string snapshot_path;
    std::string config_path;
    std::string sets_path;
    std::string moves_path;
    bool xray = false;
    bool json_only = false;
};

class Console {
public:
    MoveDatabase moves;
    EffectRegistry effects;
    SpeciesDatabase species;
    AnalysisConfig config;
    std::unique_ptr<AnalysisLogger> xray_logger;
    std::unique_ptr<BattleAnalyzer> analyzer;

    std::optional<BattleSnapshot> snapshot;
    std::optional<TurnAnalysis> last_analysis;
    bool quiet = false;             // JSON-only output

    explicit Console(const ConsoleOptions& options) : quiet(options.json_only) {
        register_all_effects(effects);

        if (!options.moves_path.empty()) {
            if (moves.load_from_json(options.moves_path)) {
                if (!quiet) std::cout << "Move table: " << moves.move_count() << " moves" << std::endl;
            } else {
                std::cerr << "Warning: Failed to load moves from " << options.moves_path << std::endl;
            }
        }

        if (!options.config_path.empty() && !config.load_from_json(options.config_path)) {
            std::cerr << "Warning: Failed to load config from " << options.config_path
                      << ", using defaults." << std::endl;
        }
        if (options.xray) {
            config.xray_enabled = true;
        }

        bool have_sets = false;
        if (!options.sets_path.empty()) {
            have_sets = species.load_from_json(options.sets_path);
            if (!have_sets) {
                std::cerr << "Warning: Failed to load set data from " << options.sets_path << std::endl;
            }
        }

        if (config.xray_enabled) {
            xray_logger = std::make_unique<AnalysisLogger>(config.xray_dir);
        }

        analyzer = std::make_unique<BattleAnalyzer>(moves, effects, config,
                                                    have_sets ? &species : nullptr,
                                                    xray_logger.get());
    }

    void cmd_load(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: load <snapshot.json>" << std::endl;
            return;
        }
        load(args[1]);
        if (snapshot) {
            show_snapshot(*snapshot);
        }
    }

    bool load(const std::string& path) {
        std::optional<BattleSnapshot> loaded = load_snapshot(path, config);
        if (!loaded) {
            return false;
        }
        snapshot = std::move(loaded);
        last_analysis.reset();
        if (!quiet) {
            std::cout << "Loaded " << snapshot->battle_id << " turn " << snapshot->turn << std::endl;
            warn_unmodeled_effects(effects, *snapshot);
        }
        return true;
    }

    bool require_snapshot() const {
        if (!snapshot) {
            std::cout << "No snapshot loaded. Use 'load <snapshot.json>'." << std::endl;
            return false;
        }
        return true;
    }

    void cmd_analyze() {
        if (!require_snapshot()) return;
        last_analysis = analyzer->analyze_turn(*snapshot);
        show_analysis(*last_analysis);
    }

    void cmd_json() {
        if (!require_snapshot()) return;
        if (!last_analysis) {
            last_analysis = analyzer->analyze_turn(*snapshot);
        }
        std::cout << analysis_to_json(*last_analysis).dump(2) << std::endl;
    }

    void cmd_damage(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: damage <ours|theirs> <move>" << std::endl;
            return;
        }
        if (!require_snapshot()) return;

        BattleSnapshot prepared = analyzer->prepare(*snapshot);
        bool ours_attack = args[1] != "theirs";
        const Combatant* attacker = ours_attack ? prepared.ours().active() : prepared.theirs().active();
        const Combatant* defender = ours_attack ? prepared.theirs().active() : prepared.ours().active();
        if (!attacker || !defender) {
            std::cout << "Both sides need an active combatant." << std::endl;
            return;
        }

        std::cout << attacker->id << " -> " << defender->id << std::endl;
        show_damage(analyzer->calculator().compute_damage(*attacker, to_id(args[2]), *defender, prepared.field));
    }

    void cmd_speed() {
        if (!require_snapshot()) return;
        BattleSnapshot prepared = analyzer->prepare(*snapshot);
        const Combatant* ours = prepared.ours().active();
        const Combatant* theirs = prepared.theirs().active();
        if (!ours || !theirs) {
            std::cout << "Both sides need an active combatant." << std::endl;
            return;
        }

        const SpeedResolver& speed = analyzer->speed_resolver();
        OrderResult order = SpeedResolver::resolve_order(
            speed.make_move_action(*ours, MoveID(), prepared.field),
            speed.make_move_action(*theirs, MoveID(), prepared.field),
            prepared.field);
        std::cout << "  " << ours->id << ": " << order.speed_a << std::endl;
        std::cout << "  " << theirs->id << ": " << order.speed_b << std::endl;
        std::cout << "  Order at equal priority: " << to_string(order.order)
                  << " (" << order.reason << ")" << std::endl;
    }

    void cmd_matchup(const std::vector<std::string>& args) {
        int i = 0;
        int j = 0;
        if (args.size() < 3 || !parse_index(args[1], i) || !parse_index(args[2], j)) {
            std::cout << "Usage: matchup <our index> <their index>" << std::endl;
            return;
        }
        if (!require_snapshot()) return;

        BattleSnapshot prepared = analyzer->prepare(*snapshot);
        const auto& our_team = prepared.ours().team;
        const auto& their_team = prepared.theirs().team;
        if (i < 0 || j < 0 || i >= static_cast<int>(our_team.size()) || j >= static_cast<int>(their_team.size())) {
            std::cout << "Index out of range." << std::endl;
            return;
        }

        if (!analyzer->in_battle()) {
            analyzer->begin_battle(prepared.battle_id);
        }
        MatchupOutcome outcome = analyzer->lookup_matchup(our_team[i], their_team[j], prepared.field);
        show_outcome(our_team[i].id, their_team[j].id, outcome);
    }

    void cmd_warm() {
        if (!require_snapshot()) return;
        analyzer->warm_matchups(*snapshot);
        std::cout << "Warm-up started." << std::endl;
    }

    void cmd_cache() {
        analyzer->wait_for_warmup();
        const MatchupCache* cache = analyzer->cache();
        if (!cache) {
            std::cout << "No battle in progress." << std::endl;
            return;
        }
        CacheStats stats = cache->stats();
        std::cout << "Battle: " << cache->battle_id() << std::endl;
        std::cout << "  Entries:       " << cache->size() << std::endl;
        std::cout << "  Hits:          " << stats.hits << std::endl;
        std::cout << "  Misses:        " << stats.misses << std::endl;
        std::cout << "  Computations:  " << stats.computations << std::endl;
        std::cout << "  Shared waits:  " << stats.shared_waits << std::endl;
        std::cout << "  Invalidations: " << stats.invalidations << std::endl;
        std::cout << "  Discarded:     " << stats.discarded << std::endl;
    }

    void cmd_end(const std::vector<std::string>& args) {
        std::string reason = args.size() > 1 ? args[1] : "ended from console";
        analyzer->end_battle(reason);
        last_analysis.reset();
        std::cout << "Battle ended." << std::endl;
    }

    void run() {
        std::cout << "Tail Glow Battle Engine Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;
        std::cout << "Type 'help' for commands." << std::endl;

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "load") {
                cmd_load(args);
            } else if (cmd == "show" || cmd == "s") {
                if (require_snapshot()) show_snapshot(*snapshot);
            } else if (cmd == "analyze" || cmd == "a") {
                cmd_analyze();
            } else if (cmd == "json") {
                cmd_json();
            } else if (cmd == "damage" || cmd == "d") {
                cmd_damage(args);
            } else if (cmd == "speed") {
                cmd_speed();
            } else if (cmd == "matchup" || cmd == "m") {
                cmd_matchup(args);
            } else if (cmd == "warm") {
                cmd_warm();
            } else if (cmd == "effects") {
                show_effects(effects);
            } else if (cmd == "cache") {
                cmd_cache();
            } else if (cmd == "end") {
                cmd_end(args);
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        analyzer->end_battle("console closed");
        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    ConsoleOptions options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                return "";
            }
            return argv[++i];
        };

        if (arg == "--config") {
            options.config_path = next("--config");
        } else if (arg == "--sets") {
            options.sets_path = next("--sets");
        } else if (arg == "--moves") {
            options.moves_path = next("--moves");
        } else if (arg == "--xray") {
            options.xray = true;
        } else if (arg == "--json") {
            options.json_only = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0]
                      << " [snapshot.json] [--config file] [--sets file] [--moves file] [--xray] [--json]"
                      << std::endl;
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 2;
        } else {
            options.snapshot_path = arg;
        }
    }

    if (options.json_only && options.snapshot_path.empty()) {
        std::cerr << "--json requires a snapshot file" << std::endl;
        return 2;
    }

    Console console(options);

    if (!options.snapshot_path.empty()) {
        if (!console.load(options.snapshot_path)) {
            return 1;
        }
        if (options.json_only) {
            TurnAnalysis analysis = console.analyzer->analyze_turn(*console.snapshot);
            std::cout << analysis_to_json(analysis).dump(2) << std::endl;
            console.analyzer->end_battle("one-shot analysis");
            return 0;
        }
    }

    console.run();
    return 0;
}
