/**
 * Tail Glow Battle Engine - Snapshot JSON I/O Implementation
 */

#include "snapshot_io.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tailglow {

namespace {

const char* const STAT_KEYS[6] = {"hp", "atk", "def", "spa", "spd", "spe"};

StatBlock parse_stat_block(const json& data) {
    StatBlock block;
    for (int i = 0; i < 6; i++) {
        block.set(static_cast<Stat>(i), data.value(STAT_KEYS[i], 0));
    }
    return block;
}

void parse_spread(const json& data, std::array<int, 6>& out) {
    for (int i = 0; i < 6; i++) {
        out[i] = data.value(STAT_KEYS[i], out[i]);
    }
}

// Missing or null = unknown, "" = known empty
std::optional<std::string> parse_revealed(const json& data, const char* key) {
    if (!data.contains(key) || data[key].is_null()) {
        return std::nullopt;
    }
    return to_id(data[key].get<std::string>());
}

std::vector<MoveID> parse_move_list(const json& data, const char* key) {
    std::vector<MoveID> moves;
    if (data.contains(key) && data[key].is_array()) {
        for (const auto& m : data[key]) {
            MoveID id = to_id(m.get<std::string>());
            if (!id.empty()) moves.push_back(id);
        }
    }
    return moves;
}

SideConditions parse_side_conditions(const json& data) {
    SideConditions side;
    side.stealth_rock = data.value("stealth_rock", false);
    side.spikes = std::min(3, std::max(0, data.value("spikes", 0)));
    side.toxic_spikes = std::min(2, std::max(0, data.value("toxic_spikes", 0)));
    side.sticky_web = data.value("sticky_web", false);
    side.reflect_turns = data.value("reflect", 0);
    side.light_screen_turns = data.value("light_screen", 0);
    side.aurora_veil_turns = data.value("aurora_veil", 0);
    side.tailwind_turns = data.value("tailwind", 0);
    return side;
}

json range_to_json(const DamageRange& range) {
    return {
        {"min_percent", range.min_percent},
        {"max_percent", range.max_percent},
        {"expected_percent", range.expected_percent},
        {"ko_probability", range.ko_probability},
        {"min_damage", range.min_damage},
        {"max_damage", range.max_damage},
        {"rolls", range.rolls}
    };
}

} // anonymous namespace

// ============================================================================
// READING
// ============================================================================

Combatant combatant_from_json(const json& data, SideID side, const AnalysisConfig& defaults) {
    Combatant c;
    c.side = side;
    c.species = data.value("species", "");
    c.id = data.value("id", c.species);

    if (data.contains("types") && data["types"].is_array()) {
        const json& types = data["types"];
        if (types.size() > 0) c.type1 = parse_type(types[0].get<std::string>());
        if (types.size() > 1) c.type2 = parse_type(types[1].get<std::string>());
    }
    if (data.contains("tera_type") && data["tera_type"].is_string()) {
        Type tera = parse_type(data["tera_type"].get<std::string>());
        if (tera != Type::NONE) c.tera_type = tera;
    }
    c.terastallized = data.value("terastallized", false) && c.tera_type.has_value();

    c.level = std::min(100, std::max(1, data.value("level", defaults.default_level)));
    c.evs.fill(defaults.default_ev);
    c.ivs.fill(defaults.default_iv);
    if (data.contains("base_stats") && data["base_stats"].is_object()) {
        c.base_stats = parse_stat_block(data["base_stats"]);
    }
    if (data.contains("stats") && data["stats"].is_object()) {
        c.known_stats = parse_stat_block(data["stats"]);
    }
    if (data.contains("evs") && data["evs"].is_object()) parse_spread(data["evs"], c.evs);
    if (data.contains("ivs") && data["ivs"].is_object()) parse_spread(data["ivs"], c.ivs);
    c.weight_kg = data.value("weightkg", 0.0);

    c.hp_percent = std::min(100.0, std::max(0.0, data.value("hp_percent", 100.0)));
    c.status = parse_status(data.value("status", ""));
    c.toxic_counter = std::max(0, data.value("toxic_counter", 0));
    if (data.contains("boosts") && data["boosts"].is_object()) {
        for (int s = static_cast<int>(Stat::ATK); s <= static_cast<int>(Stat::EVASION); s++) {
            Stat stat = static_cast<Stat>(s);
            c.boosts.set(stat, data["boosts"].value(to_string(stat), 0));
        }
    }

    c.item = parse_revealed(data, "item");
    c.ability = parse_revealed(data, "ability");
    c.known_moves = parse_move_list(data, "moves");
    c.inferred_moves = parse_move_list(data, "inferred_moves");

    c.fainted = data.value("fainted", false) || c.hp_percent <= 0.0;
    if (c.fainted) c.hp_percent = 0.0;
    return c;
}

FieldState field_from_json(const json& data) {
    FieldState field;
    field.weather = parse_weather(data.value("weather", ""));
    field.terrain = parse_terrain(data.value("terrain", ""));
    field.trick_room_turns = data.value("trick_room_turns", 0);
    if (data.contains("sides") && data["sides"].is_array()) {
        for (size_t s = 0; s < data["sides"].size() && s < 2; s++) {
            field.sides[s] = parse_side_conditions(data["sides"][s]);
        }
    }
    return field;
}

BattleSnapshot snapshot_from_json(const json& data, const AnalysisConfig& defaults) {
    BattleSnapshot snapshot;
    snapshot.battle_id = data.value("battle_id", "");
    snapshot.turn = data.value("turn", 0);

    if (data.contains("field") && data["field"].is_object()) {
        snapshot.field = field_from_json(data["field"]);
    }
    snapshot.field.turn = snapshot.turn;

    if (data.contains("sides") && data["sides"].is_array()) {
        for (size_t s = 0; s < data["sides"].size() && s < 2; s++) {
            const json& side_json = data["sides"][s];
            SideSnapshot& side = snapshot.sides[s];
            side.active_index = side_json.value("active", -1);
            if (side_json.contains("team") && side_json["team"].is_array()) {
                for (const auto& member : side_json["team"]) {
                    side.team.push_back(combatant_from_json(member, static_cast<SideID>(s), defaults));
                }
            }
            if (side.active_index >= static_cast<int>(side.team.size())) {
                side.active_index = -1;
            }
            for (size_t i = 0; i < side.team.size(); i++) {
                side.team[i].active = static_cast<int>(i) == side.active_index;
            }
        }
    }

    snapshot.legal_moves = parse_move_list(data, "legal_moves");
    if (data.contains("choice_locked") && data["choice_locked"].is_string()) {
        snapshot.choice_locked_move = to_id(data["choice_locked"].get<std::string>());
    }
    snapshot.force_switch = data.value("force_switch", false);

    if (data.contains("prediction") && data["prediction"].is_array()) {
        for (const auto& p : data["prediction"]) {
            PredictedAction action;
            action.kind = p.value("kind", "move") == "switch" ? OptionKind::SWITCH : OptionKind::MOVE;
            action.target = p.value("target", "");
            if (action.kind == OptionKind::MOVE) action.target = to_id(action.target);
            action.probability = p.value("probability", 0.0);
            snapshot.prediction.actions.push_back(action);
        }
        snapshot.prediction.sort_by_probability();
    }
    return snapshot;
}

std::optional<BattleSnapshot> parse_snapshot(const std::string& text, const AnalysisConfig& defaults) {
    try {
        return snapshot_from_json(json::parse(text), defaults);
    } catch (const json::parse_error& e) {
        std::cerr << "[Snapshot] JSON parse error: " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::exception& e) {
        std::cerr << "[Snapshot] Error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<BattleSnapshot> load_snapshot(const std::string& filepath, const AnalysisConfig& defaults) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Snapshot] Failed to open: " << filepath << std::endl;
        return std::nullopt;
    }

    try {
        json data = json::parse(file);
        return snapshot_from_json(data, defaults);
    } catch (const json::parse_error& e) {
        std::cerr << "[Snapshot] JSON parse error: " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::exception& e) {
        std::cerr << "[Snapshot] Error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

// ============================================================================
// WRITING
// ============================================================================

json damage_to_json(const DamageResult& result) {
    json j = {
        {"move", result.move_id},
        {"success", result.success},
        {"error", to_string(result.error)},
        {"type", to_string(result.move_type)},
        {"power", result.resolved_power},
        {"effectiveness", result.type_effectiveness},
        {"hits", {result.hits_min, result.hits_max}},
        {"immune", result.immune},
        {"estimated", result.is_estimated},
        {"range", range_to_json(result.range)}
    };
    if (!result.note.empty()) j["note"] = result.note;
    return j;
}

json outcome_to_json(const MatchupOutcome& outcome) {
    json j = {
        {"result", to_string(outcome.result)},
        {"turns", outcome.turns_to_resolve},
        {"a_move", outcome.a_move},
        {"b_move", outcome.b_move},
        {"a_remaining_hp_percent", outcome.a_remaining_hp_percent},
        {"b_remaining_hp_percent", outcome.b_remaining_hp_percent},
        {"error", to_string(outcome.error)},
        {"note", outcome.note}
    };
    j["winner_remaining_hp_percent"] = outcome.winner_remaining_hp_percent.has_value()
        ? json(*outcome.winner_remaining_hp_percent)
        : json(nullptr);
    return j;
}

json option_to_json(const RankedOption& option) {
    json j = {
        {"kind", to_string(option.kind)},
        {"id", option.identifier},
        {"rank", option.rank},
        {"reasoning", option.reasoning},
        {"tie_break_key", option.tie_break_key}
    };
    if (option.kind == OptionKind::MOVE) {
        j["tier"] = to_string(option.tier);
        j["min_percent"] = option.min_percent;
        j["max_percent"] = option.max_percent;
        j["expected_percent"] = option.expected_percent;
        j["ko_probability"] = option.ko_probability;
        j["accuracy"] = option.accuracy;
        j["priority"] = option.priority;
        j["estimated"] = option.is_estimated;
        if (option.switch_in_expected_percent.has_value()) {
            j["switch_in_expected_percent"] = *option.switch_in_expected_percent;
        }
    } else {
        j["hazard_percent"] = option.hazard_percent;
        j["incoming_percent"] = option.incoming_percent;
        j["incoming_move"] = option.incoming_move;
        j["projected_hp_percent"] = option.projected_hp_percent;
        j["matchup"] = option.matchup.has_value() ? json(to_string(*option.matchup)) : json(nullptr);
        if (option.matchup_remaining_hp_percent.has_value()) {
            j["matchup_remaining_hp_percent"] = *option.matchup_remaining_hp_percent;
        }
    }
    return j;
}

json analysis_to_json(const TurnAnalysis& analysis) {
    json j;
    j["battle_id"] = analysis.battle_id;
    j["turn"] = analysis.turn;
    j["our_active"] = analysis.our_active;
    j["their_active"] = analysis.their_active;
    j["summary"] = analysis.summary;

    if (analysis.speed_order.has_value()) {
        const OrderResult& order = *analysis.speed_order;
        j["speed"] = {
            {"ours", analysis.our_speed},
            {"theirs", analysis.their_speed},
            {"order", to_string(order.order)},
            {"trick_room", order.trick_room},
            {"reason", order.reason}
        };
        j["speed"]["their_speed_with_scarf"] = analysis.their_speed_with_scarf.has_value()
            ? json(*analysis.their_speed_with_scarf) : json(nullptr);
        j["speed"]["we_outspeed_if_they_scarf"] = analysis.we_outspeed_if_they_scarf.has_value()
            ? json(*analysis.we_outspeed_if_they_scarf) : json(nullptr);

        auto priority_json = [](const std::vector<PriorityMove>& moves) {
            json list = json::array();
            for (const auto& m : moves) {
                list.push_back({{"move", m.move_id}, {"priority", m.priority}, {"estimated", m.estimated}});
            }
            return list;
        };
        j["speed"]["our_priority_moves"] = priority_json(analysis.our_priority_moves);
        j["speed"]["their_priority_moves"] = priority_json(analysis.their_priority_moves);
    }

    auto ranking_json = [](bool success, AnalysisError error, const std::string& reason,
                           const std::vector<RankedOption>& options) {
        json r = {{"success", success}, {"error", to_string(error)}, {"reason", reason}};
        r["options"] = json::array();
        for (const auto& opt : options) r["options"].push_back(option_to_json(opt));
        return r;
    };
    j["moves"] = ranking_json(analysis.moves.success, analysis.moves.error,
                              analysis.moves.reason, analysis.moves.options);
    j["switches"] = ranking_json(analysis.switches.success, analysis.switches.error,
                                 analysis.switches.reason, analysis.switches.options);
    j["switches"]["eliminated"] = json::array();
    for (const auto& opt : analysis.switches.eliminated) {
        j["switches"]["eliminated"].push_back(option_to_json(opt));
    }

    j["our_damage"] = json::array();
    for (const auto& line : analysis.our_damage) j["our_damage"].push_back(damage_to_json(line.result));
    j["their_damage"] = json::array();
    for (const auto& line : analysis.their_damage) j["their_damage"].push_back(damage_to_json(line.result));

    j["active_matchup"] = analysis.active_matchup.has_value()
        ? outcome_to_json(*analysis.active_matchup)
        : json(nullptr);
    j["bench_matchups"] = json::array();
    for (const auto& m : analysis.bench_matchups) {
        json entry = outcome_to_json(m.outcome);
        entry["ours"] = m.ours;
        entry["theirs"] = m.theirs;
        j["bench_matchups"].push_back(entry);
    }

    j["prediction"] = json::array();
    for (const auto& p : analysis.prediction.actions) {
        j["prediction"].push_back({{"kind", to_string(p.kind)}, {"target", p.target},
                                   {"probability", p.probability}});
    }
    j["invalidated"] = analysis.invalidated;
    return j;
}

} // namespace tailglow
