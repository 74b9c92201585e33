/**
 * Tail Glow Battle Engine - Move Database Implementation
 *
 * Loads move definitions from JSON files using nlohmann/json.
 */

#include "move_database.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tailglow {

MoveDatabase::MoveDatabase() {
    for (auto& move : builtin_move_table()) {
        MoveID id = move.id;
        moves_[id] = std::move(move);
    }
}

bool MoveDatabase::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[MoveDatabase] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[MoveDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[MoveDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool MoveDatabase::load_from_json_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[MoveDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[MoveDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool MoveDatabase::load_document(const json& data) {
    if (!data.contains("moves") || !data["moves"].is_array()) {
        std::cerr << "[MoveDatabase] No 'moves' array found" << std::endl;
        return false;
    }

    int move_count = 0;

    for (const auto& move_json : data["moves"]) {
        MoveDef move = parse_move(move_json);

        if (!move.id.empty()) {
            MoveID id = move.id;
            moves_[id] = std::move(move);
            move_count++;
        }
    }

    std::cout << "[MoveDatabase] Loaded " << move_count << " moves" << std::endl;
    return true;
}

MoveDef MoveDatabase::parse_move(const json& move_json) const {
    MoveDef move;

    move.name = move_json.value("name", "");
    move.id = to_id(move_json.value("id", move.name));

    if (move.id.empty()) {
        return move;  // Invalid move
    }
    if (move.name.empty()) {
        move.name = move.id;
    }

    move.type = parse_type(move_json.value("type", "Normal"));
    move.category = parse_category(move_json.value("category", "Status"));
    move.base_power = move_json.value("basePower", 0);
    move.priority = move_json.value("priority", 0);

    // Accuracy: number, or true for moves that never miss
    if (move_json.contains("accuracy")) {
        const auto& acc = move_json["accuracy"];
        if (acc.is_boolean()) {
            move.always_hits = acc.get<bool>();
            move.accuracy = 100;
        } else if (acc.is_number()) {
            move.accuracy = acc.get<int>();
        }
    }

    if (move_json.contains("flags") && move_json["flags"].is_array()) {
        for (const auto& f : move_json["flags"]) {
            move.flags |= parse_flag(f.get<std::string>());
        }
    }

    // Multi-hit: a number or a [min, max] pair
    if (move_json.contains("multihit")) {
        const auto& hits = move_json["multihit"];
        if (hits.is_array() && hits.size() == 2) {
            move.min_hits = hits[0].get<int>();
            move.max_hits = hits[1].get<int>();
        } else if (hits.is_number()) {
            move.min_hits = hits.get<int>();
            move.max_hits = move.min_hits;
        }
    }

    move.fixed_kind = parse_fixed_kind(move_json.value("fixedDamage", ""));
    move.fixed_amount = move_json.value("fixedAmount", 0);
    move.ohko = move_json.value("ohko", false);

    move.recoil_fraction = move_json.value("recoil", 0.0);
    move.drain_fraction = move_json.value("drain", 0.0);

    move.power_kind = parse_power_kind(move_json.value("variablePower", ""));
    move.min_power = move_json.value("minPower", move.base_power);
    move.max_power = move_json.value("maxPower", move.base_power);

    move.inflicts = parse_status(move_json.value("status", ""));

    return move;
}

const MoveDef* MoveDatabase::get_move(const std::string& move) const {
    auto it = moves_.find(move);
    if (it == moves_.end()) {
        it = moves_.find(to_id(move));
    }
    if (it != moves_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool MoveDatabase::has_move(const std::string& move) const {
    return get_move(move) != nullptr;
}

void MoveDatabase::add_move(MoveDef move) {
    if (move.id.empty()) {
        move.id = to_id(move.name);
    }
    MoveID id = move.id;
    moves_[id] = std::move(move);
}

std::vector<MoveID> MoveDatabase::get_all_move_ids() const {
    std::vector<MoveID> ids;
    ids.reserve(moves_.size());
    for (const auto& pair : moves_) {
        ids.push_back(pair.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ============================================================================
// PARSE HELPERS
// ============================================================================

FixedDamageKind MoveDatabase::parse_fixed_kind(const std::string& s) {
    std::string id = to_id(s);
    if (id == "level") return FixedDamageKind::LEVEL;
    if (id == "halfhp") return FixedDamageKind::HALF_HP;
    if (id == "constant") return FixedDamageKind::CONSTANT;
    return FixedDamageKind::NONE;
}

VariablePowerKind MoveDatabase::parse_power_kind(const std::string& s) {
    std::string id = to_id(s);
    if (id == "eruption") return VariablePowerKind::ERUPTION;
    if (id == "reversal") return VariablePowerKind::REVERSAL;
    if (id == "hex") return VariablePowerKind::HEX;
    if (id == "facade") return VariablePowerKind::FACADE;
    if (id == "acrobatics") return VariablePowerKind::ACROBATICS;
    if (id == "knockoff") return VariablePowerKind::KNOCK_OFF;
    if (id == "weatherball") return VariablePowerKind::WEATHER_BALL;
    if (id == "storedpower") return VariablePowerKind::STORED_POWER;
    if (id == "gyroball") return VariablePowerKind::GYRO_BALL;
    if (id == "electroball") return VariablePowerKind::ELECTRO_BALL;
    if (id == "targetweight") return VariablePowerKind::TARGET_WEIGHT;
    if (id == "weightratio") return VariablePowerKind::WEIGHT_RATIO;
    return VariablePowerKind::NONE;
}

uint32_t MoveDatabase::parse_flag(const std::string& s) {
    std::string id = to_id(s);
    if (id == "contact") return move_flags::CONTACT;
    if (id == "punch") return move_flags::PUNCH;
    if (id == "bite") return move_flags::BITE;
    if (id == "sound") return move_flags::SOUND;
    if (id == "slicing") return move_flags::SLICING;
    if (id == "pulse") return move_flags::PULSE;
    if (id == "heal") return move_flags::HEALING;
    if (id == "bullet") return move_flags::BULLET;
    if (id == "pivot") return move_flags::PIVOT;
    if (id == "setup") return move_flags::SETUP;
    if (id == "hazard") return move_flags::HAZARD;
    return 0;
}

} // namespace tailglow
