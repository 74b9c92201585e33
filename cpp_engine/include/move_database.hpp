/**
 * Tail Glow Battle Engine - Move Database
 *
 * Stores immutable move definitions: a built-in table of common
 * random-battle moves, optionally extended or overridden from JSON.
 * Provides fast lookup by normalized move id.
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace tailglow {

// ============================================================================
// MOVE FLAGS
// ============================================================================

namespace move_flags {
constexpr uint32_t CONTACT  = 1u << 0;
constexpr uint32_t PUNCH    = 1u << 1;
constexpr uint32_t BITE     = 1u << 2;
constexpr uint32_t SOUND    = 1u << 3;
constexpr uint32_t SLICING  = 1u << 4;
constexpr uint32_t PULSE    = 1u << 5;
constexpr uint32_t HEALING  = 1u << 6;
constexpr uint32_t BULLET   = 1u << 7;
constexpr uint32_t PIVOT    = 1u << 8;   // U-turn, Volt Switch
constexpr uint32_t SETUP    = 1u << 9;   // Raises the user's stats
constexpr uint32_t HAZARD   = 1u << 10;  // Sets entry hazards
} // namespace move_flags

enum class FixedDamageKind : uint8_t {
    NONE,
    LEVEL,        // Seismic Toss, Night Shade
    HALF_HP,      // Super Fang, Ruination
    CONSTANT      // Dragon Rage, Sonic Boom
};

enum class VariablePowerKind : uint8_t {
    NONE,
    ERUPTION,        // 150 * user HP fraction
    REVERSAL,        // Higher at low user HP
    HEX,             // Doubles against a statused target
    FACADE,          // Doubles while the user is statused
    ACROBATICS,      // Doubles without a held item
    KNOCK_OFF,       // x1.5 against a held item
    WEATHER_BALL,    // 100 BP and type change in weather
    STORED_POWER,    // 20 + 20 per positive stage
    GYRO_BALL,       // Slower user hits harder
    ELECTRO_BALL,    // Faster user hits harder
    TARGET_WEIGHT,   // Low Kick, Grass Knot
    WEIGHT_RATIO     // Heavy Slam, Heat Crash
};

/**
 * Move definition (immutable).
 */
struct MoveDef {
    MoveID id;
    std::string name;
    Type type = Type::NORMAL;
    MoveCategory category = MoveCategory::STATUS;
    int base_power = 0;
    int accuracy = 100;            // 0-100
    bool always_hits = false;      // Bypasses accuracy checks
    int priority = 0;
    uint32_t flags = 0;

    // Multi-hit
    int min_hits = 1;
    int max_hits = 1;

    // Fixed damage / one-hit KO
    FixedDamageKind fixed_kind = FixedDamageKind::NONE;
    int fixed_amount = 0;
    bool ohko = false;

    // Recoil and drain as a fraction of damage dealt
    double recoil_fraction = 0.0;
    double drain_fraction = 0.0;

    // Variable power: min/max published power bound the estimate
    VariablePowerKind power_kind = VariablePowerKind::NONE;
    int min_power = 0;
    int max_power = 0;

    // Status move effects (for ranking justification)
    Status inflicts = Status::NONE;

    bool has_flag(uint32_t flag) const { return (flags & flag) != 0; }
    bool is_status() const { return category == MoveCategory::STATUS; }
    bool is_damaging() const { return category != MoveCategory::STATUS; }
    bool is_multi_hit() const { return max_hits > 1; }
    bool is_fixed_damage() const { return fixed_kind != FixedDamageKind::NONE; }
    bool is_variable_power() const { return power_kind != VariablePowerKind::NONE; }

    /**
     * Hit chance in percent (always-hits counts as 100).
     */
    int effective_accuracy() const { return always_hits ? 100 : accuracy; }

    /**
     * Accuracy key for ordering: always-hits ranks above 100% accurate.
     */
    int accuracy_rank() const { return always_hits ? 101 : accuracy; }
};

/**
 * Built-in move records (defined in move_table.cpp).
 */
std::vector<MoveDef> builtin_move_table();

/**
 * MoveDatabase - Central move lookup.
 *
 * Seeded with the built-in table on construction; JSON files may add
 * moves or replace built-in records with the same id.
 */
class MoveDatabase {
public:
    MoveDatabase();
    ~MoveDatabase() = default;

    /**
     * Load moves from a JSON file ({"moves": [...]}).
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load moves from JSON text.
     */
    bool load_from_json_string(const std::string& text);

    /**
     * Get a move definition by id or display name.
     *
     * Returns nullptr if move not found.
     */
    const MoveDef* get_move(const std::string& move) const;

    /**
     * Check if a move exists.
     */
    bool has_move(const std::string& move) const;

    /**
     * Add or replace a move definition.
     */
    void add_move(MoveDef move);

    /**
     * Get all move ids (sorted).
     */
    std::vector<MoveID> get_all_move_ids() const;

    size_t move_count() const { return moves_.size(); }

    /**
     * Static parsing utilities - public for use by other components.
     */
    static FixedDamageKind parse_fixed_kind(const std::string& s);
    static VariablePowerKind parse_power_kind(const std::string& s);
    static uint32_t parse_flag(const std::string& s);

private:
    std::unordered_map<MoveID, MoveDef> moves_;

    bool load_document(const nlohmann::json& data);
    MoveDef parse_move(const nlohmann::json& move_json) const;
};

} // namespace tailglow
