/**
 * Tail Glow Battle Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * String forms match the identifiers used by the battle protocol and by
 * the random-battle data files.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <cctype>

namespace tailglow {

// ============================================================================
// ENUMS
// ============================================================================

enum class Type : uint8_t {
    NORMAL,
    FIRE,
    WATER,
    ELECTRIC,
    GRASS,
    ICE,
    FIGHTING,
    POISON,
    GROUND,
    FLYING,
    PSYCHIC,
    BUG,
    ROCK,
    GHOST,
    DRAGON,
    DARK,
    STEEL,
    FAIRY,
    NONE        // Absent second type
};

constexpr int TYPE_COUNT = 18;
constexpr int MAX_TOXIC_STAGE = 15;

enum class MoveCategory : uint8_t {
    PHYSICAL,
    SPECIAL,
    STATUS
};

enum class Status : uint8_t {
    NONE,
    PARALYSIS,
    BURN,
    POISON,
    SLEEP,
    FREEZE,
    TOXIC
};

enum class Stat : uint8_t {
    HP,
    ATK,
    DEF,
    SPA,
    SPD,
    SPE,
    ACCURACY,
    EVASION
};

enum class Weather : uint8_t {
    NONE,
    SUN,
    RAIN,
    SAND,
    SNOW
};

enum class Terrain : uint8_t {
    NONE,
    ELECTRIC,
    GRASSY,
    PSYCHIC,
    MISTY
};

enum class MatchupResult : uint8_t {
    A_WINS,
    B_WINS,
    DRAW,
    UNDETERMINED
};

// Matchup result seen from one side (used when ranking switch-ins)
enum class MatchupVerdict : uint8_t {
    WIN,
    DRAW,
    UNDETERMINED,
    LOSE
};

enum class TurnOrder : uint8_t {
    A_FIRST,
    B_FIRST,
    UNDETERMINED
};

enum class OptionKind : uint8_t {
    MOVE,
    SWITCH
};

// Declaration order is ranking order (best first)
enum class MoveTier : uint8_t {
    GUARANTEED_KO,
    PROBABLE_KO,
    CHIP,
    STATUS_UTILITY,
    NO_EFFECT
};

enum class AnalysisError : uint8_t {
    NONE,
    INVALID_MOVE_KIND,
    INSUFFICIENT_DATA,
    UNDETERMINED_ORDER,
    UNDETERMINED_OUTCOME,
    EMPTY_CANDIDATE_SET
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using CombatantID = std::string;   // Unique per battle side (e.g., "p2: Garchomp")
using MoveID = std::string;        // Normalized move id (e.g., "swordsdance")
using SideID = uint8_t;            // 0 = our side, 1 = opponent

constexpr SideID OUR_SIDE = 0;
constexpr SideID THEIR_SIDE = 1;

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * Normalize a display name to an id: lowercase alphanumerics only.
 * "Choice Scarf" -> "choicescarf", "U-turn" -> "uturn".
 */
inline std::string to_id(const std::string& name) {
    std::string id;
    id.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            id.push_back(static_cast<char>(std::tolower(uc)));
        }
    }
    return id;
}

inline const char* to_string(Type type) {
    switch (type) {
        case Type::NORMAL: return "Normal";
        case Type::FIRE: return "Fire";
        case Type::WATER: return "Water";
        case Type::ELECTRIC: return "Electric";
        case Type::GRASS: return "Grass";
        case Type::ICE: return "Ice";
        case Type::FIGHTING: return "Fighting";
        case Type::POISON: return "Poison";
        case Type::GROUND: return "Ground";
        case Type::FLYING: return "Flying";
        case Type::PSYCHIC: return "Psychic";
        case Type::BUG: return "Bug";
        case Type::ROCK: return "Rock";
        case Type::GHOST: return "Ghost";
        case Type::DRAGON: return "Dragon";
        case Type::DARK: return "Dark";
        case Type::STEEL: return "Steel";
        case Type::FAIRY: return "Fairy";
        case Type::NONE: return "None";
        default: return "Unknown";
    }
}

inline const char* to_string(MoveCategory category) {
    switch (category) {
        case MoveCategory::PHYSICAL: return "Physical";
        case MoveCategory::SPECIAL: return "Special";
        case MoveCategory::STATUS: return "Status";
        default: return "Unknown";
    }
}

inline const char* to_string(Status status) {
    switch (status) {
        case Status::NONE: return "";
        case Status::PARALYSIS: return "par";
        case Status::BURN: return "brn";
        case Status::POISON: return "psn";
        case Status::SLEEP: return "slp";
        case Status::FREEZE: return "frz";
        case Status::TOXIC: return "tox";
        default: return "unknown";
    }
}

inline const char* to_string(Stat stat) {
    switch (stat) {
        case Stat::HP: return "hp";
        case Stat::ATK: return "atk";
        case Stat::DEF: return "def";
        case Stat::SPA: return "spa";
        case Stat::SPD: return "spd";
        case Stat::SPE: return "spe";
        case Stat::ACCURACY: return "accuracy";
        case Stat::EVASION: return "evasion";
        default: return "unknown";
    }
}

inline const char* to_string(Weather weather) {
    switch (weather) {
        case Weather::NONE: return "none";
        case Weather::SUN: return "sun";
        case Weather::RAIN: return "rain";
        case Weather::SAND: return "sand";
        case Weather::SNOW: return "snow";
        default: return "unknown";
    }
}

inline const char* to_string(Terrain terrain) {
    switch (terrain) {
        case Terrain::NONE: return "none";
        case Terrain::ELECTRIC: return "electric";
        case Terrain::GRASSY: return "grassy";
        case Terrain::PSYCHIC: return "psychic";
        case Terrain::MISTY: return "misty";
        default: return "unknown";
    }
}

inline const char* to_string(MatchupResult result) {
    switch (result) {
        case MatchupResult::A_WINS: return "a_wins";
        case MatchupResult::B_WINS: return "b_wins";
        case MatchupResult::DRAW: return "draw";
        case MatchupResult::UNDETERMINED: return "undetermined";
        default: return "unknown";
    }
}

inline const char* to_string(MatchupVerdict verdict) {
    switch (verdict) {
        case MatchupVerdict::WIN: return "win";
        case MatchupVerdict::DRAW: return "draw";
        case MatchupVerdict::UNDETERMINED: return "undetermined";
        case MatchupVerdict::LOSE: return "lose";
        default: return "unknown";
    }
}

inline const char* to_string(TurnOrder order) {
    switch (order) {
        case TurnOrder::A_FIRST: return "a_first";
        case TurnOrder::B_FIRST: return "b_first";
        case TurnOrder::UNDETERMINED: return "undetermined";
        default: return "unknown";
    }
}

inline const char* to_string(OptionKind kind) {
    switch (kind) {
        case OptionKind::MOVE: return "move";
        case OptionKind::SWITCH: return "switch";
        default: return "unknown";
    }
}

inline const char* to_string(MoveTier tier) {
    switch (tier) {
        case MoveTier::GUARANTEED_KO: return "guaranteed_ko";
        case MoveTier::PROBABLE_KO: return "probable_ko";
        case MoveTier::CHIP: return "chip";
        case MoveTier::STATUS_UTILITY: return "status_utility";
        case MoveTier::NO_EFFECT: return "no_effect";
        default: return "unknown";
    }
}

inline const char* to_string(AnalysisError error) {
    switch (error) {
        case AnalysisError::NONE: return "none";
        case AnalysisError::INVALID_MOVE_KIND: return "invalid_move_kind";
        case AnalysisError::INSUFFICIENT_DATA: return "insufficient_data";
        case AnalysisError::UNDETERMINED_ORDER: return "undetermined_order";
        case AnalysisError::UNDETERMINED_OUTCOME: return "undetermined_outcome";
        case AnalysisError::EMPTY_CANDIDATE_SET: return "empty_candidate_set";
        default: return "unknown";
    }
}

// ============================================================================
// PARSING
// ============================================================================

/**
 * Parse a type name ("Fire", "fire"). Unknown names map to Type::NONE.
 */
inline Type parse_type(const std::string& s) {
    static const char* const names[TYPE_COUNT] = {
        "normal", "fire", "water", "electric", "grass", "ice",
        "fighting", "poison", "ground", "flying", "psychic", "bug",
        "rock", "ghost", "dragon", "dark", "steel", "fairy"
    };
    std::string id = to_id(s);
    for (int i = 0; i < TYPE_COUNT; i++) {
        if (id == names[i]) {
            return static_cast<Type>(i);
        }
    }
    return Type::NONE;
}

inline MoveCategory parse_category(const std::string& s) {
    std::string id = to_id(s);
    if (id == "physical") return MoveCategory::PHYSICAL;
    if (id == "special") return MoveCategory::SPECIAL;
    return MoveCategory::STATUS;
}

/**
 * Parse protocol status strings ("par", "brn", "tox") and long forms.
 */
inline Status parse_status(const std::string& s) {
    std::string id = to_id(s);
    if (id == "par" || id == "paralysis") return Status::PARALYSIS;
    if (id == "brn" || id == "burn") return Status::BURN;
    if (id == "psn" || id == "poison") return Status::POISON;
    if (id == "slp" || id == "sleep") return Status::SLEEP;
    if (id == "frz" || id == "freeze") return Status::FREEZE;
    if (id == "tox" || id == "toxic") return Status::TOXIC;
    return Status::NONE;
}

inline Weather parse_weather(const std::string& s) {
    std::string id = to_id(s);
    if (id == "sun" || id == "sunnyday" || id == "desolateland") return Weather::SUN;
    if (id == "rain" || id == "raindance" || id == "primordialsea") return Weather::RAIN;
    if (id == "sand" || id == "sandstorm") return Weather::SAND;
    if (id == "snow" || id == "snowscape" || id == "hail") return Weather::SNOW;
    return Weather::NONE;
}

inline Terrain parse_terrain(const std::string& s) {
    std::string id = to_id(s);
    if (id == "electric" || id == "electricterrain") return Terrain::ELECTRIC;
    if (id == "grassy" || id == "grassyterrain") return Terrain::GRASSY;
    if (id == "psychic" || id == "psychicterrain") return Terrain::PSYCHIC;
    if (id == "misty" || id == "mistyterrain") return Terrain::MISTY;
    return Terrain::NONE;
}

} // namespace tailglow
