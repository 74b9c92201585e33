/**
 * Tail Glow Battle Engine - Combatant
 *
 * One battle participant with identity, typing, stats, and the partially
 * revealed information (item, ability, moves) known at decision time.
 * Read-only for the duration of one analysis pass.
 */

#pragma once

#include "types.hpp"
#include "stats.hpp"
#include <array>

namespace tailglow {

/**
 * StatBlock - Six battle stats (HP, Atk, Def, SpA, SpD, Spe).
 */
struct StatBlock {
    int hp = 0;
    int atk = 0;
    int def = 0;
    int spa = 0;
    int spd = 0;
    int spe = 0;

    int get(Stat stat) const {
        switch (stat) {
            case Stat::HP: return hp;
            case Stat::ATK: return atk;
            case Stat::DEF: return def;
            case Stat::SPA: return spa;
            case Stat::SPD: return spd;
            case Stat::SPE: return spe;
            default: return 0;
        }
    }

    void set(Stat stat, int value) {
        switch (stat) {
            case Stat::HP: hp = value; break;
            case Stat::ATK: atk = value; break;
            case Stat::DEF: def = value; break;
            case Stat::SPA: spa = value; break;
            case Stat::SPD: spd = value; break;
            case Stat::SPE: spe = value; break;
            default: break;
        }
    }

    bool is_empty() const {
        return hp == 0 && atk == 0 && def == 0 && spa == 0 && spd == 0 && spe == 0;
    }
};

/**
 * Boosts - Stat stages for every non-HP stat, clamped to -6..+6.
 */
struct Boosts {
    // Indexed by Stat - 1 (ATK..EVASION)
    std::array<int8_t, 7> stages{};

    int get(Stat stat) const {
        if (stat == Stat::HP) return 0;
        return stages[static_cast<int>(stat) - 1];
    }

    void set(Stat stat, int stage) {
        if (stat == Stat::HP) return;
        stages[static_cast<int>(stat) - 1] = static_cast<int8_t>(clamp_stage(stage));
    }

    void add(Stat stat, int delta) {
        set(stat, get(stat) + delta);
    }

    /**
     * Sum of positive stages (Stored Power, Power Trip).
     */
    int positive_total() const {
        int total = 0;
        for (int8_t s : stages) {
            if (s > 0) total += s;
        }
        return total;
    }

    bool is_neutral() const {
        for (int8_t s : stages) {
            if (s != 0) return false;
        }
        return true;
    }

    /**
     * Pack all seven stages into 28 bits (4 bits each, offset +6).
     * Two boost sets are equal iff their signatures are equal.
     */
    uint32_t signature() const {
        uint32_t sig = 0;
        for (size_t i = 0; i < stages.size(); i++) {
            sig |= static_cast<uint32_t>(stages[i] + MAX_BOOST_STAGE) << (4 * i);
        }
        return sig;
    }

    bool operator==(const Boosts& other) const { return stages == other.stages; }
    bool operator!=(const Boosts& other) const { return stages != other.stages; }
};

/**
 * Combatant - A battle participant.
 *
 * Items and abilities are stored as normalized ids. std::nullopt means
 * "not yet revealed"; an empty item string means "known to hold nothing".
 */
struct Combatant {
    // Identity
    CombatantID id;               // Unique per side, e.g. "p2: Garchomp"
    std::string species;
    SideID side = OUR_SIDE;

    // Typing
    Type type1 = Type::NORMAL;
    Type type2 = Type::NONE;
    std::optional<Type> tera_type;
    bool terastallized = false;

    // Stats
    StatBlock base_stats;
    std::optional<StatBlock> known_stats;   // Exact stats (our own side)
    int level = DEFAULT_LEVEL;
    std::array<int, 6> evs{{DEFAULT_EV, DEFAULT_EV, DEFAULT_EV, DEFAULT_EV, DEFAULT_EV, DEFAULT_EV}};
    std::array<int, 6> ivs{{DEFAULT_IV, DEFAULT_IV, DEFAULT_IV, DEFAULT_IV, DEFAULT_IV, DEFAULT_IV}};
    double weight_kg = 0.0;                 // 0 = unknown

    // Mutable battle state (as observed)
    double hp_percent = 100.0;
    Status status = Status::NONE;
    int toxic_counter = 0;                  // Turns of toxic already elapsed
    Boosts boosts;

    // Partially revealed information
    std::optional<std::string> item;
    std::optional<std::string> ability;
    std::vector<MoveID> known_moves;
    std::vector<MoveID> inferred_moves;

    bool fainted = false;
    bool active = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Combatant() = default;

    Combatant(CombatantID id_, std::string species_, SideID side_)
        : id(std::move(id_))
        , species(std::move(species_))
        , side(side_)
    {}

    // ========================================================================
    // STATS
    // ========================================================================

    /**
     * Unboosted stat: exact value if known, else computed from base stats.
     */
    int stat(Stat s) const;

    int max_hp() const { return stat(Stat::HP); }

    /**
     * Current HP in points: round(max_hp * pct / 100), at least 1 while alive.
     */
    int current_hp() const;

    bool has_stats() const { return known_stats.has_value() || !base_stats.is_empty(); }

    bool is_alive() const { return !fainted && hp_percent > 0.0; }

    // ========================================================================
    // TYPING
    // ========================================================================

    /**
     * Types used when this combatant is hit (tera type once terastallized).
     */
    std::vector<Type> defensive_types() const;

    bool has_defensive_type(Type t) const;

    /**
     * Types that earn STAB (original types plus the tera type when active).
     */
    bool has_stab(Type move_type) const;

    // ========================================================================
    // REVEALED INFORMATION
    // ========================================================================

    bool has_item(const std::string& item_id) const {
        return item.has_value() && *item == item_id;
    }

    bool has_ability(const std::string& ability_id) const {
        return ability.has_value() && *ability == ability_id;
    }

    bool item_known() const { return item.has_value(); }
    bool item_known_empty() const { return item.has_value() && item->empty(); }

    /**
     * Known moves followed by inferred moves, without duplicates.
     */
    std::vector<MoveID> all_moves() const;

    bool knows_move(const MoveID& move_id) const;

    /**
     * Summary of the revealed information (moves, item, ability, tera, fainted).
     * Changes exactly when new information about this combatant arrives.
     */
    std::string info_fingerprint() const;

    // ========================================================================
    // CLONING
    // ========================================================================

    Combatant clone() const {
        return *this;
    }
};

} // namespace tailglow
