/**
 * Tail Glow Battle Engine - Species Database
 *
 * Random-battle set data: typing, base stats, level, EV/IV spreads and the
 * pool of abilities, items and moves each species can carry.
 *
 * JSON layout:
 *   {
 *     "species": {
 *       "Garchomp": {
 *         "types": ["Dragon", "Ground"],
 *         "baseStats": {"hp": 108, "atk": 130, ...},
 *         "weightkg": 95.0,
 *         "level": 77,
 *         "abilities": ["Rough Skin"],
 *         "items": ["Loaded Dice", "Life Orb"],
 *         "moves": ["Earthquake", ...],
 *         "roles": {"Fast Attacker": {"moves": [...], "teraTypes": [...]}},
 *         "evs": {"spe": 85}, "ivs": {"atk": 0}
 *       }
 *     }
 *   }
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "move_database.hpp"
#include <array>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace tailglow {

/**
 * SpeciesSet - Random-battle data for one species.
 */
struct SpeciesSet {
    std::string id;                    // Normalized, e.g. "tatsugiri"
    std::string name;
    Type type1 = Type::NORMAL;
    Type type2 = Type::NONE;
    StatBlock base_stats;
    double weight_kg = 0.0;
    int level = DEFAULT_LEVEL;

    std::vector<std::string> abilities;      // Normalized ids
    std::vector<std::string> items;          // Normalized ids
    std::vector<Type> tera_types;
    std::vector<MoveID> moves;               // Union over all roles

    std::array<int, 6> evs{{DEFAULT_EV, DEFAULT_EV, DEFAULT_EV, DEFAULT_EV, DEFAULT_EV, DEFAULT_EV}};
    std::array<int, 6> ivs{{DEFAULT_IV, DEFAULT_IV, DEFAULT_IV, DEFAULT_IV, DEFAULT_IV, DEFAULT_IV}};
};

class SpeciesDatabase {
public:
    SpeciesDatabase() = default;
    ~SpeciesDatabase() = default;

    bool load_from_json(const std::string& filepath);
    bool load_from_json_string(const std::string& text);

    /**
     * Look up by name or id. Falls back from a forme to its base species
     * ("Tatsugiri-Curly" -> "Tatsugiri", "tatsugiricurly" -> "tatsugiri").
     * Returns nullptr if nothing matches.
     */
    const SpeciesSet* get_species(const std::string& name) const;

    bool has_species(const std::string& name) const { return get_species(name) != nullptr; }
    size_t species_count() const { return species_.size(); }

    /**
     * Build a combatant at full HP from the species data. An ability or item
     * is filled in when the species has exactly one option.
     */
    std::optional<Combatant> make_combatant(const CombatantID& id, const std::string& species,
                                            SideID side) const;

    /**
     * Unrevealed damaging moves from the species pool, ranked by
     * power x STAB x accuracy, enough to fill the moveset up to max_moves.
     */
    std::vector<MoveID> infer_moves(const Combatant& combatant, const MoveDatabase& moves,
                                    size_t max_moves = 4) const;

    /**
     * Fill in typing, stats, level and spreads of a combatant that was
     * built from protocol data alone. Returns false if the species is unknown.
     */
    bool apply_species_data(Combatant& combatant) const;

private:
    std::unordered_map<std::string, SpeciesSet> species_;

    bool load_document(const nlohmann::json& data);
    SpeciesSet parse_species(const std::string& name, const nlohmann::json& data) const;
};

} // namespace tailglow
