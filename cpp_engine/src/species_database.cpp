/**
 * Tail Glow Battle Engine - Species Database Implementation
 *
 * Loads random-battle set data from JSON files using nlohmann/json.
 */

#include "species_database.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tailglow {

namespace {

const char* const STAT_KEYS[6] = {"hp", "atk", "def", "spa", "spd", "spe"};

void parse_spread(const json& spread, std::array<int, 6>& out) {
    if (!spread.is_object()) {
        return;
    }
    for (int i = 0; i < 6; i++) {
        if (spread.contains(STAT_KEYS[i]) && spread[STAT_KEYS[i]].is_number()) {
            out[i] = spread[STAT_KEYS[i]].get<int>();
        }
    }
}

void add_ids(const json& list, std::vector<std::string>& out) {
    if (!list.is_array()) {
        return;
    }
    for (const auto& entry : list) {
        if (!entry.is_string()) continue;
        std::string id = to_id(entry.get<std::string>());
        if (!id.empty() && std::find(out.begin(), out.end(), id) == out.end()) {
            out.push_back(id);
        }
    }
}

void add_types(const json& list, std::vector<Type>& out) {
    if (!list.is_array()) {
        return;
    }
    for (const auto& entry : list) {
        if (!entry.is_string()) continue;
        Type t = parse_type(entry.get<std::string>());
        if (t != Type::NONE && std::find(out.begin(), out.end(), t) == out.end()) {
            out.push_back(t);
        }
    }
}

} // anonymous namespace

bool SpeciesDatabase::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[SpeciesDatabase] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[SpeciesDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[SpeciesDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool SpeciesDatabase::load_from_json_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[SpeciesDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[SpeciesDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool SpeciesDatabase::load_document(const json& data) {
    if (!data.contains("species") || !data["species"].is_object()) {
        std::cerr << "[SpeciesDatabase] No 'species' object found" << std::endl;
        return false;
    }

    int species_count = 0;
    for (auto it = data["species"].begin(); it != data["species"].end(); ++it) {
        if (!it.value().is_object()) {
            continue;
        }
        SpeciesSet set = parse_species(it.key(), it.value());
        if (!set.id.empty()) {
            std::string id = set.id;
            species_[id] = std::move(set);
            species_count++;
        }
    }

    std::cout << "[SpeciesDatabase] Loaded " << species_count << " species" << std::endl;
    return true;
}

SpeciesSet SpeciesDatabase::parse_species(const std::string& name, const json& data) const {
    SpeciesSet set;
    set.name = name;
    set.id = to_id(name);
    if (set.id.empty()) {
        return set;
    }

    std::vector<Type> types;
    add_types(data.value("types", json::array()), types);
    if (!types.empty()) set.type1 = types[0];
    if (types.size() > 1) set.type2 = types[1];

    if (data.contains("baseStats") && data["baseStats"].is_object()) {
        const json& stats = data["baseStats"];
        for (int i = 0; i < 6; i++) {
            set.base_stats.set(static_cast<Stat>(i), stats.value(STAT_KEYS[i], 0));
        }
    }

    set.weight_kg = data.value("weightkg", 0.0);
    set.level = std::min(100, std::max(1, data.value("level", DEFAULT_LEVEL)));

    add_ids(data.value("abilities", json::array()), set.abilities);
    add_ids(data.value("items", json::array()), set.items);
    add_ids(data.value("moves", json::array()), set.moves);
    add_types(data.value("teraTypes", json::array()), set.tera_types);

    // Role-based layout: union of every role's moves and tera types
    if (data.contains("roles") && data["roles"].is_object()) {
        for (const auto& role : data["roles"]) {
            if (!role.is_object()) continue;
            add_ids(role.value("moves", json::array()), set.moves);
            add_ids(role.value("abilities", json::array()), set.abilities);
            add_ids(role.value("items", json::array()), set.items);
            add_types(role.value("teraTypes", json::array()), set.tera_types);
        }
    }

    parse_spread(data.value("evs", json::object()), set.evs);
    parse_spread(data.value("ivs", json::object()), set.ivs);
    return set;
}

const SpeciesSet* SpeciesDatabase::get_species(const std::string& name) const {
    std::string id = to_id(name);
    auto it = species_.find(id);
    if (it != species_.end()) {
        return &it->second;
    }

    // Forme fallback: "Tatsugiri-Curly" -> "Tatsugiri"
    size_t dash = name.find('-');
    if (dash != std::string::npos) {
        it = species_.find(to_id(name.substr(0, dash)));
        if (it != species_.end()) {
            return &it->second;
        }
    }

    // Already-normalized forme ids: longest known base species that prefixes the id
    const SpeciesSet* best = nullptr;
    for (const auto& entry : species_) {
        const std::string& base = entry.first;
        if (id.size() > base.size() && id.compare(0, base.size(), base) == 0) {
            if (!best || base.size() > best->id.size()) {
                best = &entry.second;
            }
        }
    }
    return best;
}

bool SpeciesDatabase::apply_species_data(Combatant& combatant) const {
    const SpeciesSet* set = get_species(combatant.species);
    if (!set) {
        return false;
    }
    combatant.type1 = set->type1;
    combatant.type2 = set->type2;
    combatant.base_stats = set->base_stats;
    combatant.level = set->level;
    combatant.evs = set->evs;
    combatant.ivs = set->ivs;
    if (combatant.weight_kg <= 0.0) {
        combatant.weight_kg = set->weight_kg;
    }
    if (!combatant.ability.has_value() && set->abilities.size() == 1) {
        combatant.ability = set->abilities.front();
    }
    if (!combatant.item.has_value() && set->items.size() == 1) {
        combatant.item = set->items.front();
    }
    return true;
}

std::optional<Combatant> SpeciesDatabase::make_combatant(const CombatantID& id, const std::string& species,
                                                         SideID side) const {
    const SpeciesSet* set = get_species(species);
    if (!set) {
        return std::nullopt;
    }
    Combatant combatant(id, set->name, side);
    apply_species_data(combatant);
    return combatant;
}

std::vector<MoveID> SpeciesDatabase::infer_moves(const Combatant& combatant, const MoveDatabase& moves,
                                                 size_t max_moves) const {
    std::vector<MoveID> inferred;
    const SpeciesSet* set = get_species(combatant.species);
    if (!set || combatant.known_moves.size() >= max_moves) {
        return inferred;
    }

    struct Scored {
        MoveID id;
        double score;
    };
    std::vector<Scored> scored;
    for (const MoveID& move_id : set->moves) {
        if (combatant.knows_move(move_id)) {
            continue;
        }
        const MoveDef* move = moves.get_move(move_id);
        if (!move || move->is_status()) {
            continue;
        }
        double power = std::max(move->base_power, move->min_power);
        if (move->is_multi_hit()) {
            power *= (move->min_hits + move->max_hits) / 2.0;
        }
        double stab = combatant.has_stab(move->type) ? 1.5 : 1.0;
        scored.push_back({move->id, power * stab * move->effective_accuracy() / 100.0});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& x, const Scored& y) {
        if (x.score != y.score) return x.score > y.score;
        return x.id < y.id;
    });

    size_t slots = max_moves - combatant.known_moves.size();
    for (size_t i = 0; i < scored.size() && inferred.size() < slots; i++) {
        inferred.push_back(scored[i].id);
    }
    return inferred;
}

} // namespace tailglow
