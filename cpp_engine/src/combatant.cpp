/**
 * Tail Glow Battle Engine - Combatant Implementation
 */

#include "combatant.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace tailglow {

int Combatant::stat(Stat s) const {
    if (s == Stat::ACCURACY || s == Stat::EVASION) {
        return 0;
    }
    if (known_stats.has_value()) {
        return known_stats->get(s);
    }
    int index = static_cast<int>(s);
    int base = base_stats.get(s);
    if (base == 0) {
        return 0;
    }
    if (s == Stat::HP) {
        return calc_hp_stat(base, level, evs[index], ivs[index]);
    }
    return calc_stat(base, level, evs[index], ivs[index]);
}

int Combatant::current_hp() const {
    if (fainted || hp_percent <= 0.0) {
        return 0;
    }
    int hp = static_cast<int>(std::lround(max_hp() * hp_percent / 100.0));
    return std::max(1, hp);
}

std::vector<Type> Combatant::defensive_types() const {
    if (terastallized && tera_type.has_value()) {
        return {*tera_type};
    }
    std::vector<Type> types = {type1};
    if (type2 != Type::NONE && type2 != type1) {
        types.push_back(type2);
    }
    return types;
}

bool Combatant::has_defensive_type(Type t) const {
    auto types = defensive_types();
    return std::find(types.begin(), types.end(), t) != types.end();
}

bool Combatant::has_stab(Type move_type) const {
    if (move_type == Type::NONE) {
        return false;
    }
    if (move_type == type1 || move_type == type2) {
        return true;
    }
    return terastallized && tera_type.has_value() && *tera_type == move_type;
}

std::vector<MoveID> Combatant::all_moves() const {
    std::vector<MoveID> moves = known_moves;
    for (const auto& m : inferred_moves) {
        if (std::find(moves.begin(), moves.end(), m) == moves.end()) {
            moves.push_back(m);
        }
    }
    return moves;
}

bool Combatant::knows_move(const MoveID& move_id) const {
    return std::find(known_moves.begin(), known_moves.end(), move_id) != known_moves.end();
}

std::string Combatant::info_fingerprint() const {
    std::vector<MoveID> moves = known_moves;
    std::sort(moves.begin(), moves.end());

    std::ostringstream fp;
    fp << species << "|";
    for (const auto& m : moves) {
        fp << m << ",";
    }
    fp << "|item=" << (item.has_value() ? *item : std::string("?"));
    fp << "|ability=" << (ability.has_value() ? *ability : std::string("?"));
    fp << "|tera=" << (terastallized && tera_type.has_value() ? to_string(*tera_type) : "-");
    fp << "|fainted=" << (fainted ? 1 : 0);
    return fp.str();
}

} // namespace tailglow
