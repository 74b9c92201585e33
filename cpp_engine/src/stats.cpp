/**
 * Tail Glow Battle Engine - Stat Formulas Implementation
 */

#include "stats.hpp"

namespace tailglow {

int calc_hp_stat(int base, int level, int ev, int iv) {
    if (base == 1) {
        return 1;
    }
    return (2 * base + iv + ev / 4) * level / 100 + level + 10;
}

int calc_stat(int base, int level, int ev, int iv) {
    return (2 * base + iv + ev / 4) * level / 100 + 5;
}

int apply_stage(int stat, int stage) {
    stage = clamp_stage(stage);
    if (stage >= 0) {
        return stat * (2 + stage) / 2;
    }
    return stat * 2 / (2 - stage);
}

} // namespace tailglow
