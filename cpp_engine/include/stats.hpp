/**
 * Tail Glow Battle Engine - Stat Formulas
 *
 * Stat calculation from base stats (neutral nature) and stage multipliers.
 * Random battles use 84 EVs and 31 IVs in every stat unless a set says otherwise.
 */

#pragma once

#include "types.hpp"

namespace tailglow {

constexpr int DEFAULT_LEVEL = 100;
constexpr int DEFAULT_EV = 84;
constexpr int DEFAULT_IV = 31;
constexpr int MAX_BOOST_STAGE = 6;

/**
 * HP stat: floor((2B + IV + floor(EV/4)) * L / 100) + L + 10.
 * A base HP of 1 (Shedinja) always yields 1.
 */
int calc_hp_stat(int base, int level, int ev = DEFAULT_EV, int iv = DEFAULT_IV);

/**
 * Non-HP stat: floor((2B + IV + floor(EV/4)) * L / 100) + 5.
 */
int calc_stat(int base, int level, int ev = DEFAULT_EV, int iv = DEFAULT_IV);

/**
 * Apply a stat stage (-6..+6) to a stat, flooring the result.
 * Positive stages multiply by (2+n)/2, negative by 2/(2-n).
 */
int apply_stage(int stat, int stage);

inline int clamp_stage(int stage) {
    if (stage > MAX_BOOST_STAGE) return MAX_BOOST_STAGE;
    if (stage < -MAX_BOOST_STAGE) return -MAX_BOOST_STAGE;
    return stage;
}

} // namespace tailglow
