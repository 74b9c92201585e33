/**
 * Tail Glow Battle Engine - Type Chart
 *
 * Fixed 18x18 effectiveness table indexed by (attacking, defending) type.
 */

#pragma once

#include "types.hpp"

namespace tailglow {

/**
 * Effectiveness of one attacking type against one defending type.
 *
 * Returns 0, 0.5, 1 or 2. Type::NONE on either side is neutral.
 */
double type_effectiveness(Type attacking, Type defending);

/**
 * Combined effectiveness against a dual-typed defender (product of both).
 */
double type_effectiveness(Type attacking, Type defending1, Type defending2);

/**
 * Combined effectiveness against a list of defensive types.
 */
double type_effectiveness(Type attacking, const std::vector<Type>& defending);

} // namespace tailglow
