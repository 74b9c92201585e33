/**
 * Tail Glow Battle Engine - Built-in Effects
 *
 * Central registration point for all built-in item and ability effects.
 * Provides a function to register everything at startup plus metadata
 * about which effects the engine models.
 */

#pragma once

#include "../effect_registry.hpp"
#include <string>
#include <vector>

namespace tailglow {
namespace effects {

// ============================================================================
// EFFECT INFO STRUCTURE
// ============================================================================

/**
 * EffectInfo - Metadata about a built-in effect.
 */
struct EffectInfo {
    std::string id;
    std::string name;
    EffectKind kind;
    std::string description;
};

// ============================================================================
// REGISTRATION FUNCTIONS
// ============================================================================

/**
 * Register all built-in items and abilities.
 *
 * Call once per registry before analysis starts.
 */
void register_all_effects(EffectRegistry& registry);

/**
 * Items: choice items, Life Orb, Leftovers, Boots, type boosters, ...
 */
void register_builtin_items(EffectRegistry& registry);

/**
 * Abilities: immunities, stat multipliers, weather speed, priority, ...
 */
void register_builtin_abilities(EffectRegistry& registry);

/**
 * Metadata of every effect in the registry, items first.
 */
std::vector<EffectInfo> get_effect_info(const EffectRegistry& registry);

/**
 * Check if an item or ability id has modeled behaviour.
 */
bool is_effect_implemented(const EffectRegistry& registry, const std::string& id);

} // namespace effects
} // namespace tailglow
