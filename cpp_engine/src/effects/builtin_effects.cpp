/**
 * Tail Glow Battle Engine - Built-in Effects Registration
 */

#include "effects/builtin_effects.hpp"

namespace tailglow {
namespace effects {

// ============================================================================
// REGISTRATION
// ============================================================================

void register_all_effects(EffectRegistry& registry) {
    register_builtin_items(registry);
    register_builtin_abilities(registry);
}

std::vector<EffectInfo> get_effect_info(const EffectRegistry& registry) {
    std::vector<EffectInfo> info;
    for (const EffectDef* effect : registry.all_effects()) {
        info.push_back({effect->id, effect->name, effect->kind, effect->description});
    }
    return info;
}

bool is_effect_implemented(const EffectRegistry& registry, const std::string& id) {
    std::string key = to_id(id);
    return registry.has_item(key) || registry.has_ability(key);
}

} // namespace effects
} // namespace tailglow
