/**
 * Tail Glow Battle Engine - Effect Registry Implementation
 */

#include "effect_registry.hpp"
#include <algorithm>

namespace tailglow {

EffectDef make_effect(const std::string& id, const std::string& name,
                      EffectKind kind, const std::string& description) {
    EffectDef effect;
    effect.id = to_id(id);
    effect.name = name;
    effect.kind = kind;
    effect.description = description;
    return effect;
}

// ============================================================================
// REGISTRATION
// ============================================================================

void EffectRegistry::register_item(EffectDef effect) {
    effect.kind = EffectKind::ITEM;
    std::string key = effect.id;
    items_[key] = std::move(effect);
}

void EffectRegistry::register_ability(EffectDef effect) {
    effect.kind = EffectKind::ABILITY;
    std::string key = effect.id;
    abilities_[key] = std::move(effect);
}

// ============================================================================
// LOOKUP
// ============================================================================

bool EffectRegistry::has_item(const std::string& item_id) const {
    return get_item(item_id) != nullptr;
}

bool EffectRegistry::has_ability(const std::string& ability_id) const {
    return get_ability(ability_id) != nullptr;
}

const EffectDef* EffectRegistry::get_item(const std::string& item_id) const {
    auto it = items_.find(item_id);
    if (it != items_.end()) {
        return &it->second;
    }
    return nullptr;
}

const EffectDef* EffectRegistry::get_ability(const std::string& ability_id) const {
    auto it = abilities_.find(ability_id);
    if (it != abilities_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::vector<const EffectDef*> EffectRegistry::effects_of(const Combatant& combatant) const {
    std::vector<const EffectDef*> result;
    if (combatant.item.has_value() && !combatant.item->empty()) {
        if (const EffectDef* item = get_item(*combatant.item)) {
            result.push_back(item);
        }
    }
    if (combatant.ability.has_value() && !combatant.ability->empty()) {
        if (const EffectDef* ability = get_ability(*combatant.ability)) {
            result.push_back(ability);
        }
    }
    return result;
}

std::vector<const EffectDef*> EffectRegistry::all_effects() const {
    std::vector<const EffectDef*> items;
    std::vector<const EffectDef*> abilities;
    for (const auto& pair : items_) items.push_back(&pair.second);
    for (const auto& pair : abilities_) abilities.push_back(&pair.second);

    auto by_id = [](const EffectDef* a, const EffectDef* b) { return a->id < b->id; };
    std::sort(items.begin(), items.end(), by_id);
    std::sort(abilities.begin(), abilities.end(), by_id);

    items.insert(items.end(), abilities.begin(), abilities.end());
    return items;
}

bool EffectRegistry::has_trait(const Combatant& combatant, uint32_t trait) const {
    for (const EffectDef* effect : effects_of(combatant)) {
        if (effect->has_trait(trait)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// INVOCATION
// ============================================================================

double EffectRegistry::offensive_stat_modifier(const DamageContext& ctx, Stat stat) const {
    double multiplier = 1.0;
    for (const EffectDef* effect : effects_of(ctx.attacker)) {
        if (effect->attacker_stat) {
            multiplier *= effect->attacker_stat(ctx, stat);
        }
    }
    for (const EffectDef* effect : effects_of(ctx.defender)) {
        if (effect->source_stat) {
            multiplier *= effect->source_stat(ctx, stat);
        }
    }
    return multiplier;
}

double EffectRegistry::defensive_stat_modifier(const DamageContext& ctx, Stat stat) const {
    double multiplier = 1.0;
    for (const EffectDef* effect : effects_of(ctx.defender)) {
        if (effect->defender_stat) {
            multiplier *= effect->defender_stat(ctx, stat);
        }
    }
    return multiplier;
}

double EffectRegistry::base_power_modifier(const DamageContext& ctx) const {
    double multiplier = 1.0;
    for (const EffectDef* effect : effects_of(ctx.attacker)) {
        if (effect->base_power) {
            multiplier *= effect->base_power(ctx);
        }
    }
    return multiplier;
}

std::vector<double> EffectRegistry::final_modifiers(const DamageContext& ctx) const {
    std::vector<double> modifiers;
    for (const EffectDef* effect : effects_of(ctx.attacker)) {
        if (effect->attacker_final) {
            double m = effect->attacker_final(ctx);
            if (m != 1.0) modifiers.push_back(m);
        }
    }
    for (const EffectDef* effect : effects_of(ctx.defender)) {
        if (effect->defender_final) {
            double m = effect->defender_final(ctx);
            if (m != 1.0) modifiers.push_back(m);
        }
    }
    return modifiers;
}

bool EffectRegistry::grants_immunity(const DamageContext& ctx) const {
    for (const EffectDef* effect : effects_of(ctx.defender)) {
        if (effect->immunity && effect->immunity(ctx)) {
            return true;
        }
    }
    return false;
}

double EffectRegistry::speed_modifier(const Combatant& combatant, const FieldState& field) const {
    double multiplier = 1.0;
    for (const EffectDef* effect : effects_of(combatant)) {
        if (effect->speed) {
            multiplier *= effect->speed(combatant, field);
        }
    }
    return multiplier;
}

int EffectRegistry::priority_modifier(const Combatant& combatant, const MoveDef& move,
                                      const FieldState& field) const {
    int delta = 0;
    for (const EffectDef* effect : effects_of(combatant)) {
        if (effect->priority) {
            delta += effect->priority(combatant, move, field);
        }
    }
    return delta;
}

double EffectRegistry::residual_percent(const Combatant& combatant, const FieldState& field) const {
    double total = 0.0;
    for (const EffectDef* effect : effects_of(combatant)) {
        if (effect->residual) {
            total += effect->residual(combatant, field);
        }
    }
    return total;
}

double EffectRegistry::stab_multiplier(const Combatant& attacker) const {
    for (const EffectDef* effect : effects_of(attacker)) {
        if (effect->stab_multiplier > 0.0) {
            return effect->stab_multiplier;
        }
    }
    return 1.5;
}

double EffectRegistry::attack_recoil_percent(const Combatant& attacker) const {
    double total = 0.0;
    for (const EffectDef* effect : effects_of(attacker)) {
        total += effect->attack_recoil_percent;
    }
    return total;
}

double EffectRegistry::contact_damage_percent(const Combatant& defender) const {
    double total = 0.0;
    for (const EffectDef* effect : effects_of(defender)) {
        total += effect->contact_damage_percent;
    }
    return total;
}

bool EffectRegistry::is_grounded(const Combatant& combatant) const {
    if (has_trait(combatant, effect_traits::GROUNDED)) {
        return true;
    }
    if (combatant.has_defensive_type(Type::FLYING)) {
        return false;
    }
    return !has_trait(combatant, effect_traits::UNGROUNDED);
}

} // namespace tailglow
