/**
 * Tail Glow Battle Engine - Effect Registry
 *
 * Central registry for item and ability behaviour that changes damage,
 * speed, priority or end-of-turn residuals.
 *
 * Architecture:
 * - Each item/ability is one EffectDef record keyed by normalized id
 * - A record carries optional hook callbacks plus static trait bits
 * - Lookup goes through the combatant's revealed item/ability; unknown
 *   (unrevealed) effects contribute nothing
 *
 * Example usage:
 *   EffectDef life_orb = make_effect("lifeorb", "Life Orb", EffectKind::ITEM);
 *   life_orb.attacker_final = [](const DamageContext&) { return 1.3; };
 *   registry.register_item(std::move(life_orb));
 *
 *   std::vector<double> mods = registry.final_modifiers(ctx);
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "move_database.hpp"
#include <functional>
#include <unordered_map>

namespace tailglow {

// ============================================================================
// CONTEXT TYPES
// ============================================================================

/**
 * Everything a damage hook may inspect for one attack.
 */
struct DamageContext {
    const Combatant& attacker;
    const Combatant& defender;
    const MoveDef& move;
    Type move_type;               // After type-changing effects (Weather Ball)
    int power;                    // Resolved base power before modifiers
    const FieldState& field;
    double type_effectiveness = 1.0;
};

// ============================================================================
// CALLBACK TYPES
// ============================================================================

// Stat modifier: (context, stat being used) -> multiplier
using StatModifierCallback = std::function<double(const DamageContext&, Stat)>;

// Power/final damage modifier: (context) -> multiplier
using DamageModifierCallback = std::function<double(const DamageContext&)>;

// Immunity: (context) -> true if the holder takes no damage from the move
using ImmunityCallback = std::function<bool(const DamageContext&)>;

// Speed: (holder, field) -> multiplier
using SpeedCallback = std::function<double(const Combatant&, const FieldState&)>;

// Priority: (holder, move, field) -> priority delta
using PriorityCallback = std::function<int(const Combatant&, const MoveDef&, const FieldState&)>;

// Residual: (holder, field) -> end-of-turn HP change in percent (+heal / -damage)
using ResidualCallback = std::function<double(const Combatant&, const FieldState&)>;

// ============================================================================
// EFFECT DEFINITION
// ============================================================================

enum class EffectKind : uint8_t {
    ITEM,
    ABILITY
};

namespace effect_traits {
constexpr uint32_t BLOCKS_INDIRECT        = 1u << 0;   // Magic Guard
constexpr uint32_t IGNORES_HAZARDS        = 1u << 1;   // Heavy-Duty Boots
constexpr uint32_t IGNORES_BURN_PENALTY   = 1u << 2;   // Guts
constexpr uint32_t IGNORES_PARALYSIS_SPEED = 1u << 3;  // Quick Feet
constexpr uint32_t SURVIVES_AT_FULL_HP    = 1u << 4;   // Sturdy, Focus Sash
constexpr uint32_t BLOCKS_OHKO            = 1u << 5;   // Sturdy
constexpr uint32_t WEATHER_IMMUNE         = 1u << 6;   // Overcoat, sand abilities
constexpr uint32_t IGNORES_OPPONENT_BOOSTS = 1u << 7;  // Unaware
constexpr uint32_t UNGROUNDED             = 1u << 8;   // Levitate, Air Balloon
constexpr uint32_t GROUNDED               = 1u << 9;   // Iron Ball
constexpr uint32_t MAX_HITS               = 1u << 10;  // Skill Link
constexpr uint32_t POISON_HEAL            = 1u << 11;  // Poison Heal
constexpr uint32_t CHOICE_LOCK            = 1u << 12;  // Choice items
constexpr uint32_t PREVENTS_RECOIL        = 1u << 13;  // Rock Head
constexpr uint32_t HALVES_BURN_DAMAGE     = 1u << 14;  // Heatproof
} // namespace effect_traits

/**
 * EffectDef - One item or ability.
 *
 * Hooks left empty are skipped. Modifiers are applied only when the holder's
 * item/ability is revealed.
 */
struct EffectDef {
    std::string id;
    std::string name;
    EffectKind kind = EffectKind::ITEM;
    std::string description;

    // Damage hooks (holder is the attacker)
    StatModifierCallback attacker_stat;       // Choice Band, Huge Power, Guts
    DamageModifierCallback base_power;        // Technician, Iron Fist
    DamageModifierCallback attacker_final;    // Life Orb, Expert Belt

    // Damage hooks (holder is the defender)
    StatModifierCallback defender_stat;       // Assault Vest, Eviolite, Fur Coat
    StatModifierCallback source_stat;         // Thick Fat (modifies the attacker's stat)
    DamageModifierCallback defender_final;    // Multiscale, Filter
    ImmunityCallback immunity;                // Levitate, Flash Fire

    // Turn order
    SpeedCallback speed;
    PriorityCallback priority;

    // End of turn
    ResidualCallback residual;

    uint32_t traits = 0;
    double stab_multiplier = 0.0;             // Overrides 1.5 when non-zero (Adaptability)
    double attack_recoil_percent = 0.0;       // Own max HP lost per damaging hit (Life Orb)
    double contact_damage_percent = 0.0;      // Attacker max HP lost on contact (Rocky Helmet)

    bool has_trait(uint32_t trait) const { return (traits & trait) != 0; }
};

/**
 * Create an empty record with identity fields filled in.
 */
EffectDef make_effect(const std::string& id, const std::string& name,
                      EffectKind kind, const std::string& description = "");

// ============================================================================
// EFFECT REGISTRY
// ============================================================================

/**
 * EffectRegistry - Central registry for item and ability effects.
 *
 * Thread-safe for read operations (lookup).
 * Not thread-safe for registration (call before analysis starts).
 */
class EffectRegistry {
public:
    EffectRegistry() = default;
    ~EffectRegistry() = default;

    // ========================================================================
    // REGISTRATION
    // ========================================================================

    void register_item(EffectDef effect);
    void register_ability(EffectDef effect);

    // ========================================================================
    // LOOKUP
    // ========================================================================

    bool has_item(const std::string& item_id) const;
    bool has_ability(const std::string& ability_id) const;

    /**
     * Returns nullptr if no effect is registered under the id.
     */
    const EffectDef* get_item(const std::string& item_id) const;
    const EffectDef* get_ability(const std::string& ability_id) const;

    /**
     * Revealed item/ability effects of a combatant (0-2 records).
     */
    std::vector<const EffectDef*> effects_of(const Combatant& combatant) const;

    /**
     * All registered records, items first, each group sorted by id.
     */
    std::vector<const EffectDef*> all_effects() const;

    /**
     * True if the combatant's revealed item or ability carries the trait.
     */
    bool has_trait(const Combatant& combatant, uint32_t trait) const;

    // ========================================================================
    // INVOCATION
    // ========================================================================

    /**
     * Multiplier on the attacker's offensive stat (attacker hooks and
     * defender source hooks).
     */
    double offensive_stat_modifier(const DamageContext& ctx, Stat stat) const;

    /**
     * Multiplier on the defender's defensive stat.
     */
    double defensive_stat_modifier(const DamageContext& ctx, Stat stat) const;

    double base_power_modifier(const DamageContext& ctx) const;

    /**
     * Final damage modifiers from both sides, applied one at a time.
     */
    std::vector<double> final_modifiers(const DamageContext& ctx) const;

    /**
     * True if the defender's revealed effects make it immune to the move.
     */
    bool grants_immunity(const DamageContext& ctx) const;

    double speed_modifier(const Combatant& combatant, const FieldState& field) const;

    int priority_modifier(const Combatant& combatant, const MoveDef& move,
                          const FieldState& field) const;

    /**
     * Sum of item/ability residual HP changes (percent).
     */
    double residual_percent(const Combatant& combatant, const FieldState& field) const;

    /**
     * STAB multiplier (1.5 unless an effect overrides it).
     */
    double stab_multiplier(const Combatant& attacker) const;

    double attack_recoil_percent(const Combatant& attacker) const;
    double contact_damage_percent(const Combatant& defender) const;

    /**
     * Grounded unless Flying-type or ungrounded by an effect; Iron Ball wins.
     */
    bool is_grounded(const Combatant& combatant) const;

    // ========================================================================
    // STATISTICS
    // ========================================================================

    size_t item_count() const { return items_.size(); }
    size_t ability_count() const { return abilities_.size(); }

private:
    std::unordered_map<std::string, EffectDef> items_;
    std::unordered_map<std::string, EffectDef> abilities_;
};

} // namespace tailglow
