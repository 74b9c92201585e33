/**
 * Tail Glow Battle Engine - Field State
 *
 * Weather, terrain, room effects and per-side conditions (hazards, screens,
 * Tailwind).
 */

#pragma once

#include "types.hpp"
#include <array>

namespace tailglow {

/**
 * SideConditions - Hazards and screens on one side of the field.
 */
struct SideConditions {
    bool stealth_rock = false;
    int spikes = 0;            // 0-3 layers
    int toxic_spikes = 0;      // 0-2 layers
    bool sticky_web = false;

    int reflect_turns = 0;
    int light_screen_turns = 0;
    int aurora_veil_turns = 0;
    int tailwind_turns = 0;

    bool has_reflect() const { return reflect_turns > 0; }
    bool has_light_screen() const { return light_screen_turns > 0; }
    bool has_aurora_veil() const { return aurora_veil_turns > 0; }
    bool has_tailwind() const { return tailwind_turns > 0; }

    bool has_hazards() const {
        return stealth_rock || spikes > 0 || toxic_spikes > 0 || sticky_web;
    }
};

/**
 * FieldState - Global battle conditions.
 */
struct FieldState {
    Weather weather = Weather::NONE;
    Terrain terrain = Terrain::NONE;
    int trick_room_turns = 0;
    int turn = 0;

    std::array<SideConditions, 2> sides;

    bool trick_room() const { return trick_room_turns > 0; }

    SideConditions& side(SideID id) { return sides[id & 1]; }
    const SideConditions& side(SideID id) const { return sides[id & 1]; }

    /**
     * Pack weather, terrain, Trick Room, screens and Tailwind into one value
     * so a field change produces a different matchup key.
     */
    uint32_t signature() const {
        uint32_t sig = static_cast<uint32_t>(weather)
                     | (static_cast<uint32_t>(terrain) << 4)
                     | (static_cast<uint32_t>(trick_room() ? 1 : 0) << 8);
        for (int s = 0; s < 2; s++) {
            const SideConditions& c = sides[s];
            uint32_t bits = (c.has_reflect() ? 1u : 0u)
                          | (c.has_light_screen() ? 2u : 0u)
                          | (c.has_aurora_veil() ? 4u : 0u)
                          | (c.has_tailwind() ? 8u : 0u);
            sig |= bits << (12 + 4 * s);
        }
        return sig;
    }

    FieldState clone() const {
        return *this;
    }
};

} // namespace tailglow
