#pragma once

/// @file tick_events.hpp
/// @brief Per-tick damage and death notifications for presentation.

#include "arena/ecs/entity.hpp"
#include "arena/game/math_types.hpp"

#include <vector>

namespace arena::game {

/// One application of damage.  `position` is where the target stood.
struct DamageEvent {
    ecs::Entity source;
    ecs::Entity target;
    float amount = 0.0f;
    Vector2 position;
};

/// A unit's health reached zero this tick.
struct DeathEvent {
    ecs::Entity entity;
    ecs::Entity killer;
};

/// Event buffers owned by a single tick.
struct TickEvents {
    std::vector<DamageEvent> damage;
    std::vector<DeathEvent> deaths;

    void Clear() {
        damage.clear();
        deaths.clear();
    }
};

}  // namespace arena::game
