#pragma once

/// @file components.hpp
/// @brief Core unit components: Position, Velocity, Health, Team, Damage,
///        MoveTarget.
///
/// Each struct is a plain data component designed for sparse-set storage
/// via ComponentStorage<T>.  Setters that guard an invariant clamp rather
/// than reject.

#include "arena/game/math_types.hpp"

#include <algorithm>
#include <cstdint>

namespace arena::game {

/// Number of teams in a match.  Team ids are 0 and 1.
constexpr uint8_t kTeamCount = 2;

// ── Position / Velocity ─────────────────────────────────────────────────

/// World-space location of an entity.
struct Position {
    float x = 0.0f;
    float y = 0.0f;

    [[nodiscard]] Vector2 ToVector() const noexcept { return {x, y}; }

    void Set(const Vector2& v) noexcept {
        x = v.x;
        y = v.y;
    }
};

/// Facing and movement direction.  Not integrated by the core except
/// where a system says so (chase, projectiles).
struct Velocity {
    float x = 0.0f;
    float y = 0.0f;

    [[nodiscard]] Vector2 ToVector() const noexcept { return {x, y}; }

    void Set(const Vector2& v) noexcept {
        x = v.x;
        y = v.y;
    }
};

// ── Health ──────────────────────────────────────────────────────────────

/// Hit points.  `current` always stays within [0, max]; an entity is
/// alive while `current > 0`.
struct Health {
    float current = 0.0f;
    float max = 0.0f;

    void SetCurrent(float value) noexcept {
        current = std::clamp(value, 0.0f, max);
    }

    [[nodiscard]] bool IsAlive() const noexcept { return current > 0.0f; }
};

// ── Team ────────────────────────────────────────────────────────────────

struct Team {
    uint8_t id = 0;
};

/// Heading a stationary member of @p teamId faces: team 0 attacks
/// toward +x, team 1 toward -x.
[[nodiscard]] inline Vector2 DefaultHeading(uint8_t teamId) noexcept {
    return teamId == 0 ? Vector2{1.0f, 0.0f} : Vector2{-1.0f, 0.0f};
}

// ── Damage ──────────────────────────────────────────────────────────────

/// Auto-attack profile.  `attackSpeed` is attacks per second; `cooldown`
/// counts down to the next permitted attack.
struct Damage {
    float amount = 0.0f;
    float range = 0.0f;
    float attackSpeed = 1.0f;
    float cooldown = 0.0f;
};

// ── MoveTarget ──────────────────────────────────────────────────────────

/// Destination requested by the player for a manually controlled unit.
struct MoveTarget {
    float x = 0.0f;
    float y = 0.0f;
    bool active = false;
};

}  // namespace arena::game
