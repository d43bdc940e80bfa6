#pragma once

/// @file ability_components.hpp
/// @brief Ability state components (Dash, Shield, RangedAttack) and the
///        Projectile component spawned by ranged attacks.
///
/// Every ability follows the same timer model:
///
/// @code
///   Idle ──activate──► Active ──(active hits 0)──► CoolingDown ──► Idle
///                      (cooldown runs from activation, so Active and
///                       CoolingDown overlap while both timers are > 0)
/// @endcode
///
/// `active` and `cooldown` are remaining seconds, floored at 0.

#include "arena/ecs/entity.hpp"
#include "arena/game/math_types.hpp"

#include <cstdint>
#include <string_view>

namespace arena::game {

/// Activatable ability kinds.  Key bindings live in the input layer.
enum class AbilityKind : uint8_t {
    Dash,
    Shield,
    RangedAttack
};

[[nodiscard]] constexpr std::string_view AbilityKindName(AbilityKind kind) noexcept {
    switch (kind) {
        case AbilityKind::Dash:         return "Dash";
        case AbilityKind::Shield:       return "Shield";
        case AbilityKind::RangedAttack: return "RangedAttack";
    }
    return "Unknown";
}

/// Observable state of a single ability.
enum class AbilityPhase : uint8_t {
    Idle,
    Active,
    CoolingDown
};

/// Instant reposition along the facing direction, hurting enemies in
/// the swept path.
struct Dash {
    float active = 0.0f;
    float cooldown = 0.0f;
    float maxCooldown = 10.0f;
    float duration = 0.5f;
    float distance = 150.0f;
    float damage = 30.0f;
};

/// Temporary incoming-damage reduction.
struct Shield {
    float active = 0.0f;
    float cooldown = 0.0f;
    float maxCooldown = 15.0f;
    float duration = 3.0f;
    float reduction = 0.5f;  ///< Fraction of damage absorbed while active.
};

/// Fires a projectile at the nearest enemy in range.
struct RangedAttack {
    float active = 0.0f;
    float cooldown = 0.0f;
    float maxCooldown = 8.0f;
    float duration = 0.5f;
    float range = 300.0f;
    float damage = 40.0f;
    float projectileSpeed = 400.0f;
    ecs::Entity projectile;  ///< Most recently fired projectile.
};

/// In-flight projectile.  Carries Position and Velocity alongside.
struct Projectile {
    ecs::Entity owner;
    uint8_t ownerTeam = 0;
    float damage = 0.0f;
    Vector2 origin;
    float maxDistance = 0.0f;
    float hitRadius = 0.0f;
    bool resolved = false;  ///< Hit something or ran out of range.
};

/// Derive the observable phase of an ability from its timers.
template <typename Ability>
[[nodiscard]] constexpr AbilityPhase PhaseOf(const Ability& ability) noexcept {
    if (ability.active > 0.0f) {
        return AbilityPhase::Active;
    }
    if (ability.cooldown > 0.0f) {
        return AbilityPhase::CoolingDown;
    }
    return AbilityPhase::Idle;
}

/// True when the ability may be activated this tick.
template <typename Ability>
[[nodiscard]] constexpr bool IsReady(const Ability& ability) noexcept {
    return ability.cooldown <= 0.0f;
}

}  // namespace arena::game
