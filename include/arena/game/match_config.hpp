#pragma once

/// @file match_config.hpp
/// @brief Tunable match parameters and their YAML loader.

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/game_result.hpp"
#include "arena/game/math_types.hpp"

#include <cstdint>

namespace arena::game {

/// Times (seconds since match start) at which each phase begins.
struct PhaseThresholds {
    float warning = 120.0f;
    float collapse = 135.0f;
    float showdown = 150.0f;
};

struct DashParams {
    float cooldown = 10.0f;
    float duration = 0.5f;
    float distance = 150.0f;
    float damage = 30.0f;
    float contactRadius = 20.0f;
};

struct ShieldParams {
    float cooldown = 15.0f;
    float duration = 3.0f;
    float reduction = 0.5f;
};

struct RangedParams {
    float cooldown = 8.0f;
    float duration = 0.5f;
    float range = 300.0f;
    float damage = 40.0f;
    float projectileSpeed = 400.0f;
    float hitRadius = 15.0f;
};

/// Auto-attack used during SHOWDOWN by units that carry no Damage.
struct BaseAttackParams {
    float damage = 10.0f;
    float range = 150.0f;
    float attackSpeed = 1.0f;
};

/// Straight-line travel toward a unit's move order.
struct MovementParams {
    float speed = 100.0f;
    float arrivalRadius = 5.0f;  ///< Orders closer than this are complete.
};

/// Everything a Simulation needs to run a match.
struct MatchConfig {
    PhaseThresholds phases;
    float matchEndTime = 180.0f;

    Vector2 arenaCenter{960.0f, 540.0f};
    float teleportRadius = 200.0f;
    uint32_t seed = 0x5EED;

    float chaseSpeed = 100.0f;
    float cellSize = 100.0f;

    MovementParams movement;

    DashParams dash;
    ShieldParams shield;
    RangedParams ranged;
    BaseAttackParams baseAttack;
};

/// Check ordering and sign constraints.
///
/// Fails with InvalidArgument when thresholds are not ordered
/// warning <= collapse <= showdown <= matchEndTime, or when any radius,
/// cell size, speed or cooldown is out of range.
[[nodiscard]] foundation::GameResult<void> ValidateMatchConfig(const MatchConfig& config);

/// Build a MatchConfig from @p config, starting from defaults and
/// overriding every key that is present.
///
/// Recognized keys:
/// @code
///   match.phases.{warning,collapse,showdown}   match.end_time   match.seed
///   arena.{center_x,center_y,teleport_radius,cell_size}
///   combat.chase_speed
///   movement.{speed,arrival_radius}
///   combat.base_attack.{damage,range,attack_speed}
///   abilities.dash.{cooldown,duration,distance,damage,contact_radius}
///   abilities.shield.{cooldown,duration,reduction}
///   abilities.ranged.{cooldown,duration,range,damage,projectile_speed,hit_radius}
/// @endcode
[[nodiscard]] foundation::GameResult<MatchConfig>
LoadMatchConfig(const foundation::ConfigManager& config);

}  // namespace arena::game
