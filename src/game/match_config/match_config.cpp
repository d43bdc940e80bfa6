/// @file match_config.cpp
/// @brief MatchConfig validation and YAML overlay.

#include "arena/game/match_config.hpp"

#include "arena/foundation/game_logger.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace arena::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

/// Sections LoadMatchConfig reads from; "headless" belongs to the runner.
constexpr std::string_view kMatchSections[] = {"match", "arena", "movement", "combat",
                                               "abilities"};

/// Replace @p out with the value under @p key when the key is present.
template <typename T>
GameResult<void> overlay(const ConfigManager& config, std::string_view key, T& out) {
    auto value = config.getOr<T>(key, out);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    out = value.value();
    return GameResult<void>::ok();
}

void warnUnknownKeys(const ConfigManager& config,
                     const std::set<std::string_view, std::less<>>& known) {
    for (auto section : kMatchSections) {
        for (const auto& key : config.keysUnder(section)) {
            if (known.find(key) == known.end()) {
                ARENA_LOG_WARN(foundation::LogCategory::Config,
                               config.source() + ": ignoring unknown key " + key);
            }
        }
    }
}

GameResult<void> invalid(std::string message) {
    return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, std::move(message)));
}

} // namespace

GameResult<void> ValidateMatchConfig(const MatchConfig& config) {
    const auto& p = config.phases;
    if (p.warning < 0.0f || p.warning > p.collapse || p.collapse > p.showdown) {
        return invalid("phase thresholds must satisfy 0 <= warning <= collapse <= showdown");
    }
    if (p.showdown > config.matchEndTime) {
        return invalid("match.end_time must not precede the showdown threshold");
    }
    if (config.teleportRadius <= 0.0f) {
        return invalid("arena.teleport_radius must be positive");
    }
    if (config.cellSize <= 0.0f) {
        return invalid("arena.cell_size must be positive");
    }
    if (config.chaseSpeed < 0.0f) {
        return invalid("combat.chase_speed must not be negative");
    }
    if (config.movement.speed < 0.0f || config.movement.arrivalRadius <= 0.0f) {
        return invalid("movement.speed must not be negative and movement.arrival_radius must be positive");
    }
    if (config.baseAttack.attackSpeed <= 0.0f || config.baseAttack.range <= 0.0f) {
        return invalid("combat.base_attack range and attack_speed must be positive");
    }
    if (config.dash.contactRadius <= 0.0f || config.ranged.hitRadius <= 0.0f) {
        return invalid("ability collision radii must be positive");
    }
    if (config.ranged.range <= 0.0f || config.ranged.projectileSpeed <= 0.0f) {
        return invalid("abilities.ranged range and projectile_speed must be positive");
    }
    if (config.dash.cooldown < 0.0f || config.shield.cooldown < 0.0f ||
        config.ranged.cooldown < 0.0f) {
        return invalid("ability cooldowns must not be negative");
    }
    if (config.shield.reduction < 0.0f || config.shield.reduction > 1.0f) {
        return invalid("abilities.shield.reduction must lie in [0, 1]");
    }
    return GameResult<void>::ok();
}

GameResult<MatchConfig> LoadMatchConfig(const ConfigManager& config) {
    MatchConfig out;

    const std::pair<std::string_view, float*> floats[] = {
        {"match.phases.warning", &out.phases.warning},
        {"match.phases.collapse", &out.phases.collapse},
        {"match.phases.showdown", &out.phases.showdown},
        {"match.end_time", &out.matchEndTime},
        {"arena.center_x", &out.arenaCenter.x},
        {"arena.center_y", &out.arenaCenter.y},
        {"arena.teleport_radius", &out.teleportRadius},
        {"arena.cell_size", &out.cellSize},
        {"combat.chase_speed", &out.chaseSpeed},
        {"movement.speed", &out.movement.speed},
        {"movement.arrival_radius", &out.movement.arrivalRadius},
        {"combat.base_attack.damage", &out.baseAttack.damage},
        {"combat.base_attack.range", &out.baseAttack.range},
        {"combat.base_attack.attack_speed", &out.baseAttack.attackSpeed},
        {"abilities.dash.cooldown", &out.dash.cooldown},
        {"abilities.dash.duration", &out.dash.duration},
        {"abilities.dash.distance", &out.dash.distance},
        {"abilities.dash.damage", &out.dash.damage},
        {"abilities.dash.contact_radius", &out.dash.contactRadius},
        {"abilities.shield.cooldown", &out.shield.cooldown},
        {"abilities.shield.duration", &out.shield.duration},
        {"abilities.shield.reduction", &out.shield.reduction},
        {"abilities.ranged.cooldown", &out.ranged.cooldown},
        {"abilities.ranged.duration", &out.ranged.duration},
        {"abilities.ranged.range", &out.ranged.range},
        {"abilities.ranged.damage", &out.ranged.damage},
        {"abilities.ranged.projectile_speed", &out.ranged.projectileSpeed},
        {"abilities.ranged.hit_radius", &out.ranged.hitRadius},
    };

    std::set<std::string_view, std::less<>> known{"match.seed"};
    for (const auto& [key, target] : floats) {
        known.insert(key);
    }
    warnUnknownKeys(config, known);

    for (const auto& [key, target] : floats) {
        if (auto r = overlay(config, key, *target); !r) {
            return GameResult<MatchConfig>::err(r.error());
        }
    }
    if (auto r = overlay(config, "match.seed", out.seed); !r) {
        return GameResult<MatchConfig>::err(r.error());
    }

    if (auto r = ValidateMatchConfig(out); !r) {
        ARENA_LOG_ERROR(foundation::LogCategory::Config,
                        std::string("rejected match config: ") + std::string(r.error().message()));
        return GameResult<MatchConfig>::err(r.error());
    }

    return GameResult<MatchConfig>::ok(out);
}

}  // namespace arena::game
