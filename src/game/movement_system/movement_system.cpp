/// @file movement_system.cpp
/// @brief MovementSystem implementation.

#include "arena/game/movement_system.hpp"

#include "arena/foundation/game_logger.hpp"

#include <algorithm>

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

MovementSystem::MovementSystem(MovementStorages storages, const MovementParams& params,
                               SpatialIndex* index)
    : movers_(storages.positions, storages.velocities, storages.moveTargets, storages.healths),
      modes_(storages.modes),
      showdown_(storages.showdown),
      params_(params),
      index_(index) {}

bool MovementSystem::manualControlLocked() const {
    return std::any_of(showdown_.begin(), showdown_.end(), [](const ShowdownState& s) {
        return s.state == MatchPhase::Showdown || s.state == MatchPhase::Ended;
    });
}

void MovementSystem::Execute(float deltaTime) {
    if (manualControlLocked()) {
        return;
    }

    const float arrivalSq = params_.arrivalRadius * params_.arrivalRadius;

    movers_.ForEach([&](ecs::Entity entity, Position& pos, Velocity& vel, MoveTarget& target,
                        Health& hp) {
        if (!target.active || !hp.IsAlive()) {
            return;
        }
        if (const auto* mode = modes_.Find(entity); mode != nullptr && IsForcedAuto(*mode)) {
            return;
        }

        const Vector2 goal{target.x, target.y};
        Vector2 offset = goal - pos.ToVector();
        if (offset.LengthSquared() > arrivalSq) {
            const float distance = offset.Length();
            const Vector2 dir = offset.Normalized();
            vel.Set(dir * params_.speed);

            pos.Set(pos.ToVector() + dir * std::min(params_.speed * deltaTime, distance));
            if (index_ != nullptr) {
                index_->Update(entity, pos.ToVector());
            }
            offset = goal - pos.ToVector();
        }

        if (offset.LengthSquared() <= arrivalSq) {
            target.active = false;
            vel.Set({0.0f, 0.0f});

            LogContext ctx;
            ctx.entityId = entity.id();
            ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Input, "move order complete", ctx);
        }
    });
}

}  // namespace arena::game
