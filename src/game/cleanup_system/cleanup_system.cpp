/// @file cleanup_system.cpp
/// @brief CleanupSystem implementation.

#include "arena/game/cleanup_system.hpp"

#include "arena/foundation/game_logger.hpp"

#include <string>
#include <unordered_set>

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

CleanupSystem::CleanupSystem(ecs::EntityManager& entities,
                             ecs::ComponentStorage<Health>& healths,
                             ecs::ComponentStorage<Projectile>& projectiles,
                             SpatialIndex* index)
    : entities_(entities), healths_(healths), projectiles_(projectiles), index_(index) {}

void CleanupSystem::Execute(float /*deltaTime*/) {
    std::unordered_set<ecs::Entity> dead;
    for (auto entity : healths_.SortedEntities()) {
        if (!healths_.Get(entity).IsAlive()) {
            dead.insert(entity);
            entities_.DestroyDeferred(entity);
            if (index_ != nullptr) {
                index_->Remove(entity);
            }
        }
    }

    std::size_t projectilesReleased = 0;
    for (auto entity : projectiles_.SortedEntities()) {
        const auto& proj = projectiles_.Get(entity);
        const bool ownerGone = !entities_.IsAlive(proj.owner) || dead.contains(proj.owner);
        if (proj.resolved || ownerGone) {
            entities_.DestroyDeferred(entity);
            ++projectilesReleased;
        }
    }

    if (entities_.PendingCount() == 0) {
        return;
    }
    released_ += entities_.FlushDeferred();

    LogContext ctx;
    ctx.extra["units"] = std::to_string(dead.size());
    ctx.extra["projectiles"] = std::to_string(projectilesReleased);
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::ECS, "released entities", ctx);
}

}  // namespace arena::game
