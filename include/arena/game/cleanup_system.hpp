#pragma once

/// @file cleanup_system.hpp
/// @brief CleanupSystem: releases dead units and finished projectiles.

#include <string_view>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity_manager.hpp"
#include "arena/ecs/system_scheduler.hpp"
#include "arena/game/ability_components.hpp"
#include "arena/game/components.hpp"
#include "arena/game/spatial_index.hpp"

namespace arena::game {

/// Destroys, at the end of each tick:
///   - every entity whose Health reached 0 (dropping its index entry);
///   - every resolved projectile;
///   - every projectile whose owner is dead or gone.
///
/// Destruction is deferred and flushed once, after the whole set is known.
/// A tick with nothing to release leaves the world untouched.  Runs on the
/// tick that ends the match too, so the final world holds no corpses.
class CleanupSystem final : public ecs::ISystem {
public:
    CleanupSystem(ecs::EntityManager& entities,
                  ecs::ComponentStorage<Health>& healths,
                  ecs::ComponentStorage<Projectile>& projectiles,
                  SpatialIndex* index);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "CleanupSystem";
    }

    /// Total entities released since construction.
    [[nodiscard]] std::size_t ReleasedCount() const noexcept { return released_; }

private:
    ecs::EntityManager& entities_;
    ecs::ComponentStorage<Health>& healths_;
    ecs::ComponentStorage<Projectile>& projectiles_;
    SpatialIndex* index_;
    std::size_t released_ = 0;
};

} // namespace arena::game
