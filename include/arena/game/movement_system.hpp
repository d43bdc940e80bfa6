#pragma once

/// @file movement_system.hpp
/// @brief MovementSystem: carries manual move orders out.

#include <string_view>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/query.hpp"
#include "arena/ecs/system_scheduler.hpp"
#include "arena/game/components.hpp"
#include "arena/game/match_components.hpp"
#include "arena/game/match_config.hpp"
#include "arena/game/spatial_index.hpp"

namespace arena::game {

/// Component tables the movement system reads and writes.
struct MovementStorages {
    ecs::ComponentStorage<Position>& positions;
    ecs::ComponentStorage<Velocity>& velocities;
    ecs::ComponentStorage<MoveTarget>& moveTargets;
    ecs::ComponentStorage<Health>& healths;
    const ecs::ComponentStorage<BehaviorMode>& modes;
    const ecs::ComponentStorage<ShowdownState>& showdown;
};

/// Straight-line travel toward an active MoveTarget.
///
/// A living unit under manual control heads for its target at
/// MovementParams::speed, never overshooting it.  Velocity holds the
/// heading while the order runs and is zeroed once the unit is within
/// the arrival radius, which also completes the order.  ForcedAuto units
/// are left to the showdown, and nothing moves during SHOWDOWN or ENDED.
class MovementSystem final : public ecs::ISystem {
public:
    MovementSystem(MovementStorages storages, const MovementParams& params,
                   SpatialIndex* index = nullptr);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "MovementSystem";
    }

private:
    [[nodiscard]] bool manualControlLocked() const;

    ecs::Query<Position, Velocity, MoveTarget, Health> movers_;
    const ecs::ComponentStorage<BehaviorMode>& modes_;
    const ecs::ComponentStorage<ShowdownState>& showdown_;
    MovementParams params_;
    SpatialIndex* index_;
};

} // namespace arena::game
