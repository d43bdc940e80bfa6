#pragma once

/// @file spatial_sync_system.hpp
/// @brief SpatialSyncSystem: reconciles the SpatialIndex with the
///        Position table once per tick.

#include <string_view>

#include "arena/ecs/system_scheduler.hpp"
#include "arena/game/targeting.hpp"

namespace arena::game {

/// Runs last in the tick, after Cleanup has released the dead, and hands
/// the next tick an index that Targeting already trusts.
class SpatialSyncSystem final : public ecs::ISystem {
public:
    explicit SpatialSyncSystem(Targeting& targeting);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "SpatialSyncSystem";
    }

    /// Repairs made during the most recent Execute().
    [[nodiscard]] std::size_t LastRepairCount() const noexcept { return lastRepairs_; }

private:
    Targeting& targeting_;
    std::size_t lastRepairs_ = 0;
};

} // namespace arena::game
