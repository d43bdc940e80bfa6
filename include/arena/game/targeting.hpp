#pragma once

/// @file targeting.hpp
/// @brief Nearest-enemy proximity queries.

#include <cstdint>
#include <limits>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity.hpp"
#include "arena/game/components.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/spatial_index.hpp"

namespace arena::game {

/// Answers "which living enemy is closest?" for every system that aims.
///
/// With a SpatialIndex attached, bounded queries only visit nearby cells.
/// The first indexed query after MarkUnverified() reconciles the whole
/// index against the component tables, so an entity moved through the
/// Position table alone is still found.  Each returned candidate is
/// checked again; entries for entities that lost Position, Health or Team
/// are dropped and entries indexed at a stale position are moved, then
/// the query is repeated.  Without an index, or for unbounded radii,
/// every entity with Health is scanned.
class Targeting {
public:
    static constexpr float kUnbounded = std::numeric_limits<float>::infinity();

    Targeting(ecs::ComponentStorage<Position>& positions,
              ecs::ComponentStorage<Health>& healths,
              ecs::ComponentStorage<Team>& teams,
              SpatialIndex* index = nullptr);

    /// Attach or detach (nullptr) the spatial index.
    void AttachIndex(SpatialIndex* index) noexcept {
        index_ = index;
        verified_ = false;
    }

    [[nodiscard]] SpatialIndex* Index() const noexcept { return index_; }

    /// Nearest living entity whose team differs from @p team within
    /// @p maxRadius of @p position.  Equal distances resolve to the lowest
    /// entity id.  Returns an invalid handle when nothing qualifies.
    [[nodiscard]] ecs::Entity FindNearestEnemy(const Vector2& position, uint8_t team,
                                               float maxRadius = kUnbounded);

    /// True when @p entity has Position and Team and a living Health.
    [[nodiscard]] bool IsTargetable(ecs::Entity entity) const;

    /// Bring the index in line with the component tables: every
    /// targetable entity indexed at its current position, nothing else
    /// indexed.  Returns the number of repairs made.  No-op without an
    /// index.
    std::size_t Reconcile();

    /// Forget that the index was verified.  Called once per tick, before
    /// any system runs.
    void MarkUnverified() noexcept { verified_ = false; }

    [[nodiscard]] bool IsVerified() const noexcept { return verified_; }

    /// Number of index entries repaired so far.
    [[nodiscard]] std::size_t RepairCount() const noexcept { return repairs_; }

private:
    ecs::Entity findWithIndex(const Vector2& position, uint8_t team, float maxRadius);
    ecs::Entity findLinear(const Vector2& position, uint8_t team, float maxRadius) const;

    ecs::ComponentStorage<Position>& positions_;
    ecs::ComponentStorage<Health>& healths_;
    ecs::ComponentStorage<Team>& teams_;
    SpatialIndex* index_;
    std::size_t repairs_ = 0;
    bool verified_ = false;
};

}  // namespace arena::game
