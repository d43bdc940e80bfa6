#pragma once

/// @file spatial_index.hpp
/// @brief Grid-based spatial partitioning index.
///
/// SpatialIndex divides the arena into uniform square cells and keeps,
/// for every tracked entity, its cell and the exact position it was
/// indexed at.  Radius queries visit only the overlapping cells and then
/// filter by exact distance.

#include <cmath>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "arena/ecs/entity.hpp"
#include "arena/game/math_types.hpp"

namespace arena::game {

/// Grid cell coordinate.
struct CellCoord {
    int32_t x = 0;
    int32_t y = 0;

    constexpr bool operator==(const CellCoord&) const = default;
};

} // namespace arena::game

template <>
struct std::hash<arena::game::CellCoord> {
    std::size_t operator()(const arena::game::CellCoord& c) const noexcept {
        auto h1 = std::hash<int32_t>{}(c.x);
        auto h2 = std::hash<int32_t>{}(c.y);
        return h1 ^ (h2 * 2654435761u);
    }
};

namespace arena::game {

/// Sparse uniform grid of entities.
///
/// The index is a cache of the Position table, not the source of truth:
/// callers that move an entity are expected to Update() it, and the
/// spatial sync step reconciles anything that was missed.
///
/// Thread safety: None.
class SpatialIndex {
public:
    static constexpr float kDefaultCellSize = 100.0f;

    explicit SpatialIndex(float cellSize = kDefaultCellSize);

    // -- Mutation -------------------------------------------------------

    /// Track @p entity at @p position (same as Update() if already tracked).
    void Insert(ecs::Entity entity, const Vector2& position);

    /// Move @p entity to @p newPosition (same as Insert() if untracked).
    void Update(ecs::Entity entity, const Vector2& newPosition);

    /// Stop tracking @p entity.  No-op if it is not tracked.
    void Remove(ecs::Entity entity);

    void Clear();

    // -- Queries --------------------------------------------------------

    /// Entities whose indexed position lies within @p radius of
    /// @p center, sorted by ascending entity id.
    [[nodiscard]] std::vector<ecs::Entity>
    QueryRadius(const Vector2& center, float radius) const;

    /// Position @p entity was last indexed at, if tracked.
    [[nodiscard]] std::optional<Vector2> IndexedPosition(ecs::Entity entity) const;

    /// All tracked entities, sorted by ascending id.
    [[nodiscard]] std::vector<ecs::Entity> TrackedEntities() const;

    // -- Accessors ------------------------------------------------------

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    [[nodiscard]] float CellSize() const noexcept { return cellSize_; }

    [[nodiscard]] bool Contains(ecs::Entity entity) const;

    [[nodiscard]] CellCoord WorldToCell(const Vector2& pos) const noexcept {
        return {
            static_cast<int32_t>(std::floor(pos.x / cellSize_)),
            static_cast<int32_t>(std::floor(pos.y / cellSize_))
        };
    }

private:
    struct Entry {
        CellCoord cell;
        Vector2 position;
    };

    void removeFromCell(ecs::Entity entity, CellCoord cell);
    void addToCell(ecs::Entity entity, CellCoord cell);

    float cellSize_;

    /// cell coord -> entities in that cell.
    std::unordered_map<CellCoord, std::vector<ecs::Entity>> cells_;

    /// entity -> cell and indexed position.
    std::unordered_map<ecs::Entity, Entry> entries_;
};

} // namespace arena::game
