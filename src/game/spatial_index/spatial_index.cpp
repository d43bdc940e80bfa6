/// @file spatial_index.cpp
/// @brief Uniform grid SpatialIndex implementation.

#include "arena/game/spatial_index.hpp"

#include <algorithm>

namespace arena::game {

SpatialIndex::SpatialIndex(float cellSize) : cellSize_(cellSize) {
    if (cellSize_ <= 0.0f) {
        cellSize_ = kDefaultCellSize;
    }
}

void SpatialIndex::Insert(ecs::Entity entity, const Vector2& position) {
    if (Contains(entity)) {
        Update(entity, position);
        return;
    }
    auto cell = WorldToCell(position);
    addToCell(entity, cell);
    entries_[entity] = Entry{cell, position};
}

void SpatialIndex::Update(ecs::Entity entity, const Vector2& newPosition) {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        Insert(entity, newPosition);
        return;
    }

    it->second.position = newPosition;

    auto newCell = WorldToCell(newPosition);
    if (it->second.cell == newCell) {
        return;
    }

    removeFromCell(entity, it->second.cell);
    addToCell(entity, newCell);
    it->second.cell = newCell;
}

void SpatialIndex::Remove(ecs::Entity entity) {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        return;
    }
    removeFromCell(entity, it->second.cell);
    entries_.erase(it);
}

void SpatialIndex::Clear() {
    cells_.clear();
    entries_.clear();
}

std::vector<ecs::Entity> SpatialIndex::QueryRadius(const Vector2& center, float radius) const {
    std::vector<ecs::Entity> result;

    if (radius < 0.0f) {
        return result;
    }

    const int32_t minCellX = static_cast<int32_t>(std::floor((center.x - radius) / cellSize_));
    const int32_t maxCellX = static_cast<int32_t>(std::floor((center.x + radius) / cellSize_));
    const int32_t minCellY = static_cast<int32_t>(std::floor((center.y - radius) / cellSize_));
    const int32_t maxCellY = static_cast<int32_t>(std::floor((center.y + radius) / cellSize_));

    const float radiusSq = radius * radius;

    for (int32_t cx = minCellX; cx <= maxCellX; ++cx) {
        for (int32_t cy = minCellY; cy <= maxCellY; ++cy) {
            auto it = cells_.find(CellCoord{cx, cy});
            if (it == cells_.end()) {
                continue;
            }
            for (auto entity : it->second) {
                const auto& entry = entries_.at(entity);
                if ((entry.position - center).LengthSquared() <= radiusSq) {
                    result.push_back(entity);
                }
            }
        }
    }

    std::sort(result.begin(), result.end(), ecs::EntityIdLess{});
    return result;
}

std::optional<Vector2> SpatialIndex::IndexedPosition(ecs::Entity entity) const {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.position;
}

std::vector<ecs::Entity> SpatialIndex::TrackedEntities() const {
    std::vector<ecs::Entity> result;
    result.reserve(entries_.size());
    for (const auto& [entity, entry] : entries_) {
        result.push_back(entity);
    }
    std::sort(result.begin(), result.end(), ecs::EntityIdLess{});
    return result;
}

bool SpatialIndex::Contains(ecs::Entity entity) const {
    return entries_.contains(entity);
}

void SpatialIndex::removeFromCell(ecs::Entity entity, CellCoord cell) {
    auto it = cells_.find(cell);
    if (it == cells_.end()) {
        return;
    }
    auto& vec = it->second;
    std::erase(vec, entity);
    if (vec.empty()) {
        cells_.erase(it);
    }
}

void SpatialIndex::addToCell(ecs::Entity entity, CellCoord cell) {
    cells_[cell].push_back(entity);
}

}  // namespace arena::game
