#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle for the simulation world.
///
/// EntityManager hands out versioned handles, recycles released ids and
/// strips every registered component table when an entity dies.  Ids are
/// recycled lowest first, so a replay that spawns and kills in the same
/// order gets the same handles back.

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity.hpp"

#include <cassert>
#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace arena::ecs {

class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Lifecycle ────────────────────────────────────────────────────

    /// New entity.  Reuses the lowest released id, with its version
    /// bumped, before growing the id space.
    [[nodiscard]] Entity Create();

    /// Destroy @p entity now and strip its components.  No-op when dead.
    void Destroy(Entity entity);

    /// Mark @p entity for the next FlushDeferred().  Marking a dead or
    /// already-marked entity does nothing.
    void DestroyDeferred(Entity entity);

    /// Destroy every marked entity that is still alive.
    /// @return The number of entities destroyed.
    std::size_t FlushDeferred();

    // ── State ────────────────────────────────────────────────────────

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    /// Ids ever handed out, live or released.
    [[nodiscard]] std::size_t Capacity() const noexcept { return slots_.size(); }

    [[nodiscard]] std::size_t PendingCount() const noexcept { return pending_.size(); }

    // ── Component tables ─────────────────────────────────────────────

    /// Strip @p storage on every destruction.  Not owned.
    void RegisterStorage(IComponentStorage* storage);

private:
    struct Slot {
        uint8_t version = 0;
        bool alive = false;
        bool pending = false;
    };

    void release(uint32_t id);

    std::vector<Slot> slots_;
    std::priority_queue<uint32_t, std::vector<uint32_t>, std::greater<>> released_;
    std::vector<Entity> pending_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace arena::ecs
