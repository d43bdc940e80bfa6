/// @file entity_manager.cpp
/// @brief EntityManager implementation.

#include "arena/ecs/entity_manager.hpp"

#include <utility>

namespace arena::ecs {

Entity EntityManager::Create() {
    uint32_t id = 0;
    if (released_.empty()) {
        id = static_cast<uint32_t>(slots_.size());
        assert(id <= Entity::kMaxId && "entity id space exhausted");
        slots_.emplace_back();
    } else {
        id = released_.top();
        released_.pop();
    }

    auto& slot = slots_[id];
    slot.alive = true;
    ++count_;
    return Entity(id, slot.version);
}

void EntityManager::Destroy(Entity entity) {
    if (IsAlive(entity)) {
        release(entity.id());
    }
}

void EntityManager::DestroyDeferred(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    auto& slot = slots_[entity.id()];
    if (!slot.pending) {
        slot.pending = true;
        pending_.push_back(entity);
    }
}

std::size_t EntityManager::FlushDeferred() {
    std::size_t destroyed = 0;
    for (const auto entity : std::exchange(pending_, {})) {
        if (IsAlive(entity)) {
            release(entity.id());
            ++destroyed;
        }
    }
    return destroyed;
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid() || entity.id() >= slots_.size()) {
        return false;
    }
    const auto& slot = slots_[entity.id()];
    return slot.alive && slot.version == entity.version();
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "null component storage");
    storages_.push_back(storage);
}

void EntityManager::release(uint32_t id) {
    const Entity entity(id, slots_[id].version);
    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    auto& slot = slots_[id];
    slot.alive = false;
    slot.pending = false;
    // 255 wraps to 0.  The invalid sentinel's id is never handed out, so
    // no live handle can equal it.
    slot.version = static_cast<uint8_t>(slot.version + 1);
    released_.push(id);
    --count_;
}

}  // namespace arena::ecs
