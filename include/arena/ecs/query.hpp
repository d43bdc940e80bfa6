#pragma once

/// @file query.hpp
/// @brief Multi-component query over sparse-set storages.
///
/// Query<Includes...> yields every entity that owns all of the listed
/// component types, in ascending entity id order.  Results are cached and
/// rebuilt whenever a queried storage changes structurally.

#include <algorithm>
#include <cstdint>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity.hpp"

namespace arena::ecs {

/// Cached multi-component query.
///
/// Handles yielded by ForEach and the iterators carry the owner's full
/// version, so they can be handed to EntityManager::IsAlive() directly.
///
/// @note Adding or removing components of a queried type inside ForEach
///       invalidates the cache on the next call but not the current pass.
///       Collect structural changes and apply them after the loop.
///
/// Usage:
/// @code
///   Query<Position, Velocity> movers(positions, velocities);
///   movers.ForEach([dt](Entity e, Position& pos, Velocity& vel) {
///       pos.x += vel.x * dt;
///   });
/// @endcode
template <typename... Includes>
class Query {
    static_assert(sizeof...(Includes) > 0,
                  "Query must have at least one component type");

public:
    using const_iterator = typename std::vector<Entity>::const_iterator;

    explicit Query(ComponentStorage<Includes>&... storages)
        : storages_{&storages...} {}

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;
    Query(Query&&) noexcept = default;
    Query& operator=(Query&&) noexcept = default;

    // ── Iteration ────────────────────────────────────────────────────────

    /// Invoke @p func(entity, includes&...) for every match, lowest id first.
    ///
    /// The match list is snapshotted before the first call, so entities
    /// whose components are removed mid-pass are skipped rather than
    /// dereferenced.
    template <typename Func>
    void ForEach(Func&& func) {
        RefreshCache();
        const std::vector<Entity> snapshot = cachedEntities_;
        for (Entity e : snapshot) {
            if (!containsAll(e)) {
                continue;
            }
            func(e, std::get<ComponentStorage<Includes>*>(storages_)->Get(e)...);
        }
    }

    [[nodiscard]] std::size_t Count() const {
        RefreshCache();
        return cachedEntities_.size();
    }

    [[nodiscard]] const std::vector<Entity>& Entities() const {
        RefreshCache();
        return cachedEntities_;
    }

    [[nodiscard]] const_iterator begin() const {
        RefreshCache();
        return cachedEntities_.cbegin();
    }
    [[nodiscard]] const_iterator end() const { return cachedEntities_.cend(); }

private:
    [[nodiscard]] uint64_t computeVersionFingerprint() const noexcept {
        uint64_t fp = 0;
        std::apply(
            [&](auto*... ptrs) { ((fp += ptrs->GlobalVersion()), ...); },
            storages_);
        return fp;
    }

    [[nodiscard]] bool containsAll(Entity entity) const {
        bool all = true;
        std::apply(
            [&](auto*... ptrs) { ((all = all && ptrs->Has(entity)), ...); },
            storages_);
        return all;
    }

    void RefreshCache() const {
        const uint64_t fp = computeVersionFingerprint();
        if (cacheValid_ && cacheVersion_ == fp) {
            return;
        }

        cachedEntities_.clear();

        // Walk the smallest include storage and look the rest up.
        const IComponentStorage* smallest = nullptr;
        std::size_t smallestSize = std::numeric_limits<std::size_t>::max();
        std::apply(
            [&](auto*... ptrs) {
                auto pick = [&](const IComponentStorage* p) {
                    if (p->Size() < smallestSize) {
                        smallest = p;
                        smallestSize = p->Size();
                    }
                };
                (pick(ptrs), ...);
            },
            storages_);

        for (std::size_t i = 0; smallest != nullptr && i < smallestSize; ++i) {
            const Entity entity = smallest->EntityAt(i);
            if (containsAll(entity)) {
                cachedEntities_.push_back(entity);
            }
        }

        std::sort(cachedEntities_.begin(), cachedEntities_.end(), EntityIdLess{});

        cacheVersion_ = fp;
        cacheValid_ = true;
    }

    std::tuple<ComponentStorage<Includes>*...> storages_;

    mutable std::vector<Entity> cachedEntities_;
    mutable uint64_t cacheVersion_ = 0;
    mutable bool cacheValid_ = false;
};

} // namespace arena::ecs
