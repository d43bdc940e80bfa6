#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set based component storage for the ECS.
///
/// ComponentStorage<T> provides O(1) add / get / has / remove and
/// cache-friendly dense iteration over all components of type T.  Each
/// dense slot remembers the full versioned handle of its owner so that a
/// stale handle never aliases a recycled entity's row.

#include "arena/ecs/component_type_id.hpp"
#include "arena/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace arena::ecs {

/// Type-erased base for component pools, allowing EntityManager to
/// call Remove / Has / Clear without knowing the component type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Return the entity stored at dense @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;

    /// Return the storage's structural modification counter.
    [[nodiscard]] virtual uint32_t Version() const noexcept = 0;
};

/// Sparse-set component storage.
///
/// Memory layout:
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   entities_[index]     -> versioned handle that owns dense_[index]
/// @endcode
///
/// Add / Remove / Clear bump a structural version counter that queries
/// use to invalidate their cached entity lists.  In-place edits through
/// Get() do not change the version.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }

    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Add a component for @p entity, constructed from @p args.
    /// @pre `!Has(entity)`; adding a duplicate is undefined behavior.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        const auto idx = static_cast<uint32_t>(dense_.size());

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;

        if constexpr (std::is_aggregate_v<T>) {
            dense_.push_back(T{std::forward<Args>(args)...});
        } else {
            dense_.emplace_back(std::forward<Args>(args)...);
        }
        entities_.push_back(entity);
        ++globalVersion_;

        return dense_.back();
    }

    /// Get a mutable reference to the component owned by @p entity.
    /// @pre `Has(entity)`; accessing a missing component is undefined.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Return a pointer to the component owned by @p entity, or nullptr.
    [[nodiscard]] T* Find(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* Find(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    /// Replace the component for @p entity.
    /// @pre `Has(entity)`.
    void Replace(Entity entity, T&& component) {
        assert(Has(entity) && "Entity does not have this component");
        dense_[sparse_[entity.id()]] = std::move(component);
    }

    /// Check whether @p entity (this exact version) has a component here.
    [[nodiscard]] bool Has(Entity entity) const override {
        auto eid = entity.id();
        if (!entity.isValid() || eid >= sparse_.size() || sparse_[eid] == kInvalidIndex) {
            return false;
        }
        return entities_[sparse_[eid]] == entity;
    }

    /// Remove the component owned by @p entity.
    /// Safe to call even if the entity has no component (no-op).
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            // Swap the removed element with the last element.
            dense_[idx] = std::move(dense_[lastIdx]);
            entities_[idx] = entities_[lastIdx];
            sparse_[entities_[idx].id()] = idx;
        }

        dense_.pop_back();
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;

        ++globalVersion_;
    }

    /// Return the existing component or default-construct one.
    T& GetOrAdd(Entity entity) {
        if (Has(entity)) {
            return Get(entity);
        }
        return Add(entity);
    }

    void Clear() override {
        dense_.clear();
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
        ++globalVersion_;
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        assert(index < entities_.size());
        return entities_[index];
    }

    /// Snapshot of all owning entities, sorted by ascending id.
    [[nodiscard]] std::vector<Entity> SortedEntities() const {
        std::vector<Entity> sorted(entities_);
        std::sort(sorted.begin(), sorted.end(), EntityIdLess{});
        return sorted;
    }

    [[nodiscard]] uint32_t Version() const noexcept override { return globalVersion_; }

    [[nodiscard]] uint32_t GlobalVersion() const noexcept { return globalVersion_; }

    [[nodiscard]] static ComponentTypeId TypeId() noexcept { return ComponentType<T>::Id(); }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;            ///< Packed component data.
    std::vector<Entity> entities_;    ///< dense index -> owning handle.
    std::vector<uint32_t> sparse_;    ///< entity id  -> dense index.
    uint32_t globalVersion_ = 0;      ///< Bumped on every structural change.
};

}  // namespace arena::ecs
