#pragma once

/// @file entity.hpp
/// @brief Entity type for the ECS layer.
///
/// An entity is a lightweight 32-bit handle that combines a unique index
/// (24 bits) with a version counter (8 bits) for safe recycling.  The
/// index is the opaque integer id exposed to presentation layers; the
/// version guards against stale handles once an id is reused.

#include <cstdint>
#include <functional>
#include <limits>

namespace arena::ecs {

/// Compact entity handle: 24-bit index + 8-bit version packed into 32 bits.
struct Entity {
    uint32_t raw = kInvalidRaw;

    // Bit layout constants.
    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kVersionBits = 8;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;          // 0x00FFFFFF
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;  // 0x00FFFFFF is reserved for invalid

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    /// Extract the index portion (0 .. 16'777'214).
    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    /// True when this handle refers to a potentially live entity.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr bool operator==(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

/// Orders handles by index, the deterministic iteration order used by
/// every simulation system.
struct EntityIdLess {
    constexpr bool operator()(Entity a, Entity b) const noexcept {
        return a.id() < b.id();
    }
};

} // namespace arena::ecs

// Hash support for unordered containers.
template <>
struct std::hash<arena::ecs::Entity> {
    std::size_t operator()(const arena::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
