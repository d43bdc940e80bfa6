#pragma once

/// @file component_type_id.hpp
/// @brief RTTI-free component type identification.
///
/// Each distinct component type `T` receives a unique integer ID the first
/// time `ComponentType<T>::Id()` is called.  The numeric values depend on
/// first-use order and are not stable across runs; only their identity is.

#include <atomic>
#include <cstdint>

namespace arena::ecs {

/// Integer type used to identify component types at runtime.
using ComponentTypeId = uint32_t;

/// Sentinel value meaning "no type".
constexpr ComponentTypeId kInvalidComponentTypeId = static_cast<ComponentTypeId>(-1);

namespace detail {

inline ComponentTypeId nextComponentTypeId() noexcept {
    static std::atomic<ComponentTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Obtain the unique ComponentTypeId for type `T`.
///
/// @code
///   auto id = ComponentType<Health>::Id();
/// @endcode
template <typename T>
struct ComponentType {
    static ComponentTypeId Id() noexcept {
        static const ComponentTypeId value = detail::nextComponentTypeId();
        return value;
    }
};

} // namespace arena::ecs
