#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ARENA_VERSION_MAJOR 0
#define ARENA_VERSION_MINOR 3
#define ARENA_VERSION_PATCH 0
#define ARENA_VERSION_STRING "0.3.0"

namespace arena {

/// Project version information at compile time.
struct Version {
    static constexpr int major = ARENA_VERSION_MAJOR;
    static constexpr int minor = ARENA_VERSION_MINOR;
    static constexpr int patch = ARENA_VERSION_PATCH;
    static constexpr const char* string = ARENA_VERSION_STRING;
};

} // namespace arena
