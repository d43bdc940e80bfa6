#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for
///        simulation-specific structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arena/foundation/game_result.hpp"

namespace arena::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Simulation log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Simulation lifecycle and tick orchestration
    ECS     = 1, ///< Entity-Component-System
    Combat  = 2, ///< Auto-attack resolution and deaths
    Ability = 3, ///< Dash / Shield / Ranged activations and projectiles
    Match   = 4, ///< Match phase timeline and victory
    World   = 5, ///< Spatial index and targeting
    Input   = 6, ///< Input events and move commands
    Config  = 7  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Combat", "Ability", "Match", "World", "Input", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = 7;
///   ctx.teamId = 1;
///   ctx.extra["damage"] = "25";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<uint8_t> teamId;
    std::optional<uint64_t> tick;
    std::unordered_map<std::string, std::string> extra;
};

/// Simulation logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Info          |
/// | Combat   | Debug         |
/// | Ability  | Debug         |
/// | Match    | Info          |
/// | World    | Info          |
/// | Input    | Info          |
/// | Config   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arena::foundation

// ---------------------------------------------------------------------------
// Logging macros. Defined at global scope.
// ---------------------------------------------------------------------------

/// @name ARENA_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// ARENA_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ARENA_MIN_LOG_LEVEL
    #define ARENA_MIN_LOG_LEVEL 0
#endif

#define ARENA_LOG(level, cat, msg)                                                 \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= ARENA_MIN_LOG_LEVEL &&                      \
            ::arena::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::arena::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define ARENA_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                           \
        if (static_cast<int>(level) >= ARENA_MIN_LOG_LEVEL &&                      \
            ::arena::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::arena::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
    } while (0)

#define ARENA_LOG_DEBUG(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Debug, (cat), (msg))

#define ARENA_LOG_INFO(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Info, (cat), (msg))

#define ARENA_LOG_WARN(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Warning, (cat), (msg))

#define ARENA_LOG_ERROR(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Error, (cat), (msg))

/// @}
