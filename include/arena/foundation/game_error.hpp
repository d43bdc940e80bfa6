#pragma once

/// @file game_error.hpp
/// @brief Simulation error type used with Result<T, GameError>.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "arena/foundation/error_code.hpp"

namespace arena::foundation {

/// Where in the match an error was raised.  Unset fields are unknown.
struct ErrorContext {
    std::optional<uint32_t> entityId;
    std::optional<uint64_t> tick;
};

/// Error code, message and the entity/tick it concerns.
///
/// Setup and input calls on the Simulation attach the offending entity
/// and the tick count at which the call was rejected, so callers can log
/// or replay the failure without keeping their own bookkeeping.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(context) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// "ECS", "Config", "Simulation", ... derived from the code range.
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    [[nodiscard]] const ErrorContext& context() const noexcept { return context_; }
    [[nodiscard]] std::optional<uint32_t> entityId() const noexcept { return context_.entityId; }
    [[nodiscard]] std::optional<uint64_t> tick() const noexcept { return context_.tick; }

    /// Copy of this error tagged with @p entityId.
    [[nodiscard]] GameError forEntity(uint32_t entityId) const {
        GameError tagged = *this;
        tagged.context_.entityId = entityId;
        return tagged;
    }

    /// Copy of this error tagged with @p tick.
    [[nodiscard]] GameError atTick(uint64_t tick) const {
        GameError tagged = *this;
        tagged.context_.tick = tick;
        return tagged;
    }

    /// "[Subsystem] message (entity N, tick T)", omitting unknown parts.
    [[nodiscard]] std::string describe() const {
        std::string out = "[" + std::string(subsystem()) + "] " + message_;
        if (context_.entityId || context_.tick) {
            out += " (";
            if (context_.entityId) {
                out += "entity " + std::to_string(*context_.entityId);
            }
            if (context_.tick) {
                out += context_.entityId ? ", tick " : "tick ";
                out += std::to_string(*context_.tick);
            }
            out += ")";
        }
        return out;
    }

    [[nodiscard]] bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    ErrorContext context_;
};

} // namespace arena::foundation
