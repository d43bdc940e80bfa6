#pragma once

/// @file match_components.hpp
/// @brief Match-wide state: phase enum, timer/showdown singletons and the
///        per-unit BehaviorMode that the showdown overrides.

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace arena::game {

// ── Match phase ─────────────────────────────────────────────────────────

/// Match timeline.  Values are ordered; the phase never moves backwards.
enum class MatchPhase : uint8_t {
    Normal,
    Warning,
    Collapse,
    Showdown,
    Ended
};

[[nodiscard]] constexpr std::string_view MatchPhaseName(MatchPhase phase) noexcept {
    switch (phase) {
        case MatchPhase::Normal:   return "NORMAL";
        case MatchPhase::Warning:  return "WARNING";
        case MatchPhase::Collapse: return "COLLAPSE";
        case MatchPhase::Showdown: return "SHOWDOWN";
        case MatchPhase::Ended:    return "ENDED";
    }
    return "UNKNOWN";
}

/// Winner value reported when the match ends with no surviving team or
/// with both teams alive at the deadline.
constexpr uint8_t kDrawTeam = 0xFF;

// ── Singletons (stored on the match entity) ─────────────────────────────

struct GameTimer {
    float totalTime = 0.0f;
    float matchDuration = 150.0f;  ///< Time at which SHOWDOWN starts.
};

struct ShowdownState {
    MatchPhase state = MatchPhase::Normal;
    MatchPhase lastState = MatchPhase::Normal;
    float transitionTime = 0.0f;          ///< totalTime of the last transition.
    std::optional<uint8_t> winner;         ///< Team id or kDrawTeam once ENDED.
};

/// True once any ShowdownState in @p states has reached ENDED.
[[nodiscard]] inline bool IsMatchOver(const ecs::ComponentStorage<ShowdownState>& states) {
    for (const auto& s : states) {
        if (s.state == MatchPhase::Ended) {
            return true;
        }
    }
    return false;
}

// ── BehaviorMode ────────────────────────────────────────────────────────

/// Player-controlled unit.
struct ManualControl {};

/// Move order a unit carried before the showdown took control.
struct OriginalAI {
    float savedTargetX = 0.0f;
    float savedTargetY = 0.0f;
    bool hadTarget = false;
};

/// Unit fighting on its own during SHOWDOWN.
struct ForcedAuto {
    ecs::Entity targetEntity;
    float attackCooldown = 0.0f;  ///< Base-attack timer for units without Damage.
    OriginalAI original;
};

using BehaviorMode = std::variant<ManualControl, ForcedAuto>;

[[nodiscard]] inline bool IsForcedAuto(const BehaviorMode& mode) noexcept {
    return std::holds_alternative<ForcedAuto>(mode);
}

}  // namespace arena::game
