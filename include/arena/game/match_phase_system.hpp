#pragma once

/// @file match_phase_system.hpp
/// @brief MatchPhaseSystem: match timeline, SHOWDOWN override and victory.

#include <optional>
#include <random>
#include <string_view>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity.hpp"
#include "arena/ecs/system_scheduler.hpp"
#include "arena/game/combat_system.hpp"
#include "arena/game/components.hpp"
#include "arena/game/match_components.hpp"
#include "arena/game/match_config.hpp"
#include "arena/game/targeting.hpp"

namespace arena::game {

/// Phase reached at @p totalTime.  Never returns Ended; only victory
/// evaluation ends a match.
[[nodiscard]] MatchPhase PhaseForTime(float totalTime, const PhaseThresholds& phases) noexcept;

/// Seconds until the phase after @p current begins.  During SHOWDOWN this
/// is the time left before @p matchEndTime forces a result; once ENDED
/// there is no next phase.
[[nodiscard]] std::optional<float> TimeUntilNextPhase(MatchPhase current, float totalTime,
                                                      const PhaseThresholds& phases,
                                                      float matchEndTime) noexcept;

/// Hand a unit back to the player: restores the move order saved when
/// SHOWDOWN took over and switches @p mode to ManualControl.
/// @return false if @p mode was already manual.
bool RevertToManual(BehaviorMode& mode, MoveTarget* moveTarget);

/// Component tables the match phase system reads and writes.
struct MatchStorages {
    ecs::ComponentStorage<GameTimer>& timers;
    ecs::ComponentStorage<ShowdownState>& showdown;
    ecs::ComponentStorage<Position>& positions;
    ecs::ComponentStorage<Velocity>& velocities;
    ecs::ComponentStorage<Health>& healths;
    ecs::ComponentStorage<Team>& teams;
    ecs::ComponentStorage<Damage>& damages;
    ecs::ComponentStorage<MoveTarget>& moveTargets;
    ecs::ComponentStorage<BehaviorMode>& behaviors;
};

/// Advances the global match clock and applies phase effects.
///
/// Runs first in every tick.  The phase is recomputed from the clock and
/// jumps straight to the furthest phase reached, so a long step can go
/// from NORMAL to SHOWDOWN at once; SHOWDOWN entry effects still fire:
///   - every living unit is teleported to a seeded random point inside
///     the teleport disc around the arena center;
///   - velocities are zeroed and move orders cancelled;
///   - every living unit switches to ForcedAuto, keeping its move order
///     so RevertToManual() can restore it.
///
/// While in SHOWDOWN, ForcedAuto units chase the nearest enemy (units
/// without Damage also strike with the base attack), then the match ends
/// as soon as at most one team has living units or the end time passes.
/// ENDED freezes the clock.
class MatchPhaseSystem final : public ecs::ISystem {
public:
    MatchPhaseSystem(MatchStorages storages,
                     ecs::Entity matchEntity,
                     Targeting& targeting,
                     DamageResolver& resolver,
                     const MatchConfig& config);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "MatchPhaseSystem";
    }

    /// Fraction of the attack range a chasing unit closes to.
    static constexpr float kChaseStopFraction = 0.9f;

private:
    void transitionTo(ShowdownState& state, MatchPhase next, float totalTime);
    void enterShowdown();
    void runForcedAutoBattle(float deltaTime);
    void evaluateVictory(ShowdownState& state, float totalTime);

    MatchStorages s_;
    ecs::Entity matchEntity_;
    Targeting& targeting_;
    DamageResolver& resolver_;
    const MatchConfig& config_;
    std::mt19937 rng_;
};

} // namespace arena::game
