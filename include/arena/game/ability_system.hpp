#pragma once

/// @file ability_system.hpp
/// @brief AbilitySystem: per-unit Dash / Shield / RangedAttack state
///        machines and projectile flight.

#include <string_view>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity_manager.hpp"
#include "arena/ecs/system_scheduler.hpp"
#include "arena/game/ability_components.hpp"
#include "arena/game/combat_system.hpp"
#include "arena/game/components.hpp"
#include "arena/game/input_queue.hpp"
#include "arena/game/match_components.hpp"
#include "arena/game/match_config.hpp"
#include "arena/game/spatial_index.hpp"
#include "arena/game/targeting.hpp"

namespace arena::game {

/// Component tables the ability system reads and writes.
struct AbilityStorages {
    ecs::ComponentStorage<Position>& positions;
    ecs::ComponentStorage<Velocity>& velocities;
    ecs::ComponentStorage<Team>& teams;
    ecs::ComponentStorage<Health>& healths;
    ecs::ComponentStorage<Dash>& dashes;
    ecs::ComponentStorage<Shield>& shields;
    ecs::ComponentStorage<RangedAttack>& rangedAttacks;
    ecs::ComponentStorage<Projectile>& projectiles;
    const ecs::ComponentStorage<ShowdownState>& showdown;
};

/// Drives every ability timer and consumes the activation queue.
///
/// Order within a tick:
///   1. `active` and `cooldown` of every ability count down (floor 0);
///   2. projectiles already in flight advance and resolve;
///   3. the input queue is drained; each request whose ability is ready
///      activates it (`active = duration`, `cooldown = maxCooldown`) and
///      applies its effect.  Requests for missing, dead or cooling-down
///      abilities change nothing.
///
/// Once the match has ended the queue is discarded and nothing else runs.
class AbilitySystem final : public ecs::ISystem {
public:
    AbilitySystem(AbilityStorages storages,
                  ecs::EntityManager& entities,
                  AbilityInputQueue& input,
                  Targeting& targeting,
                  DamageResolver& resolver,
                  const MatchConfig& config);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "AbilitySystem";
    }

    /// Direction a unit faces: normalized velocity, or the team heading
    /// when the unit is stationary.
    [[nodiscard]] Vector2 FacingOf(ecs::Entity entity) const;

    /// Number of requests rejected since construction.
    [[nodiscard]] std::size_t RejectedCount() const noexcept { return rejected_; }

private:
    void tickTimers(float deltaTime);
    void advanceProjectiles(float deltaTime);
    void processRequests();

    bool activateDash(ecs::Entity entity);
    bool activateShield(ecs::Entity entity);
    bool activateRanged(ecs::Entity entity);

    /// Nearest living enemy of @p team whose body intersects the segment
    /// [@p from, @p to] within @p radius; invalid if none.
    [[nodiscard]] ecs::Entity firstEnemyAlong(const Vector2& from, const Vector2& to,
                                              uint8_t team, float radius) const;

    AbilityStorages s_;
    ecs::EntityManager& entities_;
    AbilityInputQueue& input_;
    Targeting& targeting_;
    DamageResolver& resolver_;
    const MatchConfig& config_;
    std::size_t rejected_ = 0;
};

} // namespace arena::game
