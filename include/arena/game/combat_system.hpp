#pragma once

/// @file combat_system.hpp
/// @brief CombatSystem: range-based auto-attacks, plus the damage pipeline
///        shared by every source of damage.

#include <string_view>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/query.hpp"
#include "arena/ecs/system_scheduler.hpp"
#include "arena/game/ability_components.hpp"
#include "arena/game/components.hpp"
#include "arena/game/match_components.hpp"
#include "arena/game/targeting.hpp"
#include "arena/game/tick_events.hpp"

namespace arena::game {

/// Applies damage to Health and records the outcome.
///
/// Pipeline: base amount -> defense multiplier (Shield) -> clamp health
/// to [0, max] -> DamageEvent, plus a DeathEvent on the hit that brings a
/// living target to zero.  Auto-attacks, dash contact and projectiles all
/// route through here.
class DamageResolver {
public:
    DamageResolver(ecs::ComponentStorage<Health>& healths,
                   ecs::ComponentStorage<Shield>& shields,
                   ecs::ComponentStorage<Position>& positions,
                   TickEvents& events);

    /// Damage @p target on behalf of @p source.
    /// @return The amount applied after mitigation, or 0 when the target
    ///         has no Health or is already dead.
    float Apply(ecs::Entity source, ecs::Entity target, float baseAmount);

    /// Incoming-damage multiplier for @p target: `1 - Shield.reduction`
    /// while its shield is active, 1 otherwise.
    [[nodiscard]] float DefenseMultiplier(ecs::Entity target) const;

private:
    ecs::ComponentStorage<Health>& healths_;
    ecs::ComponentStorage<Shield>& shields_;
    ecs::ComponentStorage<Position>& positions_;
    TickEvents& events_;
};

/// Auto-attack resolver.
///
/// Each tick, living units with Damage, Position, Team and Health are
/// visited in ascending id order:
///   1. the attack cooldown counts down (floored at 0);
///   2. a ready unit attacks the nearest living enemy within range;
///   3. a successful attack resets the cooldown to 1 / attackSpeed.
///
/// Units killed earlier in the same tick do not attack.  Nothing runs
/// once the match has ended.
class CombatSystem final : public ecs::ISystem {
public:
    CombatSystem(ecs::ComponentStorage<Damage>& damages,
                 ecs::ComponentStorage<Position>& positions,
                 ecs::ComponentStorage<Team>& teams,
                 ecs::ComponentStorage<Health>& healths,
                 const ecs::ComponentStorage<ShowdownState>& showdown,
                 Targeting& targeting,
                 DamageResolver& resolver);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "CombatSystem";
    }

    /// Final damage for @p baseDamage after a defense @p multiplier.
    /// Negative inputs are treated as 0.
    [[nodiscard]] static float CalculateDamage(float baseDamage, float multiplier) noexcept;

private:
    ecs::Query<Damage, Position, Team, Health> attackers_;
    const ecs::ComponentStorage<ShowdownState>& showdown_;
    Targeting& targeting_;
    DamageResolver& resolver_;
};

} // namespace arena::game
