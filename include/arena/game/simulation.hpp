#pragma once

/// @file simulation.hpp
/// @brief Simulation: the explicit match context that owns every store,
///        the input queue, the tick event buffers and the system schedule.

#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <tuple>
#include <vector>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity.hpp"
#include "arena/ecs/entity_manager.hpp"
#include "arena/ecs/system_scheduler.hpp"
#include "arena/foundation/game_result.hpp"
#include "arena/game/ability_components.hpp"
#include "arena/game/combat_system.hpp"
#include "arena/game/components.hpp"
#include "arena/game/input_queue.hpp"
#include "arena/game/match_components.hpp"
#include "arena/game/match_config.hpp"
#include "arena/game/spatial_index.hpp"
#include "arena/game/targeting.hpp"
#include "arena/game/tick_events.hpp"

namespace arena::game {

/// Description of a unit to place at match setup.
struct UnitSpec {
    Vector2 position;
    Vector2 velocity;
    uint8_t team = 0;
    float maxHealth = 100.0f;

    /// Auto-attack profile; units without one only fight in SHOWDOWN,
    /// using the configured base attack.
    std::optional<Damage> damage;

    /// Abilities are created from the MatchConfig parameters.
    bool withDash = false;
    bool withShield = false;
    bool withRanged = false;
};

// ── Read-only view for presentation ─────────────────────────────────────

struct AbilitySnapshot {
    bool present = false;
    float active = 0.0f;
    float cooldown = 0.0f;
    float maxCooldown = 0.0f;
    AbilityPhase phase = AbilityPhase::Idle;
};

struct UnitSnapshot {
    ecs::Entity entity;
    uint8_t team = 0;
    Vector2 position;
    float health = 0.0f;
    float maxHealth = 0.0f;
    bool alive = false;
    bool forcedAuto = false;
    AbilitySnapshot dash;
    AbilitySnapshot shield;
    AbilitySnapshot ranged;
};

struct ProjectileSnapshot {
    ecs::Entity entity;
    ecs::Entity owner;
    Vector2 position;
};

/// Copy of everything a renderer or HUD reads, taken once per frame.
/// Units and projectiles are listed in ascending entity id order.
struct WorldSnapshot {
    uint64_t tick = 0;
    float totalTime = 0.0f;
    MatchPhase phase = MatchPhase::Normal;
    std::optional<uint8_t> winner;
    std::optional<float> timeUntilNextPhase;
    std::vector<UnitSnapshot> units;
    std::vector<ProjectileSnapshot> projectiles;

    [[nodiscard]] const UnitSnapshot* Find(ecs::Entity entity) const;

    [[nodiscard]] std::size_t LivingCount(uint8_t team) const;
};

// ── Simulation ──────────────────────────────────────────────────────────

/// One match.  Created at match start, destroyed at match end.
///
/// A tick is `Step(deltaTime)`: the tick's event buffers are cleared, then
/// the systems run in a fixed order
/// @code
///   PreUpdate   MatchPhaseSystem
///   Update      MovementSystem -> AbilitySystem -> CombatSystem
///   PostUpdate  CleanupSystem -> SpatialSyncSystem
/// @endcode
/// and the queued ability requests are consumed.  Given the same config,
/// spawns and inputs, every run produces the same world.
///
/// Not copyable or movable: systems hold references into it.
class Simulation {
    /// Only Create() can name this, so only Create() can construct.
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    /// Validate @p config and build a ready-to-run match.
    [[nodiscard]] static foundation::GameResult<std::unique_ptr<Simulation>>
    Create(const MatchConfig& config = {});

    Simulation(CreateKey key, const MatchConfig& config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    // ── Setup ───────────────────────────────────────────────────────

    /// Create a unit.  Fails with InvalidArgument for a non-positive
    /// max health, a team other than 0 or 1, or a Damage with a
    /// non-positive attack speed or a negative amount or range, and with
    /// MatchEnded once the match is over; nothing is created in any case.
    [[nodiscard]] foundation::GameResult<ecs::Entity> SpawnUnit(const UnitSpec& spec);

    // ── Tick ────────────────────────────────────────────────────────

    /// Advance the world by @p deltaTime seconds.  Negative, NaN and
    /// infinite steps are ignored.  After ENDED only the queued input is
    /// discarded.
    void Step(float deltaTime);

    // ── Input ───────────────────────────────────────────────────────

    /// Queue an edge-triggered ability request for the next Step().
    foundation::GameResult<void> QueueAbility(ecs::Entity entity, AbilityKind kind);

    /// Set a unit's move order.  Rejected with InputRejected during
    /// SHOWDOWN and ENDED.
    foundation::GameResult<void> IssueMoveCommand(ecs::Entity entity, float x, float y);

    /// Return a ForcedAuto unit to player control, restoring its move order.
    foundation::GameResult<void> RevertToManual(ecs::Entity entity);

    // ── Output ──────────────────────────────────────────────────────

    [[nodiscard]] WorldSnapshot Snapshot() const;

    /// Damage events of the last Step(), handed out once.
    [[nodiscard]] std::vector<DamageEvent> DrainDamageEvents();

    /// Death events of the last Step(), handed out once.
    [[nodiscard]] std::vector<DeathEvent> DrainDeathEvents();

    [[nodiscard]] MatchPhase Phase() const;
    [[nodiscard]] std::optional<uint8_t> Winner() const;
    [[nodiscard]] float TotalTime() const;
    [[nodiscard]] uint64_t TickCount() const noexcept { return tick_; }
    [[nodiscard]] bool IsAlive(ecs::Entity entity) const noexcept { return entities_.IsAlive(entity); }

    // ── Component access ────────────────────────────────────────────

    /// Read-only view of component @p T of @p entity, or nullptr when the
    /// entity lacks it.  Only systems write components.
    ///
    /// Asking about a destroyed or never-created entity is a contract
    /// violation: it asserts in debug builds and yields nullptr otherwise.
    template <typename T>
    [[nodiscard]] const T* Find(ecs::Entity entity) const {
        const bool alive = entities_.IsAlive(entity);
        assert(alive && "component access through a dead or unknown entity");
        if (!alive) {
            return nullptr;
        }
        return storage<T>().Find(entity);
    }

    [[nodiscard]] const MatchConfig& Config() const noexcept { return config_; }
    [[nodiscard]] const SpatialIndex& Index() const noexcept { return index_; }
    [[nodiscard]] std::size_t IndexRepairCount() const noexcept { return targeting_.RepairCount(); }
    [[nodiscard]] ecs::Entity MatchEntity() const noexcept { return matchEntity_; }

private:
    foundation::GameResult<void> initialize();

    template <typename T>
    ecs::ComponentStorage<T>& storage() {
        return std::get<ecs::ComponentStorage<T>>(storages_);
    }

    template <typename T>
    const ecs::ComponentStorage<T>& storage() const {
        return std::get<ecs::ComponentStorage<T>>(storages_);
    }

    MatchConfig config_;

    std::tuple<ecs::ComponentStorage<Position>,
               ecs::ComponentStorage<Velocity>,
               ecs::ComponentStorage<Health>,
               ecs::ComponentStorage<Team>,
               ecs::ComponentStorage<Damage>,
               ecs::ComponentStorage<MoveTarget>,
               ecs::ComponentStorage<Dash>,
               ecs::ComponentStorage<Shield>,
               ecs::ComponentStorage<RangedAttack>,
               ecs::ComponentStorage<Projectile>,
               ecs::ComponentStorage<BehaviorMode>,
               ecs::ComponentStorage<GameTimer>,
               ecs::ComponentStorage<ShowdownState>>
        storages_;

    ecs::EntityManager entities_;
    SpatialIndex index_;
    Targeting targeting_;
    TickEvents events_;
    AbilityInputQueue input_;
    DamageResolver resolver_;
    ecs::Entity matchEntity_;
    uint64_t tick_ = 0;

    // Declared last: systems reference every member above.
    ecs::SystemScheduler scheduler_;
};

} // namespace arena::game
