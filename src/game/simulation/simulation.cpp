/// @file simulation.cpp
/// @brief Simulation context: setup, tick, input and snapshot.

#include "arena/game/simulation.hpp"

#include "arena/foundation/game_logger.hpp"
#include "arena/game/ability_system.hpp"
#include "arena/game/cleanup_system.hpp"
#include "arena/game/match_phase_system.hpp"
#include "arena/game/movement_system.hpp"
#include "arena/game/spatial_sync_system.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

namespace arena::game {

using foundation::ErrorCode;
using foundation::ErrorContext;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

template <typename Ability>
AbilitySnapshot snapshotOf(const Ability* ability) {
    AbilitySnapshot snap;
    if (ability != nullptr) {
        snap.present = true;
        snap.active = ability->active;
        snap.cooldown = ability->cooldown;
        snap.maxCooldown = ability->maxCooldown;
        snap.phase = PhaseOf(*ability);
    }
    return snap;
}

template <typename T>
GameResult<T> rejected(ErrorCode code, std::string message, const ErrorContext& where) {
    return GameResult<T>::err(GameError(code, std::move(message), where));
}

void logRejectedInput(ecs::Entity entity, std::string_view reason) {
    LogContext ctx;
    ctx.entityId = entity.id();
    ctx.extra["reason"] = std::string(reason);
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Input, "input rejected", ctx);
}

} // namespace

// ── WorldSnapshot ───────────────────────────────────────────────────────

const UnitSnapshot* WorldSnapshot::Find(ecs::Entity entity) const {
    auto it = std::find_if(units.begin(), units.end(),
                           [entity](const UnitSnapshot& u) { return u.entity == entity; });
    return it != units.end() ? &*it : nullptr;
}

std::size_t WorldSnapshot::LivingCount(uint8_t team) const {
    return static_cast<std::size_t>(std::count_if(
        units.begin(), units.end(),
        [team](const UnitSnapshot& u) { return u.alive && u.team == team; }));
}

// ── Construction ────────────────────────────────────────────────────────

GameResult<std::unique_ptr<Simulation>> Simulation::Create(const MatchConfig& config) {
    if (auto valid = ValidateMatchConfig(config); !valid) {
        return GameResult<std::unique_ptr<Simulation>>::err(valid.error());
    }

    auto sim = std::make_unique<Simulation>(CreateKey{}, config);
    if (auto built = sim->initialize(); !built) {
        return GameResult<std::unique_ptr<Simulation>>::err(built.error());
    }
    return GameResult<std::unique_ptr<Simulation>>::ok(std::move(sim));
}

Simulation::Simulation(CreateKey /*key*/, const MatchConfig& config)
    : config_(config),
      index_(config.cellSize),
      targeting_(storage<Position>(), storage<Health>(), storage<Team>(), &index_),
      resolver_(storage<Health>(), storage<Shield>(), storage<Position>(), events_) {}

GameResult<void> Simulation::initialize() {
    std::apply([this](auto&... s) { (entities_.RegisterStorage(&s), ...); }, storages_);

    matchEntity_ = entities_.Create();
    storage<GameTimer>().Add(matchEntity_, 0.0f, config_.phases.showdown);
    storage<ShowdownState>().Add(matchEntity_);

    scheduler_.Register<MatchPhaseSystem>(
        MatchStorages{storage<GameTimer>(), storage<ShowdownState>(), storage<Position>(),
                      storage<Velocity>(), storage<Health>(), storage<Team>(),
                      storage<Damage>(), storage<MoveTarget>(), storage<BehaviorMode>()},
        matchEntity_, targeting_, resolver_, config_);

    scheduler_.Register<MovementSystem>(
        MovementStorages{storage<Position>(), storage<Velocity>(), storage<MoveTarget>(),
                         storage<Health>(), storage<BehaviorMode>(), storage<ShowdownState>()},
        config_.movement, &index_);

    scheduler_.Register<AbilitySystem>(
        AbilityStorages{storage<Position>(), storage<Velocity>(), storage<Team>(),
                        storage<Health>(), storage<Dash>(), storage<Shield>(),
                        storage<RangedAttack>(), storage<Projectile>(),
                        storage<ShowdownState>()},
        entities_, input_, targeting_, resolver_, config_);

    scheduler_.Register<CombatSystem>(storage<Damage>(), storage<Position>(), storage<Team>(),
                                      storage<Health>(), storage<ShowdownState>(), targeting_,
                                      resolver_);

    scheduler_.Register<CleanupSystem>(entities_, storage<Health>(), storage<Projectile>(),
                                       &index_);

    scheduler_.Register<SpatialSyncSystem>(targeting_);

    scheduler_.AddDependency<MovementSystem, AbilitySystem>();
    scheduler_.AddDependency<AbilitySystem, CombatSystem>();
    scheduler_.AddDependency<CleanupSystem, SpatialSyncSystem>();

    auto built = scheduler_.Build();
    if (!built) {
        ARENA_LOG_ERROR(LogCategory::Core,
                        std::string("failed to build system schedule: ") +
                            std::string(built.error().message()));
        return built;
    }

    LogContext ctx;
    ctx.extra["seed"] = std::to_string(config_.seed);
    ctx.extra["showdown_at"] = std::to_string(config_.phases.showdown);
    std::string updateOrder;
    for (auto name : scheduler_.ExecutionPlan(ecs::SystemStage::Update)) {
        updateOrder += updateOrder.empty() ? "" : ",";
        updateOrder += name;
    }
    ctx.extra["update_order"] = updateOrder;
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Core, "simulation created", ctx);
    return GameResult<void>::ok();
}

// ── Setup ───────────────────────────────────────────────────────────────

GameResult<ecs::Entity> Simulation::SpawnUnit(const UnitSpec& spec) {
    const ErrorContext where{std::nullopt, tick_};
    if (!(spec.maxHealth > 0.0f)) {
        return rejected<ecs::Entity>(ErrorCode::InvalidArgument,
                                     "unit max health must be positive", where);
    }
    if (spec.team >= kTeamCount) {
        return rejected<ecs::Entity>(ErrorCode::InvalidArgument, "unit team must be 0 or 1",
                                     where);
    }
    if (spec.damage) {
        const auto& dmg = *spec.damage;
        if (!(dmg.attackSpeed > 0.0f)) {
            return rejected<ecs::Entity>(ErrorCode::InvalidArgument,
                                         "unit attack speed must be positive", where);
        }
        if (!(dmg.amount >= 0.0f) || !(dmg.range >= 0.0f)) {
            return rejected<ecs::Entity>(ErrorCode::InvalidArgument,
                                         "unit damage and range must not be negative", where);
        }
    }
    if (Phase() == MatchPhase::Ended) {
        return rejected<ecs::Entity>(ErrorCode::MatchEnded,
                                     "cannot spawn units after the match ended", where);
    }

    const auto entity = entities_.Create();
    storage<Position>().Add(entity, spec.position.x, spec.position.y);
    storage<Velocity>().Add(entity, spec.velocity.x, spec.velocity.y);
    storage<Health>().Add(entity, spec.maxHealth, spec.maxHealth);
    storage<Team>().Add(entity, spec.team);
    storage<MoveTarget>().Add(entity);

    if (Phase() == MatchPhase::Showdown) {
        storage<BehaviorMode>().Add(entity, ForcedAuto{});
    } else {
        storage<BehaviorMode>().Add(entity, ManualControl{});
    }

    if (spec.damage) {
        storage<Damage>().Add(entity, *spec.damage);
    }
    if (spec.withDash) {
        Dash dash;
        dash.maxCooldown = config_.dash.cooldown;
        dash.duration = config_.dash.duration;
        dash.distance = config_.dash.distance;
        dash.damage = config_.dash.damage;
        storage<Dash>().Add(entity, dash);
    }
    if (spec.withShield) {
        Shield shield;
        shield.maxCooldown = config_.shield.cooldown;
        shield.duration = config_.shield.duration;
        shield.reduction = config_.shield.reduction;
        storage<Shield>().Add(entity, shield);
    }
    if (spec.withRanged) {
        RangedAttack ranged;
        ranged.maxCooldown = config_.ranged.cooldown;
        ranged.duration = config_.ranged.duration;
        ranged.range = config_.ranged.range;
        ranged.damage = config_.ranged.damage;
        ranged.projectileSpeed = config_.ranged.projectileSpeed;
        storage<RangedAttack>().Add(entity, ranged);
    }

    index_.Insert(entity, spec.position);

    LogContext ctx;
    ctx.entityId = entity.id();
    ctx.teamId = spec.team;
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::ECS, "unit spawned", ctx);

    return GameResult<ecs::Entity>::ok(entity);
}

// ── Tick ────────────────────────────────────────────────────────────────

void Simulation::Step(float deltaTime) {
    events_.Clear();

    if (Phase() == MatchPhase::Ended) {
        input_.Clear();
        return;
    }
    if (!(deltaTime >= 0.0f) || !std::isfinite(deltaTime)) {
        ARENA_LOG_WARN(LogCategory::Core, "ignoring negative or non-finite time step");
        return;
    }

    targeting_.MarkUnverified();
    if (auto ran = scheduler_.Execute(deltaTime); !ran) {
        ARENA_LOG_ERROR(LogCategory::Core, std::string(ran.error().message()));
        return;
    }
    ++tick_;
}

// ── Input ───────────────────────────────────────────────────────────────

GameResult<void> Simulation::QueueAbility(ecs::Entity entity, AbilityKind kind) {
    const ErrorContext where{entity.id(), tick_};
    if (Phase() == MatchPhase::Ended) {
        logRejectedInput(entity, "match ended");
        return rejected<void>(ErrorCode::MatchEnded, "match has ended", where);
    }
    if (!entities_.IsAlive(entity)) {
        logRejectedInput(entity, "unknown entity");
        return rejected<void>(ErrorCode::EntityNotFound, "ability request for unknown entity",
                              where);
    }
    input_.Push(entity, kind);
    return GameResult<void>::ok();
}

GameResult<void> Simulation::IssueMoveCommand(ecs::Entity entity, float x, float y) {
    const ErrorContext where{entity.id(), tick_};
    const auto phase = Phase();
    if (phase == MatchPhase::Showdown || phase == MatchPhase::Ended) {
        logRejectedInput(entity, "manual control locked");
        return rejected<void>(
            ErrorCode::InputRejected,
            std::string("move commands are disabled during ") + std::string(MatchPhaseName(phase)),
            where);
    }
    if (!entities_.IsAlive(entity) || !storage<Health>().Has(entity)) {
        logRejectedInput(entity, "unknown entity");
        return rejected<void>(ErrorCode::EntityNotFound, "move command for unknown unit", where);
    }

    auto& target = storage<MoveTarget>().GetOrAdd(entity);
    target.x = x;
    target.y = y;
    target.active = true;
    return GameResult<void>::ok();
}

GameResult<void> Simulation::RevertToManual(ecs::Entity entity) {
    const ErrorContext where{entity.id(), tick_};
    if (!entities_.IsAlive(entity)) {
        return rejected<void>(ErrorCode::EntityNotFound, "revert requested for unknown entity",
                              where);
    }
    auto* mode = storage<BehaviorMode>().Find(entity);
    if (mode == nullptr || !game::RevertToManual(*mode, storage<MoveTarget>().Find(entity))) {
        return rejected<void>(ErrorCode::InvalidArgument, "unit is not under forced control",
                              where);
    }
    return GameResult<void>::ok();
}

// ── Output ──────────────────────────────────────────────────────────────

WorldSnapshot Simulation::Snapshot() const {
    WorldSnapshot snap;
    snap.tick = tick_;
    snap.totalTime = TotalTime();
    snap.phase = Phase();
    snap.winner = Winner();
    snap.timeUntilNextPhase = TimeUntilNextPhase(snap.phase, snap.totalTime, config_.phases,
                                                 config_.matchEndTime);

    const auto& healths = storage<Health>();
    for (auto entity : healths.SortedEntities()) {
        const auto* pos = storage<Position>().Find(entity);
        const auto* team = storage<Team>().Find(entity);
        if (pos == nullptr || team == nullptr) {
            continue;
        }
        const auto& hp = healths.Get(entity);

        UnitSnapshot unit;
        unit.entity = entity;
        unit.team = team->id;
        unit.position = pos->ToVector();
        unit.health = hp.current;
        unit.maxHealth = hp.max;
        unit.alive = hp.IsAlive();
        if (const auto* mode = storage<BehaviorMode>().Find(entity)) {
            unit.forcedAuto = IsForcedAuto(*mode);
        }
        unit.dash = snapshotOf(storage<Dash>().Find(entity));
        unit.shield = snapshotOf(storage<Shield>().Find(entity));
        unit.ranged = snapshotOf(storage<RangedAttack>().Find(entity));
        snap.units.push_back(unit);
    }

    const auto& projectiles = storage<Projectile>();
    for (auto entity : projectiles.SortedEntities()) {
        const auto* pos = storage<Position>().Find(entity);
        if (pos == nullptr) {
            continue;
        }
        snap.projectiles.push_back(
            ProjectileSnapshot{entity, projectiles.Get(entity).owner, pos->ToVector()});
    }

    return snap;
}

std::vector<DamageEvent> Simulation::DrainDamageEvents() {
    return std::exchange(events_.damage, {});
}

std::vector<DeathEvent> Simulation::DrainDeathEvents() {
    return std::exchange(events_.deaths, {});
}

MatchPhase Simulation::Phase() const {
    const auto* state = storage<ShowdownState>().Find(matchEntity_);
    return state != nullptr ? state->state : MatchPhase::Normal;
}

std::optional<uint8_t> Simulation::Winner() const {
    const auto* state = storage<ShowdownState>().Find(matchEntity_);
    return state != nullptr ? state->winner : std::nullopt;
}

float Simulation::TotalTime() const {
    const auto* timer = storage<GameTimer>().Find(matchEntity_);
    return timer != nullptr ? timer->totalTime : 0.0f;
}

}  // namespace arena::game
