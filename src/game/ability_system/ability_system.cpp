/// @file ability_system.cpp
/// @brief AbilitySystem implementation.

#include "arena/game/ability_system.hpp"

#include "arena/foundation/game_logger.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

template <typename Ability>
void countDown(ecs::ComponentStorage<Ability>& storage, float deltaTime) {
    for (auto& ability : storage) {
        ability.active = std::max(0.0f, ability.active - deltaTime);
        ability.cooldown = std::max(0.0f, ability.cooldown - deltaTime);
    }
}

template <typename Ability>
void startAbility(Ability& ability) {
    ability.active = ability.duration;
    ability.cooldown = ability.maxCooldown;
}

void logRequest(ecs::Entity entity, AbilityKind kind, const char* msg) {
    LogContext ctx;
    ctx.entityId = entity.id();
    ctx.extra["ability"] = std::string(AbilityKindName(kind));
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Ability, msg, ctx);
}

} // namespace

AbilitySystem::AbilitySystem(AbilityStorages storages,
                             ecs::EntityManager& entities,
                             AbilityInputQueue& input,
                             Targeting& targeting,
                             DamageResolver& resolver,
                             const MatchConfig& config)
    : s_(storages),
      entities_(entities),
      input_(input),
      targeting_(targeting),
      resolver_(resolver),
      config_(config) {}

void AbilitySystem::Execute(float deltaTime) {
    if (IsMatchOver(s_.showdown)) {
        input_.Clear();
        return;
    }

    tickTimers(deltaTime);
    advanceProjectiles(deltaTime);
    processRequests();
}

Vector2 AbilitySystem::FacingOf(ecs::Entity entity) const {
    if (const auto* vel = s_.velocities.Find(entity)) {
        const Vector2 dir = vel->ToVector().Normalized();
        if (dir.LengthSquared() > 0.0f) {
            return dir;
        }
    }
    if (const auto* team = s_.teams.Find(entity)) {
        return DefaultHeading(team->id);
    }
    return DefaultHeading(0);
}

// ── Timers ──────────────────────────────────────────────────────────────

void AbilitySystem::tickTimers(float deltaTime) {
    countDown(s_.dashes, deltaTime);
    countDown(s_.shields, deltaTime);
    countDown(s_.rangedAttacks, deltaTime);
}

// ── Projectiles ─────────────────────────────────────────────────────────

void AbilitySystem::advanceProjectiles(float deltaTime) {
    for (auto entity : s_.projectiles.SortedEntities()) {
        auto& proj = s_.projectiles.Get(entity);
        auto* pos = s_.positions.Find(entity);
        const auto* vel = s_.velocities.Find(entity);
        if (proj.resolved || pos == nullptr) {
            continue;
        }
        // Owner died: the projectile is void and waits for cleanup.
        if (!targeting_.IsTargetable(proj.owner)) {
            continue;
        }
        if (vel == nullptr || vel->ToVector().LengthSquared() <= 0.0f) {
            proj.resolved = true;
            continue;
        }

        const Vector2 from = pos->ToVector();
        Vector2 to = from + vel->ToVector() * deltaTime;

        const bool reachedEnd = Distance(proj.origin, to) >= proj.maxDistance;
        if (reachedEnd) {
            to = proj.origin + (to - proj.origin).Normalized() * proj.maxDistance;
        }

        const auto hit = firstEnemyAlong(from, to, proj.ownerTeam, proj.hitRadius);
        pos->Set(to);

        if (hit.isValid()) {
            resolver_.Apply(proj.owner, hit, proj.damage);
            proj.resolved = true;

            LogContext ctx;
            ctx.entityId = proj.owner.id();
            ctx.extra["target"] = std::to_string(hit.id());
            ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Ability, "projectile hit", ctx);
        } else if (reachedEnd) {
            proj.resolved = true;
        }
    }
}

ecs::Entity AbilitySystem::firstEnemyAlong(const Vector2& from, const Vector2& to,
                                           uint8_t team, float radius) const {
    ecs::Entity best;
    float bestDistance = std::numeric_limits<float>::infinity();

    for (auto candidate : s_.healths.SortedEntities()) {
        if (!s_.healths.Get(candidate).IsAlive()) {
            continue;
        }
        const auto* tm = s_.teams.Find(candidate);
        const auto* pos = s_.positions.Find(candidate);
        if (tm == nullptr || pos == nullptr || tm->id == team) {
            continue;
        }
        const Vector2 p = pos->ToVector();
        if (DistanceToSegment(p, from, to) > radius) {
            continue;
        }
        const float d = Distance(from, p);
        if (d < bestDistance) {
            best = candidate;
            bestDistance = d;
        }
    }

    return best;
}

// ── Activation ──────────────────────────────────────────────────────────

void AbilitySystem::processRequests() {
    for (const auto& request : input_.Drain()) {
        bool activated = false;
        if (entities_.IsAlive(request.entity) && targeting_.IsTargetable(request.entity)) {
            switch (request.kind) {
                case AbilityKind::Dash:         activated = activateDash(request.entity); break;
                case AbilityKind::Shield:       activated = activateShield(request.entity); break;
                case AbilityKind::RangedAttack: activated = activateRanged(request.entity); break;
            }
        }

        if (activated) {
            logRequest(request.entity, request.kind, "ability activated");
        } else {
            ++rejected_;
            logRequest(request.entity, request.kind, "ability activation rejected");
        }
    }
}

bool AbilitySystem::activateDash(ecs::Entity entity) {
    auto* dash = s_.dashes.Find(entity);
    auto* pos = s_.positions.Find(entity);
    if (dash == nullptr || pos == nullptr || !IsReady(*dash)) {
        return false;
    }

    const uint8_t team = s_.teams.Get(entity).id;
    const Vector2 from = pos->ToVector();
    const Vector2 to = from + FacingOf(entity) * dash->distance;

    startAbility(*dash);
    pos->Set(to);
    if (auto* index = targeting_.Index()) {
        index->Update(entity, to);
    }

    // Contact damage, once per enemy in the swept path.
    for (auto candidate : s_.healths.SortedEntities()) {
        const auto* tm = s_.teams.Find(candidate);
        const auto* cpos = s_.positions.Find(candidate);
        if (tm == nullptr || cpos == nullptr || tm->id == team ||
            !s_.healths.Get(candidate).IsAlive()) {
            continue;
        }
        if (DistanceToSegment(cpos->ToVector(), from, to) <= config_.dash.contactRadius) {
            resolver_.Apply(entity, candidate, dash->damage);
        }
    }
    return true;
}

bool AbilitySystem::activateShield(ecs::Entity entity) {
    auto* shield = s_.shields.Find(entity);
    if (shield == nullptr || !IsReady(*shield)) {
        return false;
    }
    startAbility(*shield);
    return true;
}

bool AbilitySystem::activateRanged(ecs::Entity entity) {
    auto* ranged = s_.rangedAttacks.Find(entity);
    const auto* pos = s_.positions.Find(entity);
    if (ranged == nullptr || pos == nullptr || !IsReady(*ranged)) {
        return false;
    }

    const uint8_t team = s_.teams.Get(entity).id;
    const Vector2 origin = pos->ToVector();

    Vector2 direction;
    const auto target = targeting_.FindNearestEnemy(origin, team, ranged->range);
    if (target.isValid()) {
        direction = (s_.positions.Get(target).ToVector() - origin).Normalized();
    }
    if (direction.LengthSquared() <= 0.0f) {
        direction = FacingOf(entity);
    }

    startAbility(*ranged);

    const auto projectile = entities_.Create();
    s_.positions.Add(projectile, origin.x, origin.y);
    const Vector2 velocity = direction * ranged->projectileSpeed;
    s_.velocities.Add(projectile, velocity.x, velocity.y);

    Projectile proj;
    proj.owner = entity;
    proj.ownerTeam = team;
    proj.damage = ranged->damage;
    proj.origin = origin;
    proj.maxDistance = ranged->range;
    proj.hitRadius = config_.ranged.hitRadius;
    s_.projectiles.Add(projectile, proj);

    ranged->projectile = projectile;
    return true;
}

}  // namespace arena::game
