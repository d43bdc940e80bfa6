/// @file combat_system.cpp
/// @brief DamageResolver and CombatSystem implementation.

#include "arena/game/combat_system.hpp"

#include "arena/foundation/game_logger.hpp"

#include <algorithm>
#include <string>

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ═══════════════════════════════════════════════════════════════════════════
// DamageResolver
// ═══════════════════════════════════════════════════════════════════════════

DamageResolver::DamageResolver(ecs::ComponentStorage<Health>& healths,
                               ecs::ComponentStorage<Shield>& shields,
                               ecs::ComponentStorage<Position>& positions,
                               TickEvents& events)
    : healths_(healths), shields_(shields), positions_(positions), events_(events) {}

float DamageResolver::DefenseMultiplier(ecs::Entity target) const {
    const auto* shield = shields_.Find(target);
    if (shield != nullptr && shield->active > 0.0f) {
        return 1.0f - shield->reduction;
    }
    return 1.0f;
}

float DamageResolver::Apply(ecs::Entity source, ecs::Entity target, float baseAmount) {
    auto* hp = healths_.Find(target);
    if (hp == nullptr || !hp->IsAlive()) {
        return 0.0f;
    }

    const float amount = CombatSystem::CalculateDamage(baseAmount, DefenseMultiplier(target));
    hp->SetCurrent(hp->current - amount);

    DamageEvent event;
    event.source = source;
    event.target = target;
    event.amount = amount;
    if (const auto* pos = positions_.Find(target)) {
        event.position = pos->ToVector();
    }
    events_.damage.push_back(event);

    if (!hp->IsAlive()) {
        events_.deaths.push_back(DeathEvent{target, source});

        LogContext ctx;
        ctx.entityId = target.id();
        ctx.extra["killer"] = std::to_string(source.id());
        ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "unit killed", ctx);
    }

    return amount;
}

// ═══════════════════════════════════════════════════════════════════════════
// CombatSystem
// ═══════════════════════════════════════════════════════════════════════════

CombatSystem::CombatSystem(ecs::ComponentStorage<Damage>& damages,
                           ecs::ComponentStorage<Position>& positions,
                           ecs::ComponentStorage<Team>& teams,
                           ecs::ComponentStorage<Health>& healths,
                           const ecs::ComponentStorage<ShowdownState>& showdown,
                           Targeting& targeting,
                           DamageResolver& resolver)
    : attackers_(damages, positions, teams, healths),
      showdown_(showdown),
      targeting_(targeting),
      resolver_(resolver) {}

void CombatSystem::Execute(float deltaTime) {
    if (IsMatchOver(showdown_)) {
        return;
    }

    attackers_.ForEach([&](ecs::Entity entity, Damage& dmg, Position& pos, Team& team,
                           Health& hp) {
        if (!hp.IsAlive()) {
            return;
        }

        dmg.cooldown = std::max(0.0f, dmg.cooldown - deltaTime);
        if (dmg.cooldown > 0.0f) {
            return;
        }

        const auto target = targeting_.FindNearestEnemy(pos.ToVector(), team.id, dmg.range);
        if (!target.isValid()) {
            return;
        }

        resolver_.Apply(entity, target, dmg.amount);
        dmg.cooldown = dmg.attackSpeed > 0.0f ? 1.0f / dmg.attackSpeed : 0.0f;
    });
}

// ── Static damage calculation ───────────────────────────────────────────

float CombatSystem::CalculateDamage(float baseDamage, float multiplier) noexcept {
    return std::max(baseDamage, 0.0f) * std::max(multiplier, 0.0f);
}

}  // namespace arena::game
