/// @file match_phase_system.cpp
/// @brief MatchPhaseSystem implementation.

#include "arena/game/match_phase_system.hpp"

#include "arena/foundation/game_logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <string>
#include <variant>

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── Free helpers ────────────────────────────────────────────────────────

MatchPhase PhaseForTime(float totalTime, const PhaseThresholds& phases) noexcept {
    if (totalTime >= phases.showdown) {
        return MatchPhase::Showdown;
    }
    if (totalTime >= phases.collapse) {
        return MatchPhase::Collapse;
    }
    if (totalTime >= phases.warning) {
        return MatchPhase::Warning;
    }
    return MatchPhase::Normal;
}

std::optional<float> TimeUntilNextPhase(MatchPhase current, float totalTime,
                                        const PhaseThresholds& phases,
                                        float matchEndTime) noexcept {
    float next = 0.0f;
    switch (current) {
        case MatchPhase::Normal:   next = phases.warning; break;
        case MatchPhase::Warning:  next = phases.collapse; break;
        case MatchPhase::Collapse: next = phases.showdown; break;
        case MatchPhase::Showdown: next = matchEndTime; break;
        case MatchPhase::Ended:
            return std::nullopt;
    }
    return std::max(0.0f, next - totalTime);
}

bool RevertToManual(BehaviorMode& mode, MoveTarget* moveTarget) {
    const auto* forced = std::get_if<ForcedAuto>(&mode);
    if (forced == nullptr) {
        return false;
    }
    if (moveTarget != nullptr) {
        moveTarget->x = forced->original.savedTargetX;
        moveTarget->y = forced->original.savedTargetY;
        moveTarget->active = forced->original.hadTarget;
    }
    mode = ManualControl{};
    return true;
}

// ── MatchPhaseSystem ────────────────────────────────────────────────────

MatchPhaseSystem::MatchPhaseSystem(MatchStorages storages,
                                   ecs::Entity matchEntity,
                                   Targeting& targeting,
                                   DamageResolver& resolver,
                                   const MatchConfig& config)
    : s_(storages),
      matchEntity_(matchEntity),
      targeting_(targeting),
      resolver_(resolver),
      config_(config),
      rng_(config.seed) {}

void MatchPhaseSystem::Execute(float deltaTime) {
    auto* timer = s_.timers.Find(matchEntity_);
    auto* state = s_.showdown.Find(matchEntity_);
    if (timer == nullptr || state == nullptr) {
        ARENA_LOG_ERROR(LogCategory::Match, "match entity lost its timer or showdown state");
        return;
    }
    if (state->state == MatchPhase::Ended) {
        return;
    }

    timer->totalTime += deltaTime;

    const auto reached = PhaseForTime(timer->totalTime, config_.phases);
    if (reached > state->state) {
        transitionTo(*state, reached, timer->totalTime);
        if (reached == MatchPhase::Showdown) {
            enterShowdown();
        }
    }

    if (state->state == MatchPhase::Showdown) {
        runForcedAutoBattle(deltaTime);
        evaluateVictory(*state, timer->totalTime);
    }
}

void MatchPhaseSystem::transitionTo(ShowdownState& state, MatchPhase next, float totalTime) {
    LogContext ctx;
    ctx.extra["from"] = std::string(MatchPhaseName(state.state));
    ctx.extra["to"] = std::string(MatchPhaseName(next));
    ctx.extra["time"] = std::to_string(totalTime);
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Match, "match phase changed", ctx);

    state.lastState = state.state;
    state.state = next;
    state.transitionTime = totalTime;
}

void MatchPhaseSystem::enterShowdown() {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const float radius = config_.teleportRadius;
    std::size_t teleported = 0;

    for (auto entity : s_.healths.SortedEntities()) {
        auto* pos = s_.positions.Find(entity);
        if (pos == nullptr || !s_.healths.Get(entity).IsAlive()) {
            continue;
        }

        // sqrt keeps the density uniform over the disc.
        const float angle = unit(rng_) * 2.0f * std::numbers::pi_v<float>;
        const float distance = radius * std::sqrt(unit(rng_));
        Vector2 offset{std::cos(angle) * distance, std::sin(angle) * distance};
        if (offset.Length() > radius) {
            offset = offset.Normalized() * radius;
        }

        const Vector2 destination = config_.arenaCenter + offset;
        pos->Set(destination);
        if (auto* index = targeting_.Index()) {
            index->Update(entity, destination);
        }

        if (auto* vel = s_.velocities.Find(entity)) {
            vel->Set(Vector2::Zero());
        }

        ForcedAuto forced;
        if (auto* move = s_.moveTargets.Find(entity)) {
            forced.original = OriginalAI{move->x, move->y, move->active};
            move->active = false;
        }
        s_.behaviors.GetOrAdd(entity) = forced;

        ++teleported;
    }

    LogContext ctx;
    ctx.extra["units"] = std::to_string(teleported);
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Match, "showdown started, units gathered", ctx);
}

void MatchPhaseSystem::runForcedAutoBattle(float deltaTime) {
    for (auto entity : s_.behaviors.SortedEntities()) {
        auto* forced = std::get_if<ForcedAuto>(&s_.behaviors.Get(entity));
        auto* pos = s_.positions.Find(entity);
        const auto* team = s_.teams.Find(entity);
        const auto* hp = s_.healths.Find(entity);
        if (forced == nullptr || pos == nullptr || team == nullptr || hp == nullptr ||
            !hp->IsAlive()) {
            continue;
        }

        forced->attackCooldown = std::max(0.0f, forced->attackCooldown - deltaTime);

        const auto target = targeting_.FindNearestEnemy(pos->ToVector(), team->id);
        forced->targetEntity = target;
        auto* vel = s_.velocities.Find(entity);
        if (!target.isValid()) {
            if (vel != nullptr) {
                vel->Set(Vector2::Zero());
            }
            continue;
        }

        const auto* damage = s_.damages.Find(entity);
        const float attackRange = damage != nullptr ? damage->range : config_.baseAttack.range;

        const Vector2 targetPos = s_.positions.Get(target).ToVector();
        Vector2 toTarget = targetPos - pos->ToVector();
        float distance = toTarget.Length();

        if (distance > attackRange) {
            const Vector2 dir = toTarget.Normalized();
            const float step = std::min(config_.chaseSpeed * deltaTime,
                                        distance - attackRange * kChaseStopFraction);
            const Vector2 next = pos->ToVector() + dir * step;
            pos->Set(next);
            if (auto* index = targeting_.Index()) {
                index->Update(entity, next);
            }
            if (vel != nullptr) {
                vel->Set(dir * config_.chaseSpeed);
            }
            distance -= step;
        } else if (vel != nullptr) {
            vel->Set(Vector2::Zero());
        }

        // Units with Damage attack through the combat system.
        if (damage == nullptr && distance <= config_.baseAttack.range &&
            forced->attackCooldown <= 0.0f) {
            resolver_.Apply(entity, target, config_.baseAttack.damage);
            forced->attackCooldown = 1.0f / config_.baseAttack.attackSpeed;
        }
    }
}

void MatchPhaseSystem::evaluateVictory(ShowdownState& state, float totalTime) {
    std::array<bool, kTeamCount> teamAlive{};
    for (std::size_t i = 0; i < s_.healths.Size(); ++i) {
        const auto entity = s_.healths.EntityAt(i);
        const auto* team = s_.teams.Find(entity);
        if (team != nullptr && team->id < kTeamCount && s_.healths.Get(entity).IsAlive()) {
            teamAlive[team->id] = true;
        }
    }

    const auto living = std::count(teamAlive.begin(), teamAlive.end(), true);

    std::optional<uint8_t> winner;
    if (living == 1) {
        winner = teamAlive[0] ? uint8_t{0} : uint8_t{1};
    } else if (living == 0 || totalTime >= config_.matchEndTime) {
        winner = kDrawTeam;
    }
    if (!winner) {
        return;
    }

    state.winner = winner;
    transitionTo(state, MatchPhase::Ended, totalTime);

    LogContext ctx;
    ctx.teamId = *winner;
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Match,
                  *winner == kDrawTeam ? "match ended in a draw" : "match ended", ctx);
}

}  // namespace arena::game
