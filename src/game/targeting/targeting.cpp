/// @file targeting.cpp
/// @brief Targeting implementation with index self-repair.

#include "arena/game/targeting.hpp"

#include "arena/foundation/game_logger.hpp"

#include <cmath>

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

/// Keeps the strictly nearest candidate; candidates arrive in ascending
/// id order, so the first of several equals wins.
struct NearestCandidate {
    ecs::Entity entity;
    float distanceSq = std::numeric_limits<float>::infinity();

    void Offer(ecs::Entity candidate, float dSq) noexcept {
        if (!entity.isValid() || dSq < distanceSq ||
            (dSq == distanceSq && candidate.id() < entity.id())) {
            entity = candidate;
            distanceSq = dSq;
        }
    }
};

void logRepair(ecs::Entity entity, const char* what) {
    LogContext ctx;
    ctx.entityId = entity.id();
    ctx.extra["repair"] = what;
    ARENA_LOG_CTX(LogLevel::Warning, LogCategory::World,
                  "spatial index desync repaired", ctx);
}

} // namespace

Targeting::Targeting(ecs::ComponentStorage<Position>& positions,
                     ecs::ComponentStorage<Health>& healths,
                     ecs::ComponentStorage<Team>& teams,
                     SpatialIndex* index)
    : positions_(positions), healths_(healths), teams_(teams), index_(index) {}

ecs::Entity Targeting::FindNearestEnemy(const Vector2& position, uint8_t team,
                                        float maxRadius) {
    if (maxRadius < 0.0f) {
        return ecs::Entity::invalid();
    }
    if (index_ == nullptr || !std::isfinite(maxRadius)) {
        return findLinear(position, team, maxRadius);
    }
    return findWithIndex(position, team, maxRadius);
}

bool Targeting::IsTargetable(ecs::Entity entity) const {
    const auto* hp = healths_.Find(entity);
    return hp != nullptr && hp->IsAlive() && positions_.Has(entity) && teams_.Has(entity);
}

std::size_t Targeting::Reconcile() {
    if (index_ == nullptr) {
        return 0;
    }

    std::size_t repaired = 0;
    for (auto entity : index_->TrackedEntities()) {
        if (!positions_.Has(entity) || !healths_.Has(entity) || !teams_.Has(entity)) {
            index_->Remove(entity);
            logRepair(entity, "removed");
            ++repaired;
        }
    }

    for (auto entity : healths_.SortedEntities()) {
        const auto* pos = positions_.Find(entity);
        if (pos == nullptr || !teams_.Has(entity)) {
            continue;
        }
        const auto indexed = index_->IndexedPosition(entity);
        if (!indexed) {
            index_->Insert(entity, pos->ToVector());
            logRepair(entity, "inserted");
            ++repaired;
        } else if (*indexed != pos->ToVector()) {
            index_->Update(entity, pos->ToVector());
            logRepair(entity, "reindexed");
            ++repaired;
        }
    }

    repairs_ += repaired;
    verified_ = true;
    return repaired;
}

ecs::Entity Targeting::findWithIndex(const Vector2& position, uint8_t team, float maxRadius) {
    if (!verified_) {
        Reconcile();
    }

    const float maxSq = maxRadius * maxRadius;
    NearestCandidate best;

    // A repair can move an entity into or out of the query circle, so one
    // more pass runs over the corrected index.
    for (int pass = 0; pass < 2; ++pass) {
        bool repaired = false;
        best = NearestCandidate{};

        for (auto candidate : index_->QueryRadius(position, maxRadius)) {
            const auto* pos = positions_.Find(candidate);
            if (pos == nullptr || !healths_.Has(candidate) || !teams_.Has(candidate)) {
                index_->Remove(candidate);
                logRepair(candidate, "removed");
                ++repairs_;
                repaired = true;
                continue;
            }

            const Vector2 actual = pos->ToVector();
            if (index_->IndexedPosition(candidate) != actual) {
                index_->Update(candidate, actual);
                logRepair(candidate, "reindexed");
                ++repairs_;
                repaired = true;
                continue;
            }

            if (!healths_.Get(candidate).IsAlive() || teams_.Get(candidate).id == team) {
                continue;
            }

            const float dSq = (actual - position).LengthSquared();
            if (dSq <= maxSq) {
                best.Offer(candidate, dSq);
            }
        }

        if (!repaired) {
            break;
        }
    }

    return best.entity;
}

ecs::Entity Targeting::findLinear(const Vector2& position, uint8_t team, float maxRadius) const {
    const float maxSq = std::isfinite(maxRadius) ? maxRadius * maxRadius : maxRadius;
    NearestCandidate best;

    for (std::size_t i = 0; i < healths_.Size(); ++i) {
        const auto candidate = healths_.EntityAt(i);
        if (!healths_.Get(candidate).IsAlive()) {
            continue;
        }
        const auto* tm = teams_.Find(candidate);
        const auto* pos = positions_.Find(candidate);
        if (tm == nullptr || pos == nullptr || tm->id == team) {
            continue;
        }
        const float dSq = (pos->ToVector() - position).LengthSquared();
        if (dSq <= maxSq) {
            best.Offer(candidate, dSq);
        }
    }

    return best.entity;
}

}  // namespace arena::game
