#pragma once

/// @file input_queue.hpp
/// @brief Ordered queue of ability activation requests.

#include "arena/ecs/entity.hpp"
#include "arena/game/ability_components.hpp"

#include <utility>
#include <vector>

namespace arena::game {

/// Edge-triggered "activate ability" request for one entity.
struct AbilityRequest {
    ecs::Entity entity;
    AbilityKind kind = AbilityKind::Dash;
};

/// FIFO of ability requests collected between ticks.
///
/// The ability system drains the whole queue every tick, so a request
/// is considered exactly once and never carries over.
class AbilityInputQueue {
public:
    void Push(ecs::Entity entity, AbilityKind kind) {
        requests_.push_back(AbilityRequest{entity, kind});
    }

    /// Hand out every pending request in arrival order and empty the queue.
    [[nodiscard]] std::vector<AbilityRequest> Drain() {
        std::vector<AbilityRequest> out;
        out.swap(requests_);
        return out;
    }

    void Clear() noexcept { requests_.clear(); }

    [[nodiscard]] std::size_t Size() const noexcept { return requests_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return requests_.empty(); }

private:
    std::vector<AbilityRequest> requests_;
};

}  // namespace arena::game
