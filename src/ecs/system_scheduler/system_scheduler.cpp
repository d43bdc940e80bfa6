/// @file system_scheduler.cpp
/// @brief Per-stage Kahn ordering with registration order as tie-break.

#include "arena/ecs/system_scheduler.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <string>

namespace arena::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr std::size_t stageIndex(SystemStage stage) noexcept {
    return static_cast<std::size_t>(stage);
}

} // namespace

std::optional<std::size_t> SystemScheduler::slotOf(SystemTypeId type) const noexcept {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].type == type) {
            return i;
        }
    }
    return std::nullopt;
}

ISystem& SystemScheduler::insert(SystemTypeId type, std::unique_ptr<ISystem> system) {
    Slot slot;
    slot.stage = system->GetStage();
    slot.type = type;
    slot.system = std::move(system);
    slots_.push_back(std::move(slot));
    built_ = false;
    return *slots_.back().system;
}

bool SystemScheduler::link(SystemTypeId before, SystemTypeId after) {
    auto from = slotOf(before);
    auto to = slotOf(after);
    if (!from || !to || slots_[*from].stage != slots_[*to].stage) {
        return false;
    }

    auto& edges = slots_[*from].runsBefore;
    if (std::find(edges.begin(), edges.end(), *to) == edges.end()) {
        edges.push_back(*to);
        built_ = false;
    }
    return true;
}

GameResult<SystemScheduler::RunList> SystemScheduler::orderStage(SystemStage stage) const {
    // Only slots of this stage take part; links never cross stages.
    std::vector<std::size_t> pending(slots_.size(), 0);
    std::size_t members = 0;
    for (const auto& slot : slots_) {
        if (slot.stage != stage) {
            continue;
        }
        ++members;
        for (auto next : slot.runsBefore) {
            ++pending[next];
        }
    }

    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].stage == stage && pending[i] == 0) {
            ready.push(i);
        }
    }

    RunList run;
    run.reserve(members);
    while (!ready.empty()) {
        const auto current = ready.top();
        ready.pop();
        run.push_back(slots_[current].system.get());
        for (auto next : slots_[current].runsBefore) {
            if (--pending[next] == 0) {
                ready.push(next);
            }
        }
    }

    if (run.size() == members) {
        return GameResult<RunList>::ok(std::move(run));
    }

    std::string looped;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].stage == stage && pending[i] != 0) {
            if (!looped.empty()) {
                looped += ", ";
            }
            looped += slots_[i].system->GetName();
        }
    }
    return GameResult<RunList>::err(GameError(
        ErrorCode::SystemError, "circular system dependency: [" + looped + "]"));
}

GameResult<void> SystemScheduler::Build() {
    built_ = false;
    std::array<RunList, kSystemStageCount> plan{};

    for (auto stage : {SystemStage::PreUpdate, SystemStage::Update, SystemStage::PostUpdate}) {
        auto ordered = orderStage(stage);
        if (!ordered) {
            return GameResult<void>::err(ordered.error());
        }
        plan[stageIndex(stage)] = std::move(ordered).value();
    }

    plan_ = std::move(plan);
    built_ = true;
    return GameResult<void>::ok();
}

GameResult<void> SystemScheduler::Execute(float deltaTime) {
    if (!built_) {
        return GameResult<void>::err(
            GameError(ErrorCode::SystemError, "system schedule has not been built"));
    }
    for (const auto& run : plan_) {
        for (auto* system : run) {
            system->Execute(deltaTime);
        }
    }
    return GameResult<void>::ok();
}

std::vector<std::string_view> SystemScheduler::ExecutionPlan(SystemStage stage) const {
    std::vector<std::string_view> names;
    if (!built_) {
        return names;
    }
    for (const auto* system : plan_[stageIndex(stage)]) {
        names.push_back(system->GetName());
    }
    return names;
}

} // namespace arena::ecs
