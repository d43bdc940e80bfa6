#pragma once

/// @file system_scheduler.hpp
/// @brief Staged, dependency-ordered execution of simulation systems.
///
/// Systems are grouped by SystemStage. Build() turns each group into a
/// flat run list; Execute() walks PreUpdate, Update and PostUpdate in
/// turn on the calling thread.

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "arena/foundation/game_result.hpp"

namespace arena::ecs {

using SystemTypeId = uint32_t;

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Process-wide id of system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

/// Stages run in declaration order every tick.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Global state that later stages read (match phase).
    Update,      ///< Gameplay (movement, abilities, combat).
    PostUpdate   ///< Bookkeeping (cleanup, index sync).
};

inline constexpr std::size_t kSystemStageCount = 3;

class ISystem {
public:
    virtual ~ISystem() = default;

    /// @param deltaTime  Simulated seconds since the previous tick.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

/// Owns the systems of one simulation and runs them in a fixed order.
///
/// Inside a stage a declared dependency wins; otherwise the system that
/// was registered first runs first.
class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    /// Construct a system of type `T` in place.
    ///
    /// A second call for the same type returns the first instance and
    /// ignores @p args.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    /// `Before` runs ahead of `After` within their shared stage.
    ///
    /// @return false when either type is unregistered or the two sit in
    ///         different stages.
    template <typename Before, typename After>
    bool AddDependency();

    /// Resolve the run list of every stage.
    ///
    /// Fails with ErrorCode::SystemError, listing the systems caught in
    /// the loop, when a stage's dependencies form a cycle.
    [[nodiscard]] foundation::GameResult<void> Build();

    /// Run one tick. Fails with ErrorCode::SystemError before Build()
    /// has succeeded.
    [[nodiscard]] foundation::GameResult<void> Execute(float deltaTime);

    [[nodiscard]] bool IsBuilt() const noexcept { return built_; }

    /// System names of @p stage in run order; empty before Build().
    [[nodiscard]] std::vector<std::string_view> ExecutionPlan(SystemStage stage) const;

private:
    struct Slot {
        std::unique_ptr<ISystem> system;
        SystemTypeId type = 0;
        SystemStage stage = SystemStage::Update;
        std::vector<std::size_t> runsBefore;
    };

    using RunList = std::vector<ISystem*>;

    [[nodiscard]] std::optional<std::size_t> slotOf(SystemTypeId type) const noexcept;
    [[nodiscard]] ISystem& insert(SystemTypeId type, std::unique_ptr<ISystem> system);
    bool link(SystemTypeId before, SystemTypeId after);
    [[nodiscard]] foundation::GameResult<RunList> orderStage(SystemStage stage) const;

    /// Registration order.
    std::vector<Slot> slots_;
    std::array<RunList, kSystemStageCount> plan_{};
    bool built_ = false;
};

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>, "T must derive from ISystem");

    const auto type = SystemType<T>::Id();
    if (auto existing = slotOf(type)) {
        return static_cast<T&>(*slots_[*existing].system);
    }
    return static_cast<T&>(
        insert(type, std::make_unique<T>(std::forward<Args>(args)...)));
}

template <typename Before, typename After>
bool SystemScheduler::AddDependency() {
    return link(SystemType<Before>::Id(), SystemType<After>::Id());
}

} // namespace arena::ecs
