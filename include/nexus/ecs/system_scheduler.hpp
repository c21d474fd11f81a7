#pragma once

/// @file system_scheduler.hpp
/// @brief Ordered system pipeline with explicit dependencies.
///
/// SystemScheduler owns the registered systems, groups them by stage and
/// orders each stage by a topological sort of the declared dependencies.
/// Stages run only when the caller asks for them, so the owner decides
/// per frame whether e.g. the simulation stage runs at all.

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "nexus/foundation/game_result.hpp"

namespace nexus::ecs {

// ── System type identification ──────────────────────────────────────────

using SystemTypeId = uint32_t;

constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Obtain the unique SystemTypeId for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── Execution stages ────────────────────────────────────────────────────

enum class SystemStage : uint8_t {
    Simulation,   ///< Gameplay: input, AI, physics, pickups, timers
    Presentation  ///< Cosmetic: particles, trail, animation
};

inline constexpr std::size_t kSystemStageCount = 2;

// ── System interface ────────────────────────────────────────────────────

/// Abstract base class for pipeline systems.
///
/// Systems receive their collaborators (registry, world state) at
/// construction and only the frame delta at execution.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// @param deltaTime  Clamped frame delta time in seconds.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Simulation; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

// ── System scheduler ────────────────────────────────────────────────────

class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    // ── Registration ────────────────────────────────────────────────

    /// Construct and register a system of type `T`. Re-registering the
    /// same type returns the existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    [[nodiscard]] std::size_t SystemCount() const noexcept { return systems_.size(); }

    // ── Dependencies ────────────────────────────────────────────────

    /// Declare that `before` must execute before `after`.
    /// @return false if either system is unknown or the stages differ.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    template <typename Before, typename After>
    bool AddDependency() {
        return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
    }

    // ── Enable / disable ────────────────────────────────────────────

    /// Disabled systems are skipped without changing the plan.
    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled) {
        SetEnabled(SystemType<T>::Id(), enabled);
    }

    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    // ── Execution ───────────────────────────────────────────────────

    /// Build the per-stage execution order.
    /// A dependency cycle fails with ErrorCode::SystemError; the error
    /// context is the std::vector<std::string> of systems left unordered.
    [[nodiscard]] foundation::GameResult<void> Build();

    [[nodiscard]] bool IsBuilt() const noexcept { return built_; }

    /// Run every enabled system of @p stage in order.
    /// @pre Build() succeeded.
    void ExecuteStage(SystemStage stage, float deltaTime);

    // ── Queries ─────────────────────────────────────────────────────

    /// @return Pointer to the system, or nullptr if not registered.
    template <typename T>
    [[nodiscard]] T* GetSystem();

    /// Execution order for @p stage (empty before Build()).
    [[nodiscard]] const std::vector<SystemTypeId>& GetExecutionOrder(SystemStage stage) const;

    /// Names of the systems of @p stage in execution order.
    [[nodiscard]] std::vector<std::string_view> GetExecutionNames(SystemStage stage) const;

private:
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemTypeId typeId = kInvalidSystemTypeId;
        SystemStage stage = SystemStage::Simulation;
        bool enabled = true;
    };

    /// Orders @p registered so every successor follows its predecessors.
    /// @return the systems that could not be placed (non-empty on a cycle).
    std::vector<SystemTypeId> orderStage(const std::vector<SystemTypeId>& registered,
                                         std::vector<SystemTypeId>& order) const;

    static constexpr std::size_t stageIndex(SystemStage stage) noexcept {
        return static_cast<std::size_t>(stage);
    }

    std::unordered_map<SystemTypeId, SystemEntry> systems_;

    /// Per stage, in registration order.
    std::array<std::vector<SystemTypeId>, kSystemStageCount> registered_;
    std::array<std::vector<SystemTypeId>, kSystemStageCount> order_;

    /// successors_[A] holds every B that must run after A.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> successors_;

    bool built_ = false;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>, "T must derive from ISystem");

    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T&>(*it->second.instance);
    }

    auto system = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *system;

    SystemEntry entry;
    entry.instance = std::move(system);
    entry.typeId = typeId;
    entry.stage = ref.GetStage();

    registered_[stageIndex(entry.stage)].push_back(typeId);
    systems_.emplace(typeId, std::move(entry));
    built_ = false;

    return ref;
}

template <typename T>
T* SystemScheduler::GetSystem() {
    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T*>(it->second.instance.get());
    }
    return nullptr;
}

} // namespace nexus::ecs
