#pragma once

/// @file ai_types.hpp
/// @brief Enemy behavior states and per-enemy behavior records.

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nexus/ecs/entity.hpp"

namespace nexus::game {

/// Behavior state of one enemy.
enum class AIState : uint8_t {
    Patrol,  ///< Wandering toward random open cells.
    Chase    ///< Pursuing the player.
};

constexpr std::string_view aiStateName(AIState state) {
    switch (state) {
        case AIState::Patrol: return "Patrol";
        case AIState::Chase:  return "Chase";
    }
    return "Unknown";
}

/// Index of an AIContext inside the AIContextArena.
using AIContextHandle = uint32_t;

constexpr AIContextHandle kInvalidAIContext = static_cast<AIContextHandle>(-1);

/// Behavior bookkeeping owned by the controller, not the registry.
struct AIContext {
    ecs::Entity entity;
    AIState state = AIState::Patrol;
    uint32_t stateTicks = 0;  ///< ticks spent in the current state
    bool active = false;
};

/// Arena of behavior contexts, addressed by handle or by entity.
///
/// Contexts refer to their enemy by identifier only; component data is
/// resolved per tick, so a context never dangles into component storage.
class AIContextArena {
public:
    /// Allocate a context for @p entity (reusing a released slot).
    AIContextHandle Create(ecs::Entity entity);

    /// Context for @p handle, or nullptr if released or unknown.
    [[nodiscard]] AIContext* Get(AIContextHandle handle);
    [[nodiscard]] const AIContext* Get(AIContextHandle handle) const;

    [[nodiscard]] AIContext* FindByEntity(ecs::Entity entity);

    void Release(AIContextHandle handle);

    /// Release every context (level teardown).
    void Clear();

    [[nodiscard]] std::size_t ActiveCount() const noexcept { return byEntity_.size(); }

private:
    std::vector<AIContext> slots_;
    std::vector<AIContextHandle> free_;
    std::unordered_map<ecs::Entity, AIContextHandle> byEntity_;
};

} // namespace nexus::game
