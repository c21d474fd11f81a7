#pragma once

/// @file ai_system.hpp
/// @brief AISystem: per-tick enemy behavior.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/behavior_controller.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

/// Ticks the behavior controller for every enemy with AI data.
///
/// Each tick:
///   1. Skip everything when there is no live player.
///   2. Increment the enemy's AI timer (drives chase re-pathing).
///   3. Resolve or lazily create its behavior context, then tick it.
class AISystem final : public ecs::ISystem {
public:
    explicit AISystem(GameWorld& world);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Simulation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "AISystem"; }

    /// Number of enemies ticked on the last Execute call.
    [[nodiscard]] uint32_t GetLastTickUpdateCount() const noexcept {
        return lastTickUpdateCount_;
    }

private:
    GameWorld& world_;
    BehaviorController controller_;
    uint32_t lastTickUpdateCount_ = 0;
};

} // namespace nexus::game
