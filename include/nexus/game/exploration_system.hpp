#pragma once

/// @file exploration_system.hpp
/// @brief ExplorationSystem: reveals fog cells around the player.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

class ExplorationSystem final : public ecs::ISystem {
public:
    explicit ExplorationSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Simulation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "ExplorationSystem"; }

private:
    GameWorld& world_;
};

} // namespace nexus::game
