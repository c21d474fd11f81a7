#pragma once

/// @file input_system.hpp
/// @brief InputSystem: turns the frame's action set into player motion.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

/// Applies movement, boost and dash input to the player.
///
/// Directions are camera-relative in third person and fixed in first
/// person. Boosting drains energy while moving; energy regenerates
/// otherwise. A dash needs energy and a ready cooldown, and the cooldown
/// is restored by scheduled work owned by the player entity.
class InputSystem final : public ecs::ISystem {
public:
    explicit InputSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Simulation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "InputSystem"; }

private:
    GameWorld& world_;
};

} // namespace nexus::game
