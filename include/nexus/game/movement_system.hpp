#pragma once

/// @file movement_system.hpp
/// @brief MovementSystem: damping, particle gravity and integration.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

/// Integrates every entity with Position and Velocity.
///
/// Non-particles get frame-rate independent horizontal damping
/// (friction^(dt*60)); active particles fall; inactive ones are skipped.
class MovementSystem final : public ecs::ISystem {
public:
    explicit MovementSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Simulation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "MovementSystem"; }

private:
    GameWorld& world_;
};

} // namespace nexus::game
