#pragma once

/// @file animation_system.hpp
/// @brief AnimationSystem: bobbing and spin of pickups, goal and enemies.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

class AnimationSystem final : public ecs::ISystem {
public:
    explicit AnimationSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Presentation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "AnimationSystem"; }

private:
    GameWorld& world_;
};

} // namespace nexus::game
