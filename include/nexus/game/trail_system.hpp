#pragma once

/// @file trail_system.hpp
/// @brief TrailSystem: records recent player positions.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

/// Appends the player position to every trail, keeping the newest
/// GameConfig::trailLength points.
class TrailSystem final : public ecs::ISystem {
public:
    explicit TrailSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Presentation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "TrailSystem"; }

private:
    GameWorld& world_;
};

} // namespace nexus::game
