#pragma once

/// @file particle_system.hpp
/// @brief ParticleSystem: ages active particles and recycles expired ones.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

class ParticleSystem final : public ecs::ISystem {
public:
    explicit ParticleSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Presentation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "ParticleSystem"; }

private:
    GameWorld& world_;
};

} // namespace nexus::game
