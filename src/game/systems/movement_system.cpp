/// @file movement_system.cpp
/// @brief MovementSystem implementation.

#include "nexus/game/movement_system.hpp"

#include <cmath>

namespace nexus::game {

void MovementSystem::Execute(float deltaTime) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const float damping = std::pow(world_.config.friction, deltaTime * 60.0f);

    for (auto entity : registry.Resolve(world_.queries.moving)) {
        auto* position = registry.Find(kinds.position, entity);
        auto* velocity = registry.Find(kinds.velocity, entity);
        if (position == nullptr || velocity == nullptr) {
            continue;
        }

        if (const auto* particle = registry.Find(kinds.particle, entity)) {
            if (!particle->active) {
                continue;
            }
            velocity->y -= world_.config.particleGravity;
        } else {
            velocity->x *= damping;
            velocity->z *= damping;
        }

        position->x += velocity->x * deltaTime;
        position->y += velocity->y * deltaTime;
        position->z += velocity->z * deltaTime;
    }
}

} // namespace nexus::game
