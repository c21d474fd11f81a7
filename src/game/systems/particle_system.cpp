/// @file particle_system.cpp
/// @brief ParticleSystem implementation.

#include "nexus/game/particle_system.hpp"

namespace nexus::game {

void ParticleSystem::Execute(float /*deltaTime*/) {
    auto& registry = world_.registry;

    for (auto entity : registry.Resolve(world_.queries.particles)) {
        auto* particle = registry.Find(world_.kinds.particle, entity);
        if (particle == nullptr || !particle->active) {
            continue;
        }
        if (--particle->life <= 0) {
            world_.particles.Release(entity);
        }
    }
}

} // namespace nexus::game
