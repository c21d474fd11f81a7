/// @file animation_system.cpp
/// @brief AnimationSystem implementation.

#include "nexus/game/animation_system.hpp"

#include <cmath>

namespace nexus::game {

void AnimationSystem::Execute(float /*deltaTime*/) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& config = world_.config;

    // Elapsed game time in ms.
    const double now = static_cast<double>(world_.frame.nowMs - world_.gameStartMs);

    for (auto entity : registry.Resolve(world_.queries.animated)) {
        auto* position = registry.Find(kinds.position, entity);
        auto* animation = registry.Find(kinds.animation, entity);
        if (position == nullptr || animation == nullptr) {
            continue;
        }
        const double speed = animation->speed;
        const double phase = animation->phase;

        if (registry.HasComponent(kinds.collectible, entity) ||
            registry.HasComponent(kinds.powerUp, entity)) {
            animation->rotation += animation->speed * 100.0f;
            position->y = config.collectibleBobHeight +
                static_cast<float>(std::sin(now * speed + phase)) * config.bobAmplitude;
        } else if (registry.HasComponent(kinds.enemy, entity)) {
            animation->rotation += animation->speed;
            position->y = config.enemyBobHeight +
                static_cast<float>(std::sin(now * speed * 2.0 + phase)) * config.enemyBobAmplitude;
        } else {
            animation->rotation += animation->speed;
        }
    }
}

} // namespace nexus::game
