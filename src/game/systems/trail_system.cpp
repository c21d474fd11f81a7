/// @file trail_system.cpp
/// @brief TrailSystem implementation.

#include "nexus/game/trail_system.hpp"

namespace nexus::game {

void TrailSystem::Execute(float /*deltaTime*/) {
    const auto* position = world_.PlayerPosition();
    if (position == nullptr) {
        return;
    }

    auto& registry = world_.registry;
    const std::size_t limit = world_.config.trailLength;

    for (auto entity : registry.Resolve(world_.queries.trails)) {
        auto* trail = registry.Find(world_.kinds.trailPoints, entity);
        if (trail == nullptr) {
            continue;
        }
        trail->points.push_back(position->ToVector());
        while (trail->points.size() > limit) {
            trail->points.pop_front();
        }
    }
}

} // namespace nexus::game
