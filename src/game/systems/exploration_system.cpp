/// @file exploration_system.cpp
/// @brief ExplorationSystem implementation.

#include "nexus/game/exploration_system.hpp"

#include <cmath>

namespace nexus::game {

void ExplorationSystem::Execute(float /*deltaTime*/) {
    const auto* position = world_.PlayerPosition();
    if (position == nullptr) {
        return;
    }

    const GridCell centre = world_.mapping.WorldToGrid(position->ToVector());
    const int32_t radius = world_.config.fogRadius;
    const float reach = static_cast<float>(radius) + 0.5f;

    for (int32_t dz = -radius; dz <= radius; ++dz) {
        for (int32_t dx = -radius; dx <= radius; ++dx) {
            if (std::hypot(static_cast<float>(dx), static_cast<float>(dz)) <= reach) {
                world_.exploration.Mark({centre.x + dx, centre.z + dz});
            }
        }
    }
}

} // namespace nexus::game
