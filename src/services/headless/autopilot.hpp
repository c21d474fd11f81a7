#pragma once

/// @file autopilot.hpp
/// @brief Scripted player that walks the A* route to the goal.

#include <cstdint>

#include "nexus/game/simulation.hpp"

namespace nexus::headless {

/// Produces an ActionSet per frame that steers the player along the
/// shortest path from its current cell to the goal cell. The route is
/// recomputed every @c kRepathFrames frames and whenever it runs out.
class Autopilot {
public:
    explicit Autopilot(nexus::game::Simulation& simulation) : simulation_(simulation) {}

    [[nodiscard]] nexus::game::ActionSet NextActions();

private:
    static constexpr uint32_t kRepathFrames = 30;
    static constexpr float kWaypointReach = 0.6f;
    static constexpr float kDeadZone = 0.2f;

    void repath();

    nexus::game::Simulation& simulation_;
    nexus::game::GridPath route_;
    std::size_t next_ = 0;
    uint32_t frames_ = 0;
};

} // namespace nexus::headless
