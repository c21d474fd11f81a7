/// @file autopilot.cpp
/// @brief Autopilot implementation.

#include "autopilot.hpp"

#include "nexus/foundation/game_logger.hpp"

namespace nexus::headless {

using nexus::game::Action;
using nexus::game::ActionSet;
using nexus::game::GridCell;

void Autopilot::repath() {
    route_.clear();
    next_ = 0;

    auto& world = simulation_.World();
    const auto* position = world.PlayerPosition();
    if (position == nullptr) {
        return;
    }
    const GridCell start = simulation_.WorldToGrid(position->ToVector());
    const GridCell goal{world.mapping.width - 2, world.mapping.height - 2};

    auto path = simulation_.FindPath(start, goal);
    if (!path) {
        NEXUS_LOG_DEBUG(nexus::foundation::LogCategory::Pathfinding,
                        "Autopilot has no route: " + path.error().describe());
        return;
    }
    route_ = std::move(path).value();
    next_ = route_.size() > 1 ? 1 : 0;
}

ActionSet Autopilot::NextActions() {
    ActionSet actions;
    if (simulation_.Phase() != nexus::game::GamePhase::Playing) {
        route_.clear();
        return actions;
    }

    if (frames_++ % kRepathFrames == 0 || next_ >= route_.size()) {
        repath();
    }
    const auto* position = simulation_.World().PlayerPosition();
    if (position == nullptr || next_ >= route_.size()) {
        return actions;
    }

    auto waypoint = simulation_.GridToWorld(route_[next_]);
    if (nexus::game::HorizontalDistance(waypoint, position->ToVector()) < kWaypointReach &&
        next_ + 1 < route_.size()) {
        waypoint = simulation_.GridToWorld(route_[++next_]);
    }

    // Third-person camera looking down -z: forward is -z, right is +x.
    const float dx = waypoint.x - position->x;
    const float dz = waypoint.z - position->z;
    if (dx > kDeadZone) {
        actions.Set(Action::MoveRight);
    } else if (dx < -kDeadZone) {
        actions.Set(Action::MoveLeft);
    }
    if (dz < -kDeadZone) {
        actions.Set(Action::MoveForward);
    } else if (dz > kDeadZone) {
        actions.Set(Action::MoveBack);
    }
    return actions;
}

} // namespace nexus::headless
