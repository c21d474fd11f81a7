/// @file behavior_controller.cpp
/// @brief Patrol and Chase state logic.

#include "nexus/game/behavior_controller.hpp"

#include "nexus/foundation/game_logger.hpp"
#include "nexus/game/pathfinder.hpp"

#include <array>
#include <optional>
#include <string>

namespace nexus::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

void BehaviorController::Enter(AIContext& context, AgentView& agent, AIState state) {
    if (context.state != state) {
        auto& logger = foundation::GameLogger::instance();
        if (logger.isEnabled(LogLevel::Debug, LogCategory::AI)) {
            LogContext ctx;
            ctx.entityId = agent.entity.id();
            ctx.extra["from"] = std::string(aiStateName(context.state));
            ctx.extra["to"] = std::string(aiStateName(state));
            logger.logWithContext(LogLevel::Debug, LogCategory::AI, "Enemy state changed", ctx);
        }
    }
    context.state = state;
    context.stateTicks = 0;
    if (state == AIState::Patrol) {
        enterPatrol(agent);
    } else {
        enterChase(agent);
    }
}

void BehaviorController::Tick(AIContext& context, AgentView& agent, const Vector3& playerPosition) {
    ++context.stateTicks;
    if (context.state == AIState::Patrol) {
        updatePatrol(context, agent, playerPosition);
    } else {
        updateChase(context, agent, playerPosition);
    }
}

// ── Patrol ──────────────────────────────────────────────────────────────

void BehaviorController::enterPatrol(AgentView& agent) {
    agent.ai.path.clear();
    agent.ai.pathIndex = 0;
    pickPatrolDestination(agent);
}

void BehaviorController::updatePatrol(AIContext& context, AgentView& agent,
                                      const Vector3& playerPosition) {
    const Vector3 here = agent.position.ToVector();
    const float distanceToPlayer = HorizontalDistance(playerPosition, here);
    if (agent.enemy.type == EnemyType::Chaser && distanceToPlayer < env_.config.aiChaseRadius) {
        Enter(context, agent, AIState::Chase);
        return;
    }

    auto& ai = agent.ai;
    if (ai.pathIndex >= ai.path.size()) {
        pickPatrolDestination(agent);
        if (ai.path.empty()) {
            return;
        }
    }

    const Vector3 waypoint = env_.mapping.GridToWorld(ai.path[ai.pathIndex]);
    const float distanceToWaypoint = HorizontalDistance(waypoint, here);
    if (distanceToWaypoint < env_.config.waypointReachDistance) {
        ++ai.pathIndex;
        if (ai.pathIndex >= ai.path.size()) {
            pickPatrolDestination(agent);
        }
        return;
    }

    steerToward(agent, waypoint, distanceToWaypoint, agent.enemy.speed);
}

void BehaviorController::pickPatrolDestination(AgentView& agent) {
    auto& ai = agent.ai;
    ai.path.clear();
    ai.pathIndex = 0;

    const auto& openCells = env_.maze.OpenCells();
    if (openCells.empty()) {
        return;
    }
    const GridCell destination = openCells[RandomIndex(env_.rng, openCells.size())];

    auto path = Pathfinder::FindPath(env_.maze, pathStart(agent), destination);
    if (path) {
        ai.path = std::move(path).value();
    }
}

// ── Chase ───────────────────────────────────────────────────────────────

void BehaviorController::enterChase(AgentView& agent) {
    env_.events.emit(GameEvent{GameEventType::EnemyAlert, agent.entity,
                               agent.position.ToVector(), 0.0f});
    agent.ai.path.clear();
    agent.ai.pathIndex = 0;
}

void BehaviorController::updateChase(AIContext& context, AgentView& agent,
                                     const Vector3& playerPosition) {
    const Vector3 here = agent.position.ToVector();
    const float distanceToPlayer = HorizontalDistance(playerPosition, here);
    if (distanceToPlayer > env_.config.aiPatrolRadius) {
        Enter(context, agent, AIState::Patrol);
        return;
    }

    auto& ai = agent.ai;
    if (ai.timer % env_.config.aiRepathInterval == 0) {
        auto path = Pathfinder::FindPath(env_.maze, pathStart(agent),
                                         env_.mapping.WorldToGrid(playerPosition));
        ai.path = path ? std::move(path).value() : GridPath{};
        ai.pathIndex = 0;
    }

    const float chaseSpeed = agent.enemy.speed * env_.config.chaserSpeedMultiplier;

    if (ai.pathIndex < ai.path.size()) {
        const Vector3 waypoint = env_.mapping.GridToWorld(ai.path[ai.pathIndex]);
        const float distanceToWaypoint = HorizontalDistance(waypoint, here);
        if (distanceToWaypoint < env_.config.waypointReachDistance) {
            ++ai.pathIndex;
            if (ai.pathIndex >= ai.path.size()) {
                ai.path.clear();
                ai.pathIndex = 0;
            }
            return;
        }
        steerToward(agent, waypoint, distanceToWaypoint, chaseSpeed);
        return;
    }

    steerToward(agent, playerPosition, distanceToPlayer, chaseSpeed);
}

GridCell BehaviorController::pathStart(const AgentView& agent) const {
    const Vector3 here = agent.position.ToVector();
    const GridCell cell = env_.mapping.WorldToGrid(here);
    if (env_.maze.IsOpen(cell)) {
        return cell;
    }

    // Knockback or direct steering left the agent inside a wall: start from
    // the closest open neighbour, edge neighbours before diagonal ones.
    static constexpr std::array<GridCell, 8> kNeighbours = {{
        {1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {-1, 1}, {1, -1}, {-1, -1},
    }};
    std::optional<GridCell> best;
    float bestDistance = 0.0f;
    for (std::size_t i = 0; i < kNeighbours.size(); ++i) {
        if (i == 4 && best) {
            break;
        }
        const GridCell candidate{cell.x + kNeighbours[i].x, cell.z + kNeighbours[i].z};
        if (!env_.maze.IsOpen(candidate)) {
            continue;
        }
        const float distance = HorizontalDistance(env_.mapping.GridToWorld(candidate), here);
        if (!best || distance < bestDistance) {
            best = candidate;
            bestDistance = distance;
        }
    }
    return best.value_or(cell);
}

void BehaviorController::steerToward(AgentView& agent, const Vector3& target, float distance,
                                     float speed) {
    if (distance <= 1e-6f) {
        return;
    }
    agent.velocity.x = (target.x - agent.position.x) / distance * speed;
    agent.velocity.z = (target.z - agent.position.z) / distance * speed;
}

} // namespace nexus::game
