#pragma once

/// @file behavior_controller.hpp
/// @brief Patrol/Chase state machine driving enemy velocities.

#include "nexus/game/ai_types.hpp"
#include "nexus/game/components.hpp"
#include "nexus/game/game_config.hpp"
#include "nexus/game/game_events.hpp"
#include "nexus/game/maze_grid.hpp"
#include "nexus/game/random.hpp"

namespace nexus::game {

/// Component references of one enemy, resolved for a single tick.
struct AgentView {
    ecs::Entity entity;
    Position& position;
    Velocity& velocity;
    const Enemy& enemy;
    AI& ai;
};

/// Read-mostly collaborators of the controller.
struct BehaviorEnvironment {
    const MazeGrid& maze;
    const GridMapping& mapping;
    const GameConfig& config;
    RandomEngine& rng;
    const GameEventBus& events;
};

/// Two-state enemy behavior.
///
/// Patrol wanders along A* paths to random open cells; chasers switch to
/// Chase when the player comes within the chase radius and fall back to
/// Patrol only beyond the (larger) patrol radius, so the switch has
/// hysteresis. A tick writes only the agent's velocity and AI data.
class BehaviorController {
public:
    explicit BehaviorController(BehaviorEnvironment env) : env_(env) {}

    /// Switch @p context to @p state and run that state's entry action.
    void Enter(AIContext& context, AgentView& agent, AIState state);

    /// Advance one tick toward/away from @p playerPosition.
    void Tick(AIContext& context, AgentView& agent, const Vector3& playerPosition);

private:
    void enterPatrol(AgentView& agent);
    void updatePatrol(AIContext& context, AgentView& agent, const Vector3& playerPosition);
    void enterChase(AgentView& agent);
    void updateChase(AIContext& context, AgentView& agent, const Vector3& playerPosition);

    /// Path from the agent's cell to a random open cell (may be empty).
    void pickPatrolDestination(AgentView& agent);

    /// Agent's cell, or its nearest open neighbour when that cell is a wall.
    [[nodiscard]] GridCell pathStart(const AgentView& agent) const;

    /// Set xz velocity toward @p target at @p speed; y is left alone.
    static void steerToward(AgentView& agent, const Vector3& target, float distance, float speed);

    BehaviorEnvironment env_;
};

} // namespace nexus::game
