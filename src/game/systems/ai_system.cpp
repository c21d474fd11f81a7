/// @file ai_system.cpp
/// @brief AISystem implementation.

#include "nexus/game/ai_system.hpp"

namespace nexus::game {

AISystem::AISystem(GameWorld& world)
    : world_(world),
      controller_(BehaviorEnvironment{world.maze, world.mapping, world.config, world.rng,
                                      world.events}) {}

void AISystem::Execute(float /*deltaTime*/) {
    lastTickUpdateCount_ = 0;

    const auto* playerPosition = world_.PlayerPosition();
    if (playerPosition == nullptr) {
        return;
    }
    const Vector3 target = playerPosition->ToVector();

    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;

    for (auto entity : registry.Resolve(world_.queries.enemyAI)) {
        auto* ai = registry.Find(kinds.ai, entity);
        auto* position = registry.Find(kinds.position, entity);
        auto* velocity = registry.Find(kinds.velocity, entity);
        const auto* enemy = registry.Find(kinds.enemy, entity);
        if (ai == nullptr || position == nullptr || velocity == nullptr || enemy == nullptr) {
            continue;
        }

        ++ai->timer;
        AgentView agent{entity, *position, *velocity, *enemy, *ai};

        auto* context = world_.aiContexts.Get(ai->behaviorHandle);
        if (context == nullptr || context->entity != entity) {
            ai->behaviorHandle = world_.aiContexts.Create(entity);
            context = world_.aiContexts.Get(ai->behaviorHandle);
            controller_.Enter(*context, agent, AIState::Patrol);
        }

        controller_.Tick(*context, agent, target);
        ++lastTickUpdateCount_;
    }
}

} // namespace nexus::game
