#pragma once

/// @file world_schema.hpp
/// @brief Component kinds and cached queries of the maze world.

#include "nexus/ecs/component_kind.hpp"
#include "nexus/ecs/query.hpp"
#include "nexus/ecs/registry.hpp"
#include "nexus/game/components.hpp"

namespace nexus::game {

/// Every component kind the simulation defines, in definition order.
struct ComponentKinds {
    ecs::ComponentKind<Position> position;
    ecs::ComponentKind<Velocity> velocity;
    ecs::ComponentKind<Player> player;
    ecs::ComponentKind<Wall> wall;
    ecs::ComponentKind<Goal> goal;
    ecs::ComponentKind<Collectible> collectible;
    ecs::ComponentKind<PowerUp> powerUp;
    ecs::ComponentKind<Enemy> enemy;
    ecs::ComponentKind<AI> ai;
    ecs::ComponentKind<Particle> particle;
    ecs::ComponentKind<Trail> trail;
    ecs::ComponentKind<TrailPoints> trailPoints;
    ecs::ComponentKind<Animation> animation;
    ecs::ComponentKind<EffectTimer> effectTimer;
    ecs::ComponentKind<SpeedBoost> speedBoost;
    ecs::ComponentKind<InvulnerabilityShield> shield;
    ecs::ComponentKind<ScoreMultiplier> scoreMultiplier;
};

struct WorldQueries {
    ecs::QueryHandle player;        ///< Player, Position, Velocity
    ecs::QueryHandle moving;        ///< Position, Velocity
    ecs::QueryHandle walls;         ///< Wall, Position
    ecs::QueryHandle collectibles;  ///< Collectible, Position
    ecs::QueryHandle goals;         ///< Goal, Position
    ecs::QueryHandle enemies;       ///< Enemy, Position, Velocity
    ecs::QueryHandle powerUps;      ///< PowerUp, Position
    ecs::QueryHandle particles;     ///< Particle, Position, Velocity
    ecs::QueryHandle timers;        ///< EffectTimer
    ecs::QueryHandle enemyAI;       ///< AI, Enemy, Position, Velocity
    ecs::QueryHandle trails;        ///< Trail, TrailPoints
    ecs::QueryHandle animated;      ///< Position, Animation
};

/// Define all component kinds on a fresh registry.
ComponentKinds DefineComponentKinds(ecs::Registry& registry);

/// Define all cached queries over @p kinds.
WorldQueries DefineWorldQueries(ecs::Registry& registry, const ComponentKinds& kinds);

} // namespace nexus::game
