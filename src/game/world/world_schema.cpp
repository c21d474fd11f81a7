/// @file world_schema.cpp
/// @brief Component kind and query definitions.

#include "nexus/game/world_schema.hpp"

namespace nexus::game {

ComponentKinds DefineComponentKinds(ecs::Registry& registry) {
    ComponentKinds kinds;
    kinds.position = registry.DefineComponentKind<Position>();
    kinds.velocity = registry.DefineComponentKind<Velocity>();
    kinds.player = registry.DefineComponentKind<Player>();
    kinds.wall = registry.DefineComponentKind<Wall>();
    kinds.goal = registry.DefineComponentKind<Goal>();
    kinds.collectible = registry.DefineComponentKind<Collectible>();
    kinds.powerUp = registry.DefineComponentKind<PowerUp>();
    kinds.enemy = registry.DefineComponentKind<Enemy>();
    kinds.ai = registry.DefineComponentKind<AI>();
    kinds.particle = registry.DefineComponentKind<Particle>();
    kinds.trail = registry.DefineComponentKind<Trail>();
    kinds.trailPoints = registry.DefineComponentKind<TrailPoints>();
    kinds.animation = registry.DefineComponentKind<Animation>();
    kinds.effectTimer = registry.DefineComponentKind<EffectTimer>();
    kinds.speedBoost = registry.DefineComponentKind<SpeedBoost>();
    kinds.shield = registry.DefineComponentKind<InvulnerabilityShield>();
    kinds.scoreMultiplier = registry.DefineComponentKind<ScoreMultiplier>();
    return kinds;
}

WorldQueries DefineWorldQueries(ecs::Registry& registry, const ComponentKinds& kinds) {
    WorldQueries queries;
    queries.player = registry.DefineQuery(kinds.player, kinds.position, kinds.velocity);
    queries.moving = registry.DefineQuery(kinds.position, kinds.velocity);
    queries.walls = registry.DefineQuery(kinds.wall, kinds.position);
    queries.collectibles = registry.DefineQuery(kinds.collectible, kinds.position);
    queries.goals = registry.DefineQuery(kinds.goal, kinds.position);
    queries.enemies = registry.DefineQuery(kinds.enemy, kinds.position, kinds.velocity);
    queries.powerUps = registry.DefineQuery(kinds.powerUp, kinds.position);
    queries.particles = registry.DefineQuery(kinds.particle, kinds.position, kinds.velocity);
    queries.timers = registry.DefineQuery(kinds.effectTimer);
    queries.enemyAI = registry.DefineQuery(kinds.ai, kinds.enemy, kinds.position, kinds.velocity);
    queries.trails = registry.DefineQuery(kinds.trail, kinds.trailPoints);
    queries.animated = registry.DefineQuery(kinds.position, kinds.animation);
    return queries;
}

} // namespace nexus::game
