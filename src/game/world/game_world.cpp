/// @file game_world.cpp
/// @brief GameWorld construction and shared helpers.

#include "nexus/game/game_world.hpp"

namespace nexus::game {

GameWorld::GameWorld(const GameConfig& cfg, uint32_t seed)
    : config(cfg),
      rng(seed),
      kinds(DefineComponentKinds(registry)),
      queries(DefineWorldQueries(registry, kinds)),
      state(cfg.maxHealth, cfg.maxEnergy),
      particles(registry, kinds, config, rng) {
    mapping.cellSize = config.cellSize;
}

void GameWorld::Emit(GameEventType type, ecs::Entity source, const Vector3& position,
                     float intensity) const {
    events.emit(GameEvent{type, source, position, intensity});
}

void GameWorld::RequestScreenShake(float intensity) const {
    Emit(GameEventType::ScreenShake, player.entity, {}, intensity);
}

int32_t GameWorld::PlayerMultiplier() const {
    if (const auto* multiplier = registry.Find(kinds.scoreMultiplier, player.entity)) {
        return multiplier->value;
    }
    return 1;
}

ecs::Entity GameWorld::AddEffectTimer(ecs::Entity target, ecs::ComponentKindId kind,
                                      int64_t durationMs) {
    auto timer = registry.CreateEntity();
    registry.AddComponent(kinds.effectTimer, timer,
                          EffectTimer{target, kind, frame.nowMs + durationMs});
    return timer;
}

Position* GameWorld::PlayerPosition() {
    return registry.Find(kinds.position, player.entity);
}

Velocity* GameWorld::PlayerVelocity() {
    return registry.Find(kinds.velocity, player.entity);
}

} // namespace nexus::game
