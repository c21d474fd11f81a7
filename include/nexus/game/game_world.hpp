#pragma once

/// @file game_world.hpp
/// @brief Shared state of one running game, handed to every system.

#include <cstdint>

#include "nexus/ecs/registry.hpp"
#include "nexus/game/ai_types.hpp"
#include "nexus/game/game_config.hpp"
#include "nexus/game/game_events.hpp"
#include "nexus/game/game_state.hpp"
#include "nexus/game/game_types.hpp"
#include "nexus/game/maze_grid.hpp"
#include "nexus/game/particle_pool.hpp"
#include "nexus/game/random.hpp"
#include "nexus/game/scheduled_work.hpp"
#include "nexus/game/world_schema.hpp"

namespace nexus::game {

/// Per-frame inputs as seen by the systems.
struct FrameContext {
    float deltaTime = 0.0f;
    int64_t nowMs = 0;
    ActionSet actions;
    ActionSet previousActions;
    Vector3 cameraForward{0.0f, 0.0f, -1.0f};
};

/// Player bookkeeping that is not component data.
struct PlayerControl {
    ecs::Entity entity;
    bool jumpReady = true;
    bool boosting = false;
    uint32_t moveTimer = 0;
};

/// Everything the pipeline systems share.
///
/// Members are declared in dependency order: the particle pool refers to
/// the registry, kinds, config and RNG declared before it.
class GameWorld {
public:
    GameWorld(const GameConfig& config, uint32_t seed);

    GameWorld(const GameWorld&) = delete;
    GameWorld& operator=(const GameWorld&) = delete;

    GameConfig config;
    RandomEngine rng;
    ecs::Registry registry;
    ComponentKinds kinds;
    WorldQueries queries;

    MazeGrid maze;
    GridMapping mapping;
    ExplorationMap exploration;

    GameState state;
    GameEventBus events;
    ScheduledWorkQueue scheduled;
    AIContextArena aiContexts;
    ParticlePool particles;

    FrameContext frame;
    PlayerControl player;
    CameraMode cameraMode = CameraMode::ThirdPerson;
    bool muted = false;
    int64_t levelStartMs = 0;
    int64_t gameStartMs = 0;

    /// Emit a presentation event.
    void Emit(GameEventType type, ecs::Entity source = ecs::Entity::invalid(),
              const Vector3& position = {}, float intensity = 0.0f) const;

    void RequestScreenShake(float intensity) const;

    /// Active score multiplier of the player (1 without the effect).
    [[nodiscard]] int32_t PlayerMultiplier() const;

    /// Spawn an EffectTimer that strips @p kind from @p target after
    /// @p durationMs.
    ecs::Entity AddEffectTimer(ecs::Entity target, ecs::ComponentKindId kind, int64_t durationMs);

    /// Player position, or nullptr when there is no live player.
    [[nodiscard]] Position* PlayerPosition();
    [[nodiscard]] Velocity* PlayerVelocity();
};

} // namespace nexus::game
