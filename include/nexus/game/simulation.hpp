#pragma once

/// @file simulation.hpp
/// @brief Public facade of the maze simulation.

#include <cstdint>
#include <memory>
#include <optional>

#include "nexus/ecs/registry.hpp"
#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/foundation/game_result.hpp"
#include "nexus/game/game_config.hpp"
#include "nexus/game/game_world.hpp"
#include "nexus/game/level_manager.hpp"
#include "nexus/game/pathfinder.hpp"

namespace nexus::game {

/// Input of one frame, as produced by the platform layer.
struct FrameInput {
    float deltaTime = 0.0f;  ///< seconds; clamped to GameConfig::maxFrameDelta
    int64_t nowMs = 0;       ///< wall clock, milliseconds
    ActionSet actions;
    std::optional<Vector3> cameraForward;
};

/// Read-only HUD view of the running game.
struct HudSnapshot {
    int64_t score = 0;
    int32_t health = 0;
    float energy = 0.0f;
    uint32_t level = 0;
    double elapsedSeconds = 0.0;
    GridCell playerCell;
    bool speedBoost = false;
    bool shield = false;
    bool multiplierActive = false;
    int32_t multiplier = 1;
    CameraMode cameraMode = CameraMode::ThirdPerson;
    std::size_t visitedCells = 0;
    GamePhase phase = GamePhase::Loading;
};

/// Owns the world, the system pipeline and the level lifecycle.
///
/// A frame (Step) runs, in order: due scheduled work, edge-triggered
/// commands (restart, camera, mute), the simulation stage while the phase
/// is Playing, and the presentation stage unconditionally.
class Simulation {
public:
    explicit Simulation(const GameConfig& config = GameConfig{}, uint32_t seed = 0);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Begin a new game at level 1.
    foundation::GameResult<void> Start(int64_t nowMs);

    void Step(const FrameInput& input);

    [[nodiscard]] HudSnapshot Hud() const;
    [[nodiscard]] GamePhase Phase() const noexcept { return world_->state.Phase(); }

    [[nodiscard]] ecs::Registry& Registry() noexcept { return world_->registry; }
    [[nodiscard]] const ComponentKinds& Kinds() const noexcept { return world_->kinds; }
    [[nodiscard]] const WorldQueries& Queries() const noexcept { return world_->queries; }

    [[nodiscard]] GameWorld& World() noexcept { return *world_; }
    [[nodiscard]] const GameWorld& World() const noexcept { return *world_; }
    [[nodiscard]] LevelManager& Levels() noexcept { return levels_; }

    /// A* over the current maze.
    [[nodiscard]] foundation::GameResult<GridPath> FindPath(GridCell start, GridCell goal) const;

    [[nodiscard]] Vector3 GridToWorld(GridCell cell) const noexcept;
    [[nodiscard]] GridCell WorldToGrid(const Vector3& point) const noexcept;

    [[nodiscard]] GameEventBus& Events() noexcept { return world_->events; }
    [[nodiscard]] GameState& State() noexcept { return world_->state; }

    [[nodiscard]] const ecs::SystemScheduler& Scheduler() const noexcept { return scheduler_; }

private:
    void buildPipeline();
    void handleCommands();

    std::unique_ptr<GameWorld> world_;
    LevelManager levels_;
    ecs::SystemScheduler scheduler_;
};

} // namespace nexus::game
