#pragma once

/// @file level_manager.hpp
/// @brief Level lifecycle: teardown, maze generation and population.

#include <cstdint>

#include "nexus/foundation/game_result.hpp"
#include "nexus/game/game_world.hpp"
#include "nexus/game/scheduled_work.hpp"

namespace nexus::game {

/// Builds and rebuilds levels inside a GameWorld.
///
/// CreateLevel() tears down everything of the previous level except the
/// pooled particles, generates a maze sized for the current level and
/// populates it. A failed generation leaves the world untouched beyond
/// the teardown and reports InvalidConfiguration.
class LevelManager {
public:
    explicit LevelManager(GameWorld& world) : world_(world) {}

    LevelManager(const LevelManager&) = delete;
    LevelManager& operator=(const LevelManager&) = delete;

    /// Build the level for GameState::Level().
    foundation::GameResult<void> CreateLevel();

    /// Queue CreateLevel() after the transition delay. A pending
    /// transition is replaced.
    void ScheduleNextLevel();

    /// Body of the scheduled transition; a failure is logged and leaves
    /// the phase at Loading.
    void AdvanceToNextLevel();

    /// Rebuild the current level at a score penalty (never below zero).
    foundation::GameResult<void> RestartLevel();

    /// Fresh game from level 1: HUD reset, all pending work dropped.
    foundation::GameResult<void> RestartGame(int64_t nowMs);

    [[nodiscard]] bool TransitionPending() const noexcept;

private:
    void teardown();
    void populate(int32_t size);

    void spawnPlayer();
    void spawnWalls();
    void spawnGoal(int32_t size);
    void spawnEnemies(std::vector<GridCell>& pool);
    void spawnPowerUps(std::vector<GridCell>& pool);
    void spawnCollectibles(std::vector<GridCell>& pool, int32_t size);

    /// Take a random cell out of @p pool; false when it is empty.
    bool takeCell(std::vector<GridCell>& pool, GridCell& cell);

    void cancelTransition();

    GameWorld& world_;
    WorkId transition_ = 0;
};

} // namespace nexus::game
