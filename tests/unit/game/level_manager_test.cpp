#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "nexus/game/input_system.hpp"
#include "nexus/game/level_manager.hpp"

using namespace nexus::game;

class LevelManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        world = std::make_unique<GameWorld>(GameConfig{}, 1234);
        levels = std::make_unique<LevelManager>(*world);
        world->frame.nowMs = 5'000;
    }

    std::size_t count(nexus::ecs::QueryHandle query) const {
        return world->registry.Resolve(query).size();
    }

    std::unique_ptr<GameWorld> world;
    std::unique_ptr<LevelManager> levels;
};

// ═══════════════════════════════════════════════════════════════════════════
// Creation
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(LevelManagerTest, FirstLevelIsPopulated) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());

    EXPECT_EQ(world->state.Phase(), GamePhase::Playing);
    EXPECT_EQ(world->maze.Width(), 31);
    EXPECT_EQ(world->mapping.width, 31);
    EXPECT_EQ(count(world->queries.player), 1u);
    EXPECT_EQ(count(world->queries.goals), 1u);
    EXPECT_EQ(count(world->queries.walls), world->maze.CountCells(CellType::Wall));
    EXPECT_EQ(count(world->queries.collectibles), 37u);  // floor(31 * 1.2)
    EXPECT_EQ(count(world->queries.powerUps), 1u);       // floor(1 * 0.8 + 1)
    EXPECT_LE(count(world->queries.enemies), 3u);        // floor(1 * 1.5 + 2)
    EXPECT_EQ(count(world->queries.trails), 1u);
    EXPECT_EQ(world->particles.Capacity(), world->config.particlePoolSize);
}

TEST_F(LevelManagerTest, PlayerAndGoalAtOppositeCorners) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());

    const auto* player = world->PlayerPosition();
    ASSERT_NE(player, nullptr);
    EXPECT_EQ(world->mapping.WorldToGrid(player->ToVector()), (GridCell{1, 1}));
    EXPECT_FLOAT_EQ(player->y, world->config.playerSpawnHeight);

    const auto goal = world->registry.Resolve(world->queries.goals).front();
    const auto* goalPosition = world->registry.Find(world->kinds.position, goal);
    EXPECT_EQ(world->mapping.WorldToGrid(goalPosition->ToVector()), (GridCell{29, 29}));
}

TEST_F(LevelManagerTest, SpawnsStayOffStartGoalAndWalls) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    const GridCell goalCell{29, 29};

    for (auto query : {world->queries.enemies, world->queries.collectibles,
                       world->queries.powerUps}) {
        for (auto entity : world->registry.Resolve(query)) {
            const auto* position = world->registry.Find(world->kinds.position, entity);
            const auto cell = world->mapping.WorldToGrid(position->ToVector());
            EXPECT_TRUE(world->maze.IsOpen(cell));
            EXPECT_NE(cell, (GridCell{1, 1}));
            EXPECT_NE(cell, goalCell);
        }
    }
    for (auto entity : world->registry.Resolve(world->queries.enemies)) {
        const auto cell = world->mapping.WorldToGrid(
            world->registry.Find(world->kinds.position, entity)->ToVector());
        EXPECT_FALSE(std::abs(cell.x - 1) < 5 && std::abs(cell.z - 1) < 5);
    }
}

TEST_F(LevelManagerTest, RebuildKeepsParticlesAndDropsTheRest) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    world->particles.Burst({}, 0xffffff, 10);
    const auto particleEntities = count(world->queries.particles);
    const auto oldPlayer = world->player.entity;
    world->aiContexts.Create(oldPlayer);

    ASSERT_TRUE(levels->CreateLevel().hasValue());

    EXPECT_EQ(count(world->queries.particles), particleEntities);
    EXPECT_EQ(world->particles.Available(), world->particles.Capacity());
    EXPECT_FALSE(world->registry.EntityExists(oldPlayer));
    EXPECT_EQ(count(world->queries.player), 1u);
    EXPECT_EQ(world->aiContexts.ActiveCount(), 0u);
}

TEST_F(LevelManagerTest, MazeGrowsEveryTwoLevels) {
    world->state.SetLevel(4);
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    EXPECT_EQ(world->maze.Width(), 39);
    EXPECT_EQ(count(world->queries.collectibles), 46u);  // floor(39 * 1.2)
}

TEST_F(LevelManagerTest, InvalidSizeReportsError) {
    world->config.initialMazeSize = 30;
    auto result = levels->CreateLevel();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), nexus::foundation::ErrorCode::InvalidConfiguration);
    EXPECT_EQ(world->state.Phase(), GamePhase::Loading);
}

// ═══════════════════════════════════════════════════════════════════════════
// Transitions and restarts
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(LevelManagerTest, ScheduledTransitionBuildsNextLevel) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    world->state.SetLevel(2);
    world->state.SetPhase(GamePhase::Transitioning);

    levels->ScheduleNextLevel();
    EXPECT_TRUE(levels->TransitionPending());

    world->scheduled.RunDue(world->frame.nowMs + 1999);
    EXPECT_EQ(world->state.Phase(), GamePhase::Transitioning);

    world->scheduled.RunDue(world->frame.nowMs + 2000);
    EXPECT_FALSE(levels->TransitionPending());
    EXPECT_EQ(world->state.Phase(), GamePhase::Playing);
    EXPECT_EQ(world->maze.Width(), 35);
}

TEST_F(LevelManagerTest, RestartLevelChargesPenalty) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    world->state.SetScore(120);
    ASSERT_TRUE(levels->RestartLevel().hasValue());
    EXPECT_EQ(world->state.Score(), 70);

    world->state.SetScore(30);
    ASSERT_TRUE(levels->RestartLevel().hasValue());
    EXPECT_EQ(world->state.Score(), 0);
}

TEST_F(LevelManagerTest, RestartLevelCancelsPendingTransition) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    levels->ScheduleNextLevel();

    ASSERT_TRUE(levels->RestartLevel().hasValue());

    EXPECT_FALSE(levels->TransitionPending());
    EXPECT_EQ(world->scheduled.Pending(), 0u);
}

TEST_F(LevelManagerTest, RestartLevelKeepsScoreWhenRebuildFails) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    world->state.SetScore(120);
    world->config.initialMazeSize = 30;

    EXPECT_TRUE(levels->RestartLevel().hasError());
    EXPECT_EQ(world->state.Score(), 120);
}

TEST_F(LevelManagerTest, NewLevelDropsPreviousDashCooldown) {
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    InputSystem input(*world);
    world->frame.actions = ActionSet({Action::Jump});
    input.Execute(0.016f);
    ASSERT_FALSE(world->player.jumpReady);
    ASSERT_EQ(world->scheduled.Pending(), 1u);
    const auto previousPlayer = world->player.entity;

    levels->AdvanceToNextLevel();

    EXPECT_NE(world->player.entity, previousPlayer);
    EXPECT_TRUE(world->player.jumpReady);
    EXPECT_EQ(world->scheduled.Pending(), 0u);
    EXPECT_EQ(world->scheduled.CancelOwner(previousPlayer), 0u);

    // The new player can dash at once; the old cooldown never fires.
    input.Execute(0.016f);
    EXPECT_FALSE(world->player.jumpReady);
    EXPECT_EQ(world->scheduled.Pending(), 1u);
}

TEST_F(LevelManagerTest, RestartGameResetsProgress) {
    world->state.SetLevel(7);
    world->state.SetScore(9000);
    world->state.SetHealth(10);
    ASSERT_TRUE(levels->CreateLevel().hasValue());
    world->scheduled.Schedule(99'999, nexus::ecs::Entity::invalid(), "stray", [] {});

    ASSERT_TRUE(levels->RestartGame(42'000).hasValue());

    EXPECT_EQ(world->state.Level(), 1u);
    EXPECT_EQ(world->state.Score(), 0);
    EXPECT_EQ(world->state.Health(), world->config.maxHealth);
    EXPECT_EQ(world->gameStartMs, 42'000);
    EXPECT_EQ(world->scheduled.Pending(), 0u);
    EXPECT_EQ(world->maze.Width(), 31);
}

TEST_F(LevelManagerTest, SameSeedSameLevel) {
    GameWorld other(GameConfig{}, 1234);
    LevelManager otherLevels(other);

    ASSERT_TRUE(levels->CreateLevel().hasValue());
    ASSERT_TRUE(otherLevels.CreateLevel().hasValue());

    EXPECT_EQ(world->maze.OpenCells(), other.maze.OpenCells());
    EXPECT_EQ(world->registry.EntityCount(), other.registry.EntityCount());
}
