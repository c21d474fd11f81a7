#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "nexus/game/ai_system.hpp"
#include "nexus/game/movement_system.hpp"
#include "test_world.hpp"

using namespace nexus::game;
using namespace nexus::game::testing;

class AISystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        world = MakeArena(41);
        ai = std::make_unique<AISystem>(*world);
        world->events.connect([this](const GameEvent& e) {
            if (e.type == GameEventType::EnemyAlert) {
                ++alerts;
            }
        });
        home = world->mapping.GridToWorld({20, 20}, 1.0f);
    }

    /// Put the player @p distance units east of the enemy spawn.
    void playerAtDistance(float distance) {
        world->PlayerPosition()->Assign(home + Vector3{distance, 0.0f, 0.0f});
    }

    AIState stateOf(nexus::ecs::Entity enemy) {
        auto* context = world->aiContexts.FindByEntity(enemy);
        EXPECT_NE(context, nullptr);
        return context != nullptr ? context->state : AIState::Patrol;
    }

    std::unique_ptr<GameWorld> world;
    std::unique_ptr<AISystem> ai;
    Vector3 home;
    int alerts = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// State transitions
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AISystemTest, ChaserSwitchesWithHysteresis) {
    auto enemy = SpawnEnemy(*world, home, EnemyType::Chaser);

    playerAtDistance(30.0f);
    ai->Execute(0.016f);
    EXPECT_EQ(stateOf(enemy), AIState::Patrol);
    EXPECT_EQ(world->aiContexts.ActiveCount(), 1u);

    // Enemy stays put: no movement system runs in this test.
    world->registry.Find(world->kinds.position, enemy)->Assign(home);
    playerAtDistance(9.0f);
    ai->Execute(0.016f);
    EXPECT_EQ(stateOf(enemy), AIState::Chase);
    EXPECT_EQ(alerts, 1);

    world->registry.Find(world->kinds.position, enemy)->Assign(home);
    playerAtDistance(12.0f);
    ai->Execute(0.016f);
    EXPECT_EQ(stateOf(enemy), AIState::Chase);

    world->registry.Find(world->kinds.position, enemy)->Assign(home);
    playerAtDistance(16.0f);
    ai->Execute(0.016f);
    EXPECT_EQ(stateOf(enemy), AIState::Patrol);

    world->registry.Find(world->kinds.position, enemy)->Assign(home);
    playerAtDistance(12.0f);
    ai->Execute(0.016f);
    EXPECT_EQ(stateOf(enemy), AIState::Patrol);
    EXPECT_EQ(alerts, 1);
}

TEST_F(AISystemTest, PatrolEnemyNeverChases) {
    auto enemy = SpawnEnemy(*world, home, EnemyType::Patrol);
    playerAtDistance(2.0f);

    for (int i = 0; i < 10; ++i) {
        ai->Execute(0.016f);
        EXPECT_EQ(stateOf(enemy), AIState::Patrol);
    }
    EXPECT_EQ(alerts, 0);
}

TEST_F(AISystemTest, ChaserSteersTowardPlayer) {
    auto enemy = SpawnEnemy(*world, home, EnemyType::Chaser);
    playerAtDistance(5.0f);

    ai->Execute(0.016f);  // context created, switches to Chase
    ai->Execute(0.016f);  // first chase tick

    const auto* velocity = world->registry.Find(world->kinds.velocity, enemy);
    ASSERT_NE(velocity, nullptr);
    const float chaseSpeed = 2.0f * world->config.chaserSpeedMultiplier;
    EXPECT_NEAR(velocity->x, chaseSpeed, 1e-4f);
    EXPECT_NEAR(velocity->z, 0.0f, 1e-4f);

    // AI never moves the player.
    EXPECT_FLOAT_EQ(world->PlayerVelocity()->x, 0.0f);
}

TEST_F(AISystemTest, ChaserRepathsOnInterval) {
    auto enemy = SpawnEnemy(*world, home, EnemyType::Chaser);
    playerAtDistance(7.5f);
    auto* aiData = world->registry.Find(world->kinds.ai, enemy);
    ASSERT_NE(aiData, nullptr);

    for (uint32_t i = 0; i < world->config.aiRepathInterval; ++i) {
        world->registry.Find(world->kinds.position, enemy)->Assign(home);
        ai->Execute(0.016f);
    }
    EXPECT_EQ(aiData->timer, world->config.aiRepathInterval);
    // Three cells east: path from the enemy cell to the player cell.
    ASSERT_FALSE(aiData->path.empty());
    EXPECT_EQ(aiData->path.front(), (GridCell{20, 20}));
    EXPECT_EQ(aiData->path.back(), (GridCell{23, 20}));
}

TEST_F(AISystemTest, PatrolEnemyWalksOutOfWallCell) {
    // Knocked 0.9 units into the border wall (0,5).
    auto enemy = SpawnEnemy(*world, world->mapping.GridToWorld({0, 5}, 1.0f) +
                                        Vector3{0.9f, 0.0f, 0.0f});
    playerAtDistance(30.0f);
    MovementSystem movement(*world);

    ai->Execute(0.016f);
    const auto* aiData = world->registry.Find(world->kinds.ai, enemy);
    ASSERT_NE(aiData, nullptr);
    ASSERT_FALSE(aiData->path.empty());
    EXPECT_EQ(aiData->path.front(), (GridCell{1, 5}));

    for (int i = 0; i < 600; ++i) {
        movement.Execute(0.016f);
        ai->Execute(0.016f);
    }

    const auto cell = world->mapping.WorldToGrid(
        world->registry.Find(world->kinds.position, enemy)->ToVector());
    EXPECT_TRUE(world->maze.IsOpen(cell));
}

TEST_F(AISystemTest, EnclosedWallCellFallsBackToDiagonalNeighbour) {
    // Seal (20,20) and its four edge neighbours; diagonals stay open.
    for (GridCell wall : {GridCell{20, 20}, GridCell{21, 20}, GridCell{19, 20}, GridCell{20, 21},
                          GridCell{20, 19}}) {
        world->maze.Set(wall, CellType::Wall);
    }
    auto enemy = SpawnEnemy(*world, home + Vector3{0.5f, 0.0f, 0.5f});
    playerAtDistance(30.0f);

    ai->Execute(0.016f);

    const auto* aiData = world->registry.Find(world->kinds.ai, enemy);
    ASSERT_NE(aiData, nullptr);
    ASSERT_FALSE(aiData->path.empty());
    EXPECT_EQ(aiData->path.front(), (GridCell{21, 21}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Context lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AISystemTest, RecreatesContextAfterArenaClear) {
    auto enemy = SpawnEnemy(*world, home, EnemyType::Chaser);
    playerAtDistance(5.0f);
    ai->Execute(0.016f);
    EXPECT_EQ(stateOf(enemy), AIState::Chase);

    world->aiContexts.Clear();
    playerAtDistance(30.0f);
    ai->Execute(0.016f);

    EXPECT_EQ(world->aiContexts.ActiveCount(), 1u);
    EXPECT_EQ(stateOf(enemy), AIState::Patrol);
}

TEST_F(AISystemTest, SkipsWithoutPlayer) {
    SpawnEnemy(*world, home);
    world->registry.DestroyEntity(world->player.entity);

    ai->Execute(0.016f);

    EXPECT_EQ(ai->GetLastTickUpdateCount(), 0u);
    EXPECT_EQ(world->aiContexts.ActiveCount(), 0u);
}

TEST_F(AISystemTest, TicksEveryEnemy) {
    for (int i = 0; i < 4; ++i) {
        SpawnEnemy(*world, world->mapping.GridToWorld({5 + i * 2, 5}, 1.0f));
    }
    playerAtDistance(30.0f);

    ai->Execute(0.016f);

    EXPECT_EQ(ai->GetLastTickUpdateCount(), 4u);
    EXPECT_EQ(world->aiContexts.ActiveCount(), 4u);
}
