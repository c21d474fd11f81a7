#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "nexus/game/collision_system.hpp"
#include "nexus/game/level_manager.hpp"
#include "test_world.hpp"

using namespace nexus::game;
using namespace nexus::game::testing;

class CollisionSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        world = MakeArena();
        levels = std::make_unique<LevelManager>(*world);
        collision = std::make_unique<CollisionSystem>(*world, *levels);
        world->events.connect([this](const GameEvent& e) { events.push_back(e.type); });
    }

    Position& player() { return *world->PlayerPosition(); }
    Velocity& playerVelocity() { return *world->PlayerVelocity(); }
    Vector3 playerAt() { return player().ToVector(); }

    /// Deepest overlap between the player circle and any wall square.
    float worstPenetration() {
        const float radius = world->config.playerRadius;
        const float half = world->mapping.HalfCell();
        float worst = 0.0f;
        for (auto cell : wallCells()) {
            const auto w = world->mapping.GridToWorld(cell);
            const float cx = std::clamp(player().x, w.x - half, w.x + half);
            const float cz = std::clamp(player().z, w.z - half, w.z + half);
            worst = std::max(worst, radius - std::hypot(player().x - cx, player().z - cz));
        }
        return worst;
    }

    std::vector<GridCell> wallCells() const {
        std::vector<GridCell> walls;
        for (int32_t z = 0; z < world->maze.Height(); ++z) {
            for (int32_t x = 0; x < world->maze.Width(); ++x) {
                if (world->maze.IsWall({x, z})) {
                    walls.push_back({x, z});
                }
            }
        }
        return walls;
    }

    bool sawEvent(GameEventType type) const {
        for (auto e : events) {
            if (e == type) {
                return true;
            }
        }
        return false;
    }

    std::unique_ptr<GameWorld> world;
    std::unique_ptr<LevelManager> levels;
    std::unique_ptr<CollisionSystem> collision;
    std::vector<GameEventType> events;
};

// ═══════════════════════════════════════════════════════════════════════════
// Walls
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CollisionSystemTest, PushesPlayerOutOfWallAndBounces) {
    const auto wall = world->mapping.GridToWorld({0, 10});
    const float wallFace = wall.x + world->mapping.HalfCell();
    player().x = wallFace + 0.2f;
    player().z = wall.z;
    playerVelocity().x = -5.0f;

    collision->Execute(0.016f);

    EXPECT_NEAR(player().x, wallFace + world->config.playerRadius, 1e-4f);
    // -5 reflected with restitution 0.4.
    EXPECT_NEAR(playerVelocity().x, 2.0f, 1e-4f);
}

TEST_F(CollisionSystemTest, MovingAwayFromWallKeepsVelocity) {
    const auto wall = world->mapping.GridToWorld({0, 10});
    const float wallFace = wall.x + world->mapping.HalfCell();
    player().x = wallFace + 0.3f;
    player().z = wall.z;
    playerVelocity().x = 1.0f;

    collision->Execute(0.016f);

    EXPECT_NEAR(player().x, wallFace + world->config.playerRadius, 1e-4f);
    EXPECT_FLOAT_EQ(playerVelocity().x, 1.0f);
}

TEST_F(CollisionSystemTest, CentreInsideWallLeavesThroughNearestFace) {
    const auto wall = world->mapping.GridToWorld({0, 10});
    const float half = world->mapping.HalfCell();
    player().x = wall.x + half - 0.1f;
    player().z = wall.z;

    collision->Execute(0.016f);

    EXPECT_NEAR(player().x, wall.x + half + world->config.playerRadius, 1e-4f);
}

TEST_F(CollisionSystemTest, CentreInsideWallSkipsFacesBackedByWalls) {
    // (0,10) sits in the border column: its -z face leads into wall (0,9).
    const auto wall = world->mapping.GridToWorld({0, 10});
    const float half = world->mapping.HalfCell();
    player().x = wall.x + 0.6f;
    player().z = wall.z - 1.0f;

    collision->Execute(0.016f);

    EXPECT_NEAR(player().x, wall.x + half + world->config.playerRadius, 1e-4f);
    EXPECT_NEAR(player().z, wall.z - 1.0f, 1e-4f);
    EXPECT_LE(worstPenetration(), 1e-3f);
    EXPECT_TRUE(world->maze.IsOpen(world->mapping.WorldToGrid(playerAt())));
}

TEST_F(CollisionSystemTest, DeepEntryIntoBorderNeverLeavesPlayerInsideWall) {
    RandomEngine rng(29);
    const float half = world->mapping.HalfCell();
    for (int trial = 0; trial < 200; ++trial) {
        const GridCell border{0, 2 + static_cast<int32_t>(trial % 17)};
        const auto wall = world->mapping.GridToWorld(border);
        player().x = wall.x + RandomRange(rng, -half, half);
        player().z = wall.z + RandomRange(rng, -half, half);
        playerVelocity().Assign({RandomRange(rng, -10, 10), 0.0f, RandomRange(rng, -10, 10)});

        collision->Execute(0.016f);

        EXPECT_LE(worstPenetration(), 1e-3f) << "trial " << trial;
    }
}

TEST_F(CollisionSystemTest, PlayerNeverEndsInsideWallRadius) {
    RandomEngine rng(11);
    const float radius = world->config.playerRadius;
    const float half = world->mapping.HalfCell();
    for (int trial = 0; trial < 200; ++trial) {
        const auto centre = world->mapping.GridToWorld({1, 1});
        player().x = centre.x + RandomRange(rng, -half, half);
        player().z = centre.z + RandomRange(rng, -half, half);
        playerVelocity().Assign({RandomRange(rng, -10, 10), 0.0f, RandomRange(rng, -10, 10)});

        collision->Execute(0.016f);

        for (GridCell wall : {GridCell{0, 1}, GridCell{1, 0}}) {
            const auto w = world->mapping.GridToWorld(wall);
            const float cx = std::clamp(player().x, w.x - half, w.x + half);
            const float cz = std::clamp(player().z, w.z - half, w.z + half);
            const float d = std::hypot(player().x - cx, player().z - cz);
            EXPECT_GE(d, radius - 1e-3f);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Pickups
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CollisionSystemTest, CollectibleScoresByLevel) {
    world->state.SetLevel(3);
    world->state.SetEnergy(50.0f);
    auto item = SpawnAt(*world, playerAt() + Vector3{0.5f, 0.5f, 0.0f});
    world->registry.AddComponent(world->kinds.collectible, item);

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Score(), 75);
    EXPECT_FLOAT_EQ(world->state.Energy(), 60.0f);
    EXPECT_FALSE(world->registry.EntityExists(item));
    EXPECT_TRUE(sawEvent(GameEventType::Collect));
}

TEST_F(CollisionSystemTest, CollectibleHonoursMultiplier) {
    world->state.SetLevel(3);
    world->registry.AddComponent(world->kinds.scoreMultiplier, world->player.entity,
                                 ScoreMultiplier{3});
    auto item = SpawnAt(*world, playerAt());
    world->registry.AddComponent(world->kinds.collectible, item);

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Score(), 225);
}

TEST_F(CollisionSystemTest, DistantCollectibleIsIgnored) {
    auto item = SpawnAt(*world, playerAt() + Vector3{1.5f, 0.0f, 0.0f});
    world->registry.AddComponent(world->kinds.collectible, item);

    collision->Execute(0.016f);

    EXPECT_TRUE(world->registry.EntityExists(item));
    EXPECT_EQ(world->state.Score(), 0);
}

TEST_F(CollisionSystemTest, ShieldPowerUpAddsTimedEffect) {
    auto item = SpawnAt(*world, playerAt());
    world->registry.AddComponent(world->kinds.powerUp, item, PowerUp{PowerUpType::Shield});

    collision->Execute(0.016f);

    const auto playerEntity = world->player.entity;
    EXPECT_TRUE(world->registry.HasComponent(world->kinds.shield, playerEntity));
    EXPECT_FALSE(world->registry.EntityExists(item));

    const auto& timers = world->registry.Resolve(world->queries.timers);
    ASSERT_EQ(timers.size(), 1u);
    const auto* timer = world->registry.Find(world->kinds.effectTimer, timers[0]);
    ASSERT_NE(timer, nullptr);
    EXPECT_EQ(timer->targetEntity, playerEntity);
    EXPECT_EQ(timer->componentKind, world->kinds.shield.id);
    EXPECT_EQ(timer->expirationTime, world->frame.nowMs + world->config.shieldDurationMs);
    EXPECT_TRUE(sawEvent(GameEventType::PowerUp));
}

TEST_F(CollisionSystemTest, EnergyPowerUpRefills) {
    world->state.SetEnergy(5.0f);
    auto item = SpawnAt(*world, playerAt());
    world->registry.AddComponent(world->kinds.powerUp, item, PowerUp{PowerUpType::Energy});

    collision->Execute(0.016f);

    EXPECT_FLOAT_EQ(world->state.Energy(), world->state.MaxEnergy());
    EXPECT_TRUE(world->registry.Resolve(world->queries.timers).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Enemies
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CollisionSystemTest, EnemyContactDamagesAndShields) {
    auto enemy = SpawnEnemy(*world, playerAt() + Vector3{0.5f, 0.0f, 0.0f});

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Health(), 80);
    EXPECT_TRUE(world->registry.HasComponent(world->kinds.shield, world->player.entity));
    EXPECT_TRUE(sawEvent(GameEventType::Damage));
    // Player knocked away from the enemy, enemy the other way at half force.
    EXPECT_FLOAT_EQ(playerVelocity().x, -15.0f);
    EXPECT_FLOAT_EQ(world->registry.Find(world->kinds.velocity, enemy)->x, 7.5f);

    // Shielded: a second contact does nothing.
    collision->Execute(0.016f);
    EXPECT_EQ(world->state.Health(), 80);
}

TEST_F(CollisionSystemTest, ShieldedPlayerTakesNoDamage) {
    world->registry.AddComponent(world->kinds.shield, world->player.entity);
    SpawnEnemy(*world, playerAt());

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Health(), 100);
    EXPECT_FALSE(sawEvent(GameEventType::Damage));
}

TEST_F(CollisionSystemTest, LethalContactEndsGame) {
    world->state.SetHealth(15);
    SpawnEnemy(*world, playerAt() + Vector3{0.0f, 0.0f, 0.3f});
    auto goal = SpawnAt(*world, playerAt());
    world->registry.AddComponent(world->kinds.goal, goal);

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Health(), 0);
    EXPECT_EQ(world->state.Phase(), GamePhase::GameOver);
    EXPECT_TRUE(sawEvent(GameEventType::GameOver));
    // The goal in reach is not processed once the game is over.
    EXPECT_EQ(world->state.Level(), 1u);
}

TEST_F(CollisionSystemTest, OverlappingEnemiesAreSeparated) {
    const auto base = world->mapping.GridToWorld({3, 3}, 1.0f);
    auto a = SpawnEnemy(*world, base);
    auto b = SpawnEnemy(*world, base + Vector3{0.4f, 0.0f, 0.0f});

    collision->Execute(0.016f);

    const auto* pa = world->registry.Find(world->kinds.position, a);
    const auto* pb = world->registry.Find(world->kinds.position, b);
    EXPECT_NEAR(pb->x - pa->x, world->config.enemySeparationRadius, 1e-4f);
    EXPECT_NEAR((pa->x + pb->x) * 0.5f, base.x + 0.2f, 1e-4f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Goal
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CollisionSystemTest, GoalSchedulesNextLevel) {
    world->state.SetHealth(60);
    auto goal = SpawnAt(*world, playerAt() + Vector3{1.0f, 0.0f, 0.0f});
    world->registry.AddComponent(world->kinds.goal, goal);

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Score(), 200);
    EXPECT_EQ(world->state.Level(), 2u);
    EXPECT_EQ(world->state.Health(), 85);
    EXPECT_EQ(world->state.Phase(), GamePhase::Transitioning);
    EXPECT_TRUE(levels->TransitionPending());
    EXPECT_TRUE(sawEvent(GameEventType::LevelUp));
}

TEST_F(CollisionSystemTest, GoalIgnoredOutsidePlaying) {
    world->state.SetPhase(GamePhase::Transitioning);
    auto goal = SpawnAt(*world, playerAt());
    world->registry.AddComponent(world->kinds.goal, goal);

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Level(), 1u);
    EXPECT_EQ(world->state.Score(), 0);
}

TEST_F(CollisionSystemTest, FinalGoalWinsGame) {
    world->state.SetLevel(19);
    auto goal = SpawnAt(*world, playerAt());
    world->registry.AddComponent(world->kinds.goal, goal);

    collision->Execute(0.016f);

    EXPECT_EQ(world->state.Level(), 20u);
    EXPECT_EQ(world->state.Score(), 200 * 19);
    EXPECT_EQ(world->state.Phase(), GamePhase::GameWon);
    EXPECT_FALSE(levels->TransitionPending());
    EXPECT_TRUE(sawEvent(GameEventType::GameWon));
}
