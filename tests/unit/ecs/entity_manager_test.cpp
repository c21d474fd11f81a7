#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

#include "nexus/ecs/entity_manager.hpp"

using namespace nexus::ecs;

// ===========================================================================
// EntityManager: creation
// ===========================================================================

TEST(EntityManagerTest, CreateReturnsValidEntity) {
    EntityManager mgr;
    Entity e = mgr.Create();
    EXPECT_TRUE(e.isValid());
    EXPECT_TRUE(mgr.IsAlive(e));
}

TEST(EntityManagerTest, SequentialIds) {
    EntityManager mgr;
    for (uint32_t i = 0; i < 10; ++i) {
        EXPECT_EQ(mgr.Create().id(), i);
    }
    EXPECT_EQ(mgr.Count(), 10u);
    EXPECT_EQ(mgr.Issued(), 10u);
}

// ===========================================================================
// EntityManager: destruction
// ===========================================================================

TEST(EntityManagerTest, DestroyMakesEntityDead) {
    EntityManager mgr;
    Entity e = mgr.Create();
    EXPECT_TRUE(mgr.Destroy(e));
    EXPECT_FALSE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.Count(), 0u);
}

TEST(EntityManagerTest, DoubleDestroyReturnsFalse) {
    EntityManager mgr;
    Entity e = mgr.Create();
    EXPECT_TRUE(mgr.Destroy(e));
    EXPECT_FALSE(mgr.Destroy(e));
}

TEST(EntityManagerTest, DestroyInvalidOrUnknownIsRejected) {
    EntityManager mgr;
    EXPECT_FALSE(mgr.Destroy(Entity::invalid()));
    EXPECT_FALSE(mgr.Destroy(Entity{42}));
    EXPECT_FALSE(mgr.IsAlive(Entity{42}));
}

TEST(EntityManagerTest, IdsAreNeverRecycled) {
    EntityManager mgr;
    std::unordered_set<uint32_t> seen;
    for (int round = 0; round < 5; ++round) {
        std::vector<Entity> batch;
        for (int i = 0; i < 20; ++i) {
            batch.push_back(mgr.Create());
            EXPECT_TRUE(seen.insert(batch.back().id()).second);
        }
        for (auto e : batch) {
            mgr.Destroy(e);
        }
    }
    EXPECT_EQ(mgr.Count(), 0u);
    EXPECT_EQ(mgr.Issued(), 100u);
}

TEST(EntityManagerTest, AliveListTracksMembership) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    Entity c = mgr.Create();
    mgr.Destroy(b);

    const auto& alive = mgr.Alive();
    ASSERT_EQ(alive.size(), 2u);
    EXPECT_NE(std::find(alive.begin(), alive.end(), a), alive.end());
    EXPECT_NE(std::find(alive.begin(), alive.end(), c), alive.end());
    EXPECT_EQ(std::find(alive.begin(), alive.end(), b), alive.end());
}
