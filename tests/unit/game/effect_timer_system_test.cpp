#include <gtest/gtest.h>

#include <memory>

#include "nexus/game/effect_timer_system.hpp"
#include "test_world.hpp"

using namespace nexus::game;
using namespace nexus::game::testing;

class EffectTimerSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        world = MakeArena(9);
        timers = std::make_unique<EffectTimerSystem>(*world);
        player = world->player.entity;
    }

    std::unique_ptr<GameWorld> world;
    std::unique_ptr<EffectTimerSystem> timers;
    nexus::ecs::Entity player;
};

TEST_F(EffectTimerSystemTest, RemovesEffectExactlyAtExpiration) {
    world->frame.nowMs = 1000;
    world->registry.AddComponent(world->kinds.speedBoost, player);
    auto timer = world->AddEffectTimer(player, world->kinds.speedBoost.id, 500);

    world->frame.nowMs = 1499;
    timers->Execute(0.016f);
    EXPECT_TRUE(world->registry.HasComponent(world->kinds.speedBoost, player));
    EXPECT_TRUE(world->registry.EntityExists(timer));

    world->frame.nowMs = 1500;
    timers->Execute(0.016f);
    EXPECT_FALSE(world->registry.HasComponent(world->kinds.speedBoost, player));
    EXPECT_FALSE(world->registry.EntityExists(timer));
    EXPECT_TRUE(world->registry.Resolve(world->queries.timers).empty());
    EXPECT_EQ(timers->GetLastStaleCount(), 0u);
}

TEST_F(EffectTimerSystemTest, OnlyExpiredTimersFire) {
    world->frame.nowMs = 0;
    world->registry.AddComponent(world->kinds.speedBoost, player);
    world->registry.AddComponent(world->kinds.scoreMultiplier, player, ScoreMultiplier{3});
    world->AddEffectTimer(player, world->kinds.speedBoost.id, 100);
    world->AddEffectTimer(player, world->kinds.scoreMultiplier.id, 5000);

    world->frame.nowMs = 200;
    timers->Execute(0.016f);

    EXPECT_FALSE(world->registry.HasComponent(world->kinds.speedBoost, player));
    EXPECT_TRUE(world->registry.HasComponent(world->kinds.scoreMultiplier, player));
    EXPECT_EQ(world->PlayerMultiplier(), 3);
    EXPECT_EQ(world->registry.Resolve(world->queries.timers).size(), 1u);
}

TEST_F(EffectTimerSystemTest, FirstOverlappingShieldTimerRemovesShield) {
    world->frame.nowMs = 0;
    world->registry.AddComponent(world->kinds.shield, player);
    world->AddEffectTimer(player, world->kinds.shield.id, 2000);
    world->AddEffectTimer(player, world->kinds.shield.id, 8000);

    world->frame.nowMs = 2000;
    timers->Execute(0.016f);
    EXPECT_FALSE(world->registry.HasComponent(world->kinds.shield, player));

    // The later timer still fires harmlessly.
    world->frame.nowMs = 8000;
    timers->Execute(0.016f);
    EXPECT_TRUE(world->registry.Resolve(world->queries.timers).empty());
}

TEST_F(EffectTimerSystemTest, TimerForDestroyedTargetIsDiscarded) {
    world->frame.nowMs = 0;
    auto target = world->registry.CreateEntity();
    world->registry.AddComponent(world->kinds.shield, target);
    auto timer = world->AddEffectTimer(target, world->kinds.shield.id, 10);
    world->registry.DestroyEntity(target);

    world->frame.nowMs = 10;
    timers->Execute(0.016f);

    EXPECT_FALSE(world->registry.EntityExists(timer));
    EXPECT_EQ(timers->GetLastStaleCount(), 1u);
}
