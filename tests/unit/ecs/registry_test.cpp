#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <set>
#include <vector>

#include "nexus/ecs/registry.hpp"

using namespace nexus::ecs;
using nexus::foundation::ErrorCode;

namespace {

struct Position {
    float x = 0.0f;
    float z = 0.0f;
};

struct Velocity {
    float x = 0.0f;
    float z = 0.0f;
};

struct Frozen {};

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        position = registry.DefineComponentKind<Position>();
        velocity = registry.DefineComponentKind<Velocity>();
        frozen = registry.DefineComponentKind<Frozen>();
    }

    /// Brute-force evaluation of a conjunctive predicate.
    std::set<Entity> filter(const std::vector<ComponentKindId>& kinds) const {
        std::set<Entity> out;
        for (auto entity : registry.Entities()) {
            if (std::all_of(kinds.begin(), kinds.end(), [&](ComponentKindId k) {
                    return registry.HasComponent(k, entity);
                })) {
                out.insert(entity);
            }
        }
        return out;
    }

    std::set<Entity> members(QueryHandle query) const {
        const auto& list = registry.Resolve(query);
        return {list.begin(), list.end()};
    }

    Registry registry;
    ComponentKind<Position> position;
    ComponentKind<Velocity> velocity;
    ComponentKind<Frozen> frozen;
};

} // namespace

// ===========================================================================
// Components
// ===========================================================================

TEST_F(RegistryTest, AddAndFindComponent) {
    auto e = registry.CreateEntity();
    auto* stored = registry.AddComponent(position, e, Position{1.0f, 2.0f});
    ASSERT_NE(stored, nullptr);

    auto* found = registry.Find(position, e);
    ASSERT_NE(found, nullptr);
    EXPECT_FLOAT_EQ(found->z, 2.0f);
    EXPECT_TRUE(registry.HasComponent(position, e));
    EXPECT_FALSE(registry.HasComponent(velocity, e));
}

TEST_F(RegistryTest, AddToDeadEntityFails) {
    auto e = registry.CreateEntity();
    registry.DestroyEntity(e);
    EXPECT_EQ(registry.AddComponent(position, e), nullptr);
    EXPECT_FALSE(registry.HasComponent(position, e));
}

TEST_F(RegistryTest, GetComponentReportsMissingPieces) {
    auto e = registry.CreateEntity();
    auto missing = registry.GetComponent(velocity, e);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ComponentNotFound);

    registry.DestroyEntity(e);
    auto dead = registry.GetComponent(velocity, e);
    ASSERT_TRUE(dead.hasError());
    EXPECT_EQ(dead.error().code(), ErrorCode::EntityNotFound);
}

TEST_F(RegistryTest, DistinctKindsOfSameType) {
    auto other = registry.DefineComponentKind<Position>();
    auto e = registry.CreateEntity();
    registry.AddComponent(other, e, Position{5.0f, 5.0f});

    EXPECT_TRUE(registry.HasComponent(other, e));
    EXPECT_FALSE(registry.HasComponent(position, e));
    EXPECT_EQ(registry.ComponentKindCount(), 4u);
}

TEST_F(RegistryTest, DestroyRemovesAllComponents) {
    auto e = registry.CreateEntity();
    registry.AddComponent(position, e);
    registry.AddComponent(frozen, e);
    registry.DestroyEntity(e);

    EXPECT_FALSE(registry.EntityExists(e));
    EXPECT_EQ(registry.Storage(position).Size(), 0u);
    EXPECT_EQ(registry.Storage(frozen).Size(), 0u);

    // Destroying again is a no-op.
    registry.DestroyEntity(e);
    EXPECT_EQ(registry.EntityCount(), 0u);
}

// ===========================================================================
// Queries
// ===========================================================================

TEST_F(RegistryTest, QuerySeededFromExistingEntities) {
    auto a = registry.CreateEntity();
    auto b = registry.CreateEntity();
    registry.AddComponent(position, a);
    registry.AddComponent(velocity, a);
    registry.AddComponent(position, b);

    auto moving = registry.DefineQuery(position, velocity);
    EXPECT_EQ(members(moving), std::set<Entity>{a});
}

TEST_F(RegistryTest, QueryFollowsAddRemoveDestroy) {
    auto moving = registry.DefineQuery(position, velocity);
    auto e = registry.CreateEntity();

    registry.AddComponent(position, e);
    EXPECT_TRUE(registry.Resolve(moving).empty());

    registry.AddComponent(velocity, e);
    EXPECT_EQ(registry.Resolve(moving).size(), 1u);

    registry.RemoveComponent(velocity, e);
    EXPECT_TRUE(registry.Resolve(moving).empty());

    registry.AddComponent(velocity, e);
    registry.DestroyEntity(e);
    EXPECT_TRUE(registry.Resolve(moving).empty());
}

TEST_F(RegistryTest, OverwriteDoesNotDuplicateMembership) {
    auto moving = registry.DefineQuery(position, velocity);
    auto e = registry.CreateEntity();
    registry.AddComponent(position, e);
    registry.AddComponent(velocity, e);
    registry.AddComponent(velocity, e, Velocity{3.0f, 0.0f});

    EXPECT_EQ(registry.Resolve(moving).size(), 1u);
    EXPECT_FLOAT_EQ(registry.Find(velocity, e)->x, 3.0f);
}

TEST_F(RegistryTest, IdenticalPredicatesShareHandle) {
    auto first = registry.DefineQuery(position, velocity);
    auto second = registry.DefineQuery(velocity, position, velocity);
    EXPECT_EQ(first, second);
    EXPECT_EQ(registry.QueryCount(), 1u);
}

TEST_F(RegistryTest, InvalidQueriesResolveEmpty) {
    auto empty = registry.DefineQuery(std::vector<ComponentKindId>{});
    auto unknown = registry.DefineQuery(std::vector<ComponentKindId>{99});
    EXPECT_FALSE(empty.isValid());
    EXPECT_FALSE(unknown.isValid());
    EXPECT_TRUE(registry.Resolve(unknown).empty());
}

TEST_F(RegistryTest, QueriesMatchBruteForceUnderRandomOperations) {
    const std::vector<std::vector<ComponentKindId>> predicates = {
        {position.id},
        {position.id, velocity.id},
        {velocity.id, frozen.id},
        {position.id, velocity.id, frozen.id},
    };
    std::vector<QueryHandle> handles;
    for (const auto& predicate : predicates) {
        handles.push_back(registry.DefineQuery(predicate));
    }

    std::mt19937 rng(1234);
    std::vector<Entity> pool;
    for (int step = 0; step < 2000; ++step) {
        const int op = std::uniform_int_distribution<int>(0, 5)(rng);
        if (pool.empty() || op == 0) {
            pool.push_back(registry.CreateEntity());
            continue;
        }
        const auto e = pool[std::uniform_int_distribution<std::size_t>(0, pool.size() - 1)(rng)];
        switch (op) {
            case 1: registry.AddComponent(position, e); break;
            case 2: registry.AddComponent(velocity, e); break;
            case 3: registry.AddComponent(frozen, e); break;
            case 4:
                registry.RemoveComponent(
                    static_cast<ComponentKindId>(std::uniform_int_distribution<int>(0, 2)(rng)), e);
                break;
            default:
                registry.DestroyEntity(e);
                break;
        }

        if (step % 50 == 0) {
            for (std::size_t q = 0; q < handles.size(); ++q) {
                ASSERT_EQ(members(handles[q]), filter(predicates[q])) << "step " << step;
            }
        }
    }
    for (std::size_t q = 0; q < handles.size(); ++q) {
        EXPECT_EQ(members(handles[q]), filter(predicates[q]));
    }
}
