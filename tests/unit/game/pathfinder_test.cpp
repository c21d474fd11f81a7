#include <gtest/gtest.h>

#include <cstdlib>
#include <queue>
#include <vector>

#include "nexus/game/maze_generator.hpp"
#include "nexus/game/pathfinder.hpp"

using namespace nexus::game;
using nexus::foundation::ErrorCode;

namespace {

/// Shortest step count by breadth-first search; -1 when unreachable.
int32_t bfsDistance(const MazeGrid& grid, GridCell start, GridCell goal) {
    std::vector<int32_t> dist(static_cast<std::size_t>(grid.Width() * grid.Height()), -1);
    auto idx = [&](GridCell c) { return static_cast<std::size_t>(c.z * grid.Width() + c.x); };
    std::queue<GridCell> frontier;
    frontier.push(start);
    dist[idx(start)] = 0;
    while (!frontier.empty()) {
        auto cell = frontier.front();
        frontier.pop();
        if (cell == goal) {
            return dist[idx(cell)];
        }
        for (GridCell step : {GridCell{1, 0}, GridCell{-1, 0}, GridCell{0, 1}, GridCell{0, -1}}) {
            GridCell next{cell.x + step.x, cell.z + step.z};
            if (grid.IsOpen(next) && dist[idx(next)] < 0) {
                dist[idx(next)] = dist[idx(cell)] + 1;
                frontier.push(next);
            }
        }
    }
    return -1;
}

void expectContiguousOpenPath(const MazeGrid& grid, const GridPath& path) {
    for (std::size_t i = 0; i < path.size(); ++i) {
        EXPECT_TRUE(grid.IsOpen(path[i]));
        if (i > 0) {
            EXPECT_EQ(ManhattanDistance(path[i - 1], path[i]), 1);
        }
    }
}

} // namespace

TEST(PathfinderTest, MatchesBfsLengthOnLoopyMazes) {
    RandomEngine rng(2024);
    for (int round = 0; round < 5; ++round) {
        auto maze = MazeGenerator::Generate(41, 41, rng, 0.02);
        ASSERT_TRUE(maze.hasValue());
        const auto& grid = maze.value();
        const auto open = grid.OpenCells();

        for (int trial = 0; trial < 10; ++trial) {
            const auto start = open[RandomIndex(rng, open.size())];
            const auto goal = open[RandomIndex(rng, open.size())];
            auto path = Pathfinder::FindPath(grid, start, goal);
            ASSERT_TRUE(path.hasValue());
            const auto& cells = path.value();

            EXPECT_EQ(cells.front(), start);
            EXPECT_EQ(cells.back(), goal);
            expectContiguousOpenPath(grid, cells);
            EXPECT_EQ(static_cast<int32_t>(cells.size()) - 1, bfsDistance(grid, start, goal));
        }
    }
}

TEST(PathfinderTest, SameStartAndGoalIsSingleCell) {
    MazeGrid grid(5, 5, CellType::Open);
    auto path = Pathfinder::FindPath(grid, {2, 2}, {2, 2});
    ASSERT_TRUE(path.hasValue());
    ASSERT_EQ(path.value().size(), 1u);
    EXPECT_EQ(path.value()[0], (GridCell{2, 2}));
}

TEST(PathfinderTest, BlockedEndpointsAreNotFound) {
    MazeGrid grid(5, 5, CellType::Open);
    grid.Set({4, 4}, CellType::Wall);

    auto wallGoal = Pathfinder::FindPath(grid, {0, 0}, {4, 4});
    ASSERT_TRUE(wallGoal.hasError());
    EXPECT_EQ(wallGoal.error().code(), ErrorCode::PathNotFound);
    const auto* unreachable = wallGoal.error().context<GridCell>();
    ASSERT_NE(unreachable, nullptr);
    EXPECT_TRUE((*unreachable == GridCell{4, 4}));

    auto outside = Pathfinder::FindPath(grid, {-1, 0}, {2, 2});
    ASSERT_TRUE(outside.hasError());
    EXPECT_EQ(outside.error().code(), ErrorCode::PathNotFound);
}

TEST(PathfinderTest, DisconnectedRegionIsNotFound) {
    MazeGrid grid(5, 5, CellType::Open);
    for (int32_t z = 0; z < 5; ++z) {
        grid.Set({2, z}, CellType::Wall);
    }
    auto path = Pathfinder::FindPath(grid, {0, 0}, {4, 4});
    ASSERT_TRUE(path.hasError());
    EXPECT_EQ(path.error().code(), ErrorCode::PathNotFound);
}

TEST(PathfinderTest, DoesNotMutateGrid) {
    RandomEngine rng(5);
    auto maze = MazeGenerator::Generate(21, 21, rng);
    ASSERT_TRUE(maze.hasValue());
    const auto before = maze.value().OpenCells();
    auto path = Pathfinder::FindPath(maze.value(), {1, 1}, {19, 19});
    EXPECT_TRUE(path.hasValue());
    EXPECT_EQ(maze.value().OpenCells(), before);
}
