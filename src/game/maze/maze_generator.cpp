/// @file maze_generator.cpp
/// @brief Iterative backtracking maze carver.

#include "nexus/game/maze_generator.hpp"

#include "nexus/foundation/game_logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace nexus::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::array<GridCell, 4> kRoomSteps = {{{0, -2}, {2, 0}, {0, 2}, {-2, 0}}};

bool validDimension(int32_t n) {
    return n >= 5 && n % 2 == 1;
}

} // namespace

GameResult<MazeGrid> MazeGenerator::Generate(int32_t width, int32_t height, RandomEngine& rng,
                                             double extraOpeningRatio) {
    if (!validDimension(width) || !validDimension(height)) {
        return GameResult<MazeGrid>::err(GameError(
            ErrorCode::InvalidConfiguration,
            "maze dimensions must be odd and at least 5, got " + std::to_string(width) + "x" +
                std::to_string(height)));
    }

    MazeGrid grid(width, height, CellType::Wall);

    std::vector<GridCell> stack;
    stack.reserve(static_cast<std::size_t>(width / 2) * static_cast<std::size_t>(height / 2));
    stack.push_back({1, 1});
    grid.Set({1, 1}, CellType::Open);

    std::vector<GridCell> candidates;
    candidates.reserve(kRoomSteps.size());

    while (!stack.empty()) {
        const GridCell current = stack.back();

        candidates.clear();
        for (const auto& step : kRoomSteps) {
            const GridCell next{current.x + step.x, current.z + step.z};
            if (next.x > 0 && next.z > 0 && next.x < width - 1 && next.z < height - 1 &&
                grid.IsWall(next)) {
                candidates.push_back(next);
            }
        }

        if (candidates.empty()) {
            stack.pop_back();
            continue;
        }

        const GridCell next = candidates[RandomIndex(rng, candidates.size())];
        grid.Set({(current.x + next.x) / 2, (current.z + next.z) / 2}, CellType::Open);
        grid.Set(next, CellType::Open);
        stack.push_back(next);
    }

    const auto attempts = static_cast<int64_t>(
        std::floor(static_cast<double>(width) * static_cast<double>(height) *
                   std::max(extraOpeningRatio, 0.0)));
    int64_t opened = 0;
    for (int64_t i = 0; i < attempts; ++i) {
        const GridCell cell{RandomInt(rng, 1, width - 2), RandomInt(rng, 1, height - 2)};
        if (IsConnector(cell) && grid.IsWall(cell)) {
            grid.Set(cell, CellType::Open);
            ++opened;
        }
    }

    NEXUS_LOG_DEBUG(LogCategory::Maze,
                    "Generated " + std::to_string(width) + "x" + std::to_string(height) +
                        " maze with " + std::to_string(opened) + " extra openings");

    return GameResult<MazeGrid>::ok(std::move(grid));
}

} // namespace nexus::game
