/// @file pathfinder.cpp
/// @brief A* search implementation.

#include "nexus/game/pathfinder.hpp"

#include "nexus/foundation/game_logger.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <tuple>

namespace nexus::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr std::array<GridCell, 4> kSteps = {{{0, -1}, {1, 0}, {0, 1}, {-1, 0}}};
constexpr int32_t kUnvisited = std::numeric_limits<int32_t>::max();

/// (f, insertion sequence, cell index): the sequence breaks f ties FIFO.
using FrontierEntry = std::tuple<int32_t, uint64_t, std::size_t>;

std::string describe(GridCell cell) {
    return "(" + std::to_string(cell.x) + ", " + std::to_string(cell.z) + ")";
}

GameResult<GridPath> notFound(GridCell start, GridCell goal, const char* reason) {
    return GameResult<GridPath>::err(GameError(
        ErrorCode::PathNotFound,
        "no path from " + describe(start) + " to " + describe(goal) + ": " + reason, goal));
}

} // namespace

GameResult<GridPath> Pathfinder::FindPath(const MazeGrid& grid, GridCell start, GridCell goal) {
    if (!grid.IsOpen(start)) {
        return notFound(start, goal, "start is blocked");
    }
    if (!grid.IsOpen(goal)) {
        return notFound(start, goal, "goal is blocked");
    }
    if (start == goal) {
        return GameResult<GridPath>::ok(GridPath{start});
    }

    const auto width = static_cast<std::size_t>(grid.Width());
    const auto cellCount = width * static_cast<std::size_t>(grid.Height());
    auto indexOf = [width](GridCell c) {
        return static_cast<std::size_t>(c.z) * width + static_cast<std::size_t>(c.x);
    };
    auto cellOf = [width](std::size_t idx) {
        return GridCell{static_cast<int32_t>(idx % width), static_cast<int32_t>(idx / width)};
    };

    std::vector<int32_t> gScore(cellCount, kUnvisited);
    std::vector<std::size_t> cameFrom(cellCount, cellCount);
    std::vector<bool> closed(cellCount, false);

    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, std::greater<>> open;
    uint64_t sequence = 0;

    const auto startIdx = indexOf(start);
    const auto goalIdx = indexOf(goal);
    gScore[startIdx] = 0;
    open.emplace(ManhattanDistance(start, goal), sequence++, startIdx);

    while (!open.empty()) {
        const auto [f, seq, currentIdx] = open.top();
        open.pop();
        if (closed[currentIdx]) {
            continue;
        }
        closed[currentIdx] = true;

        if (currentIdx == goalIdx) {
            GridPath path;
            for (auto idx = goalIdx; idx != cellCount; idx = cameFrom[idx]) {
                path.push_back(cellOf(idx));
            }
            std::reverse(path.begin(), path.end());
            return GameResult<GridPath>::ok(std::move(path));
        }

        const GridCell current = cellOf(currentIdx);
        for (const auto& step : kSteps) {
            const GridCell next{current.x + step.x, current.z + step.z};
            if (!grid.IsOpen(next)) {
                continue;
            }
            const auto nextIdx = indexOf(next);
            if (closed[nextIdx]) {
                continue;
            }
            const int32_t tentative = gScore[currentIdx] + 1;
            if (tentative < gScore[nextIdx]) {
                gScore[nextIdx] = tentative;
                cameFrom[nextIdx] = currentIdx;
                open.emplace(tentative + ManhattanDistance(next, goal), sequence++, nextIdx);
            }
        }
    }

    NEXUS_LOG_TRACE(foundation::LogCategory::Pathfinding,
                    "Search exhausted from " + describe(start) + " to " + describe(goal));
    return notFound(start, goal, "goal unreachable");
}

} // namespace nexus::game
