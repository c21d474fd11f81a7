#pragma once

/// @file pathfinder.hpp
/// @brief A* shortest paths over the open cells of a maze grid.

#include <vector>

#include "nexus/foundation/game_result.hpp"
#include "nexus/game/maze_grid.hpp"

namespace nexus::game {

/// Inclusive sequence of cells from start to goal.
using GridPath = std::vector<GridCell>;

/// Grid A* with 4-connectivity, unit step cost and a Manhattan heuristic.
///
/// The heuristic is consistent on this graph, so returned paths are
/// shortest. Among equal-priority frontier entries the one inserted first
/// is expanded first, which makes results reproducible for a given grid.
class Pathfinder {
public:
    /// @return The path (a single cell when start == goal), or
    ///         PathNotFound when either endpoint is out of bounds or a
    ///         wall, or the goal is unreachable.
    static foundation::GameResult<GridPath> FindPath(const MazeGrid& grid, GridCell start,
                                                     GridCell goal);
};

} // namespace nexus::game
