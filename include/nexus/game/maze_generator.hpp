#pragma once

/// @file maze_generator.hpp
/// @brief Randomized depth-first maze carving with optional loops.

#include <cstdint>

#include "nexus/foundation/game_result.hpp"
#include "nexus/game/maze_grid.hpp"
#include "nexus/game/random.hpp"

namespace nexus::game {

/// Generates perfect mazes on odd-sized grids.
///
/// Rooms sit on odd coordinates; the cell between two adjacent rooms is a
/// connector. Carving starts at room (1,1) and performs a randomized
/// iterative depth-first walk, so every room is reachable and, before any
/// extra openings, connectors form a spanning tree (rooms - 1 of them).
///
/// Extra openings then make floor(width * height * ratio) attempts at
/// random interior cells; an attempt opens the cell only when it is a
/// connector, which adds loops without ever touching the border or the
/// pillar cells (both coordinates even).
class MazeGenerator {
public:
    static constexpr double kDefaultExtraOpeningRatio = 0.003;

    /// @return The carved grid, or InvalidConfiguration when a dimension
    ///         is even or below 5.
    static foundation::GameResult<MazeGrid> Generate(
        int32_t width, int32_t height, RandomEngine& rng,
        double extraOpeningRatio = kDefaultExtraOpeningRatio);

    /// True for a cell with exactly one even coordinate.
    [[nodiscard]] static constexpr bool IsConnector(GridCell cell) noexcept {
        return (cell.x % 2 == 0) != (cell.z % 2 == 0);
    }

    /// True for a cell with both coordinates odd.
    [[nodiscard]] static constexpr bool IsRoom(GridCell cell) noexcept {
        return cell.x % 2 == 1 && cell.z % 2 == 1;
    }
};

} // namespace nexus::game
