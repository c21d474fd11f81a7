#pragma once

/// @file maze_grid.hpp
/// @brief Maze cell grid, grid/world mapping and exploration map.

#include <compare>
#include <cstdint>
#include <functional>
#include <vector>

#include "nexus/game/math_types.hpp"

namespace nexus::game {

/// Integer cell coordinate; x is the column, z the row.
struct GridCell {
    int32_t x = 0;
    int32_t z = 0;

    constexpr auto operator<=>(const GridCell&) const = default;
};

/// Manhattan distance between two cells.
constexpr int32_t ManhattanDistance(GridCell a, GridCell b) noexcept {
    const int32_t dx = a.x > b.x ? a.x - b.x : b.x - a.x;
    const int32_t dz = a.z > b.z ? a.z - b.z : b.z - a.z;
    return dx + dz;
}

enum class CellType : uint8_t {
    Open,
    Wall
};

/// Rectangular grid of open and wall cells, stored row-major.
class MazeGrid {
public:
    MazeGrid() = default;

    /// Grid of @p width x @p height cells, all set to @p fill.
    MazeGrid(int32_t width, int32_t height, CellType fill = CellType::Wall);

    [[nodiscard]] int32_t Width() const noexcept { return width_; }
    [[nodiscard]] int32_t Height() const noexcept { return height_; }
    [[nodiscard]] bool Empty() const noexcept { return cells_.empty(); }

    [[nodiscard]] bool InBounds(GridCell cell) const noexcept {
        return cell.x >= 0 && cell.z >= 0 && cell.x < width_ && cell.z < height_;
    }

    /// Cell type; out-of-bounds reads as Wall.
    [[nodiscard]] CellType At(GridCell cell) const noexcept {
        return InBounds(cell) ? cells_[index(cell)] : CellType::Wall;
    }

    [[nodiscard]] bool IsOpen(GridCell cell) const noexcept { return At(cell) == CellType::Open; }
    [[nodiscard]] bool IsWall(GridCell cell) const noexcept { return At(cell) == CellType::Wall; }

    /// No-op for out-of-bounds cells.
    void Set(GridCell cell, CellType type) noexcept {
        if (InBounds(cell) && cells_[index(cell)] != type) {
            cells_[index(cell)] = type;
            openCellsValid_ = false;
        }
    }

    /// Every open cell in row-major order. Built on first use and kept
    /// until the next Set() that changes a cell.
    [[nodiscard]] const std::vector<GridCell>& OpenCells() const;

    [[nodiscard]] std::size_t CountCells(CellType type) const noexcept;

private:
    [[nodiscard]] std::size_t index(GridCell cell) const noexcept {
        return static_cast<std::size_t>(cell.z) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(cell.x);
    }

    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<CellType> cells_;

    mutable std::vector<GridCell> openCells_;
    mutable bool openCellsValid_ = false;
};

/// Conversion between grid cells and world coordinates for one level.
///
/// The maze is centred on the world origin: cell (gx, gz) spans
/// [(gx - w/2) * cs, (gx + 1 - w/2) * cs) on x, and likewise on z.
struct GridMapping {
    int32_t width = 0;
    int32_t height = 0;
    float cellSize = 2.5f;

    /// Centre of @p cell at height @p y.
    [[nodiscard]] Vector3 GridToWorld(GridCell cell, float y = 0.0f) const noexcept;

    /// Cell containing @p point (may lie outside the grid).
    [[nodiscard]] GridCell WorldToGrid(const Vector3& point) const noexcept;

    [[nodiscard]] float HalfCell() const noexcept { return cellSize * 0.5f; }
};

/// Per-level record of which cells the player has revealed.
class ExplorationMap {
public:
    void Reset(int32_t width, int32_t height);

    /// Mark @p cell; returns true if it was not visited before.
    bool Mark(GridCell cell);

    [[nodiscard]] bool IsVisited(GridCell cell) const noexcept;

    [[nodiscard]] std::size_t VisitedCount() const noexcept { return visitedCount_; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<bool> visited_;
    std::size_t visitedCount_ = 0;
};

} // namespace nexus::game

template <>
struct std::hash<nexus::game::GridCell> {
    std::size_t operator()(const nexus::game::GridCell& c) const noexcept {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) |
                                     static_cast<uint32_t>(c.z));
    }
};
