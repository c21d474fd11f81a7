/// @file maze_grid.cpp
/// @brief MazeGrid, GridMapping and ExplorationMap implementation.

#include "nexus/game/maze_grid.hpp"

#include <algorithm>
#include <cmath>

namespace nexus::game {

MazeGrid::MazeGrid(int32_t width, int32_t height, CellType fill)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      cells_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), fill) {}

const std::vector<GridCell>& MazeGrid::OpenCells() const {
    if (openCellsValid_) {
        return openCells_;
    }
    openCells_.clear();
    for (int32_t z = 0; z < height_; ++z) {
        for (int32_t x = 0; x < width_; ++x) {
            if (cells_[index({x, z})] == CellType::Open) {
                openCells_.push_back({x, z});
            }
        }
    }
    openCellsValid_ = true;
    return openCells_;
}

std::size_t MazeGrid::CountCells(CellType type) const noexcept {
    return static_cast<std::size_t>(std::count(cells_.begin(), cells_.end(), type));
}

// ── GridMapping ─────────────────────────────────────────────────────────

Vector3 GridMapping::GridToWorld(GridCell cell, float y) const noexcept {
    const float halfW = static_cast<float>(width) * 0.5f;
    const float halfH = static_cast<float>(height) * 0.5f;
    return {(static_cast<float>(cell.x) - halfW) * cellSize + HalfCell(), y,
            (static_cast<float>(cell.z) - halfH) * cellSize + HalfCell()};
}

GridCell GridMapping::WorldToGrid(const Vector3& point) const noexcept {
    const float halfW = static_cast<float>(width) * 0.5f;
    const float halfH = static_cast<float>(height) * 0.5f;
    return {static_cast<int32_t>(std::floor(point.x / cellSize + halfW)),
            static_cast<int32_t>(std::floor(point.z / cellSize + halfH))};
}

// ── ExplorationMap ──────────────────────────────────────────────────────

void ExplorationMap::Reset(int32_t width, int32_t height) {
    width_ = std::max(width, 0);
    height_ = std::max(height, 0);
    visited_.assign(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), false);
    visitedCount_ = 0;
}

bool ExplorationMap::Mark(GridCell cell) {
    if (cell.x < 0 || cell.z < 0 || cell.x >= width_ || cell.z >= height_) {
        return false;
    }
    auto bit = visited_[static_cast<std::size_t>(cell.z) * width_ + cell.x];
    if (bit) {
        return false;
    }
    bit = true;
    ++visitedCount_;
    return true;
}

bool ExplorationMap::IsVisited(GridCell cell) const noexcept {
    if (cell.x < 0 || cell.z < 0 || cell.x >= width_ || cell.z >= height_) {
        return false;
    }
    return visited_[static_cast<std::size_t>(cell.z) * width_ + cell.x];
}

} // namespace nexus::game
