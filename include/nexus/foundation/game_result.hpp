#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for simulation error handling.

#include "nexus/core/result.hpp"
#include "nexus/foundation/game_error.hpp"

namespace nexus::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<GridPath> route(const MazeGrid& grid, GridCell a, GridCell b) {
///       if (!grid.IsOpen(a)) {
///           return GameResult<GridPath>::err(
///               GameError(ErrorCode::PathNotFound, "start cell is a wall"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using GameResult = nexus::Result<T, GameError>;

}  // namespace nexus::foundation
