#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for simulation error handling.

#include "arena/core/result.hpp"
#include "arena/foundation/game_error.hpp"

namespace arena::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<float> parseRadius(float r) {
///       if (r <= 0.0f) {
///           return GameResult<float>::err(
///               GameError(ErrorCode::InvalidArgument, "radius must be positive"));
///       }
///       return GameResult<float>::ok(r);
///   }
/// @endcode
template <typename T>
using GameResult = arena::Result<T, GameError>;

}  // namespace arena::foundation
