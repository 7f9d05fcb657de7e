#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "evolve/core/result.hpp"
#include "evolve/foundation/game_error.hpp"

namespace evolve::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<float> scaledMagnitude(float base) {
///       if (base < 0.0f) {
///           return GameResult<float>::err(
///               GameError(ErrorCode::InvalidArgument, "negative base magnitude"));
///       }
///       return GameResult<float>::ok(base * 1.2f);
///   }
/// @endcode
template <typename T>
using GameResult = evolve::Result<T, GameError>;

}  // namespace evolve::foundation
