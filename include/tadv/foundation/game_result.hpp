#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible game operation.

#include "tadv/core/result.hpp"
#include "tadv/foundation/game_error.hpp"

namespace tadv::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<double> readSpeed(const ConfigManager& config) {
///       auto speed = config.getOr<double>("player.speed", 5.0);
///       if (!(speed > 0.0)) {
///           return GameResult<double>::err(GameError(
///               ErrorCode::InvalidConfiguration, "player.speed must be positive", speed));
///       }
///       return GameResult<double>::ok(speed);
///   }
/// @endcode
template <typename T>
using GameResult = tadv::Result<T, GameError>;

}  // namespace tadv::foundation
