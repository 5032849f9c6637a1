#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias binding Result to GameError.

#include "interact/core/result.hpp"
#include "interact/foundation/game_error.hpp"

namespace interact::foundation {

/// Result type used by every fallible addon operation.
///
/// Example:
/// @code
///   GameResult<void> installHook(HookPoint point) {
///       if (installed_) {
///           return GameResult<void>::err(
///               GameError(ErrorCode::HookAlreadyInstalled, "already installed"));
///       }
///       return GameResult<void>::ok();
///   }
/// @endcode
template <typename T>
using GameResult = interact::Result<T, GameError>;

}  // namespace interact::foundation
