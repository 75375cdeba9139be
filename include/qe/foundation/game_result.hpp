#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "qe/core/result.hpp"
#include "qe/foundation/game_error.hpp"

namespace qe::foundation {

/// Result type specialized with GameError for engine operations.
///
/// Every engine, registry and dispatcher method that can fail returns
/// GameResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   GameResult<void> accept(const QuestId& id) {
///       if (id.empty()) {
///           return GameResult<void>::err(
///               GameError(ErrorCode::InvalidArgument, "empty quest id"));
///       }
///       return GameResult<void>::ok();
///   }
/// @endcode
template <typename T>
using GameResult = qe::Result<T, GameError>;

}  // namespace qe::foundation
