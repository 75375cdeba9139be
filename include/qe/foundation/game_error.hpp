#pragma once

/// @file game_error.hpp
/// @brief Error value carried by GameResult<T>.

#include <string>
#include <string_view>
#include <utility>

#include "qe/foundation/error_code.hpp"

namespace qe::foundation {

/// Error code plus a message naming the offending quest, key or player.
/// The subsystem is derived from the code with errorSubsystem().
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace qe::foundation
