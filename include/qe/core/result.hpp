#pragma once

/// @file result.hpp
/// @brief Result<T,E> value-or-error return type.

#include <utility>
#include <variant>

namespace qe {

/// Value-or-error return type used by every fallible engine operation.
///
/// Engine commands, config lookups and catalog loading report failures as
/// values so that nothing thrown crosses the event-dispatch boundary. The
/// error type is always spelled out; foundation code uses GameError through
/// the GameResult<T> alias.
///
/// Example:
/// @code
///   auto progress = engine.getProgress(player, "intro_quest");
///   if (progress.hasError()) {
///       return GameResult<void>::err(progress.error());
///   }
///   render(progress.value());
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<E>(data_); }

    /// Success value. Calling this on an error result throws std::bad_variant_access.
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(E error) : data_(std::move(error)) {}

    std::variant<T, E> data_;
};

/// Commands that produce nothing on success.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace qe
