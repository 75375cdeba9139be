#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for structured
///        quest engine logs.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "qe/foundation/game_result.hpp"
#include "qe/foundation/types.hpp"

namespace qe::foundation {

/// Log severity levels for the engine.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
///
/// Each category can have its own minimum log level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Engine construction and wiring
    Condition   = 1, ///< Prerequisite evaluation
    Quest       = 2, ///< State machine transitions
    Objective   = 3, ///< Objective progress
    Dispatch    = 4, ///< Inbound queues and lifecycle delivery
    Persistence = 5, ///< Export / restore
    Config      = 6  ///< Configuration and definition loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Condition", "Quest", "Objective", "Dispatch", "Persistence", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = PlayerId(42);
///   ctx.questId = "intro_quest";
///   ctx.extra["objective"] = "0";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Objective,
///                         "Objective progressed", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<QuestId> questId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Condition   | Info          |
/// | Quest       | Info          |
/// | Objective   | Debug         |
/// | Dispatch    | Info          |
/// | Persistence | Info          |
/// | Config      | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Process-wide logger used by the QE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qe::foundation

// ---------------------------------------------------------------------------
// Convenience macros (defined outside the namespace)
// ---------------------------------------------------------------------------

/// @name QE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// QE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef QE_MIN_LOG_LEVEL
    #define QE_MIN_LOG_LEVEL 0
#endif

#define QE_LOG(level, cat, msg)                                                 \
    do {                                                                        \
        _Pragma("GCC diagnostic push")                                          \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                     \
        if (static_cast<int>(level) >= QE_MIN_LOG_LEVEL &&                      \
            ::qe::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                       \
            ::qe::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                       \
        _Pragma("GCC diagnostic pop")                                           \
    } while (0)

#define QE_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                         \
        if (static_cast<int>(level) >= QE_MIN_LOG_LEVEL &&                       \
            ::qe::foundation::GameLogger::instance().isEnabled((level), (cat)))   \
        {                                                                        \
            ::qe::foundation::GameLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define QE_LOG_DEBUG(cat, msg) \
    QE_LOG(::qe::foundation::LogLevel::Debug, (cat), (msg))

#define QE_LOG_INFO(cat, msg) \
    QE_LOG(::qe::foundation::LogLevel::Info, (cat), (msg))

#define QE_LOG_WARN(cat, msg) \
    QE_LOG(::qe::foundation::LogLevel::Warning, (cat), (msg))

#define QE_LOG_ERROR(cat, msg) \
    QE_LOG(::qe::foundation::LogLevel::Error, (cat), (msg))

/// @}
