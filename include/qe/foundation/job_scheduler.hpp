#pragma once

/// @file job_scheduler.hpp
/// @brief GameJobScheduler wrapping kcenon thread_system for worker jobs.

#include "qe/foundation/game_result.hpp"

#include <cstddef>
#include <functional>
#include <memory>

namespace qe::foundation {

/// Fire-and-forget worker pool built on kcenon's thread_system.
///
/// Uses PIMPL to keep thread_system headers out of the public API. The
/// event dispatcher posts one drain job per player with queued events.
/// Anything a job throws is logged on the worker and never reaches the
/// poster. Destruction stops the pool after running jobs finish.
///
/// Example:
/// @code
///   GameJobScheduler scheduler(4);
///   scheduler.post([this, player] { drainPlayer(player); });
/// @endcode
class GameJobScheduler {
public:
    using JobFunc = std::function<void()>;

    /// Start a pool with @p numThreads workers (at least one).
    explicit GameJobScheduler(std::size_t numThreads);

    ~GameJobScheduler();

    GameJobScheduler(const GameJobScheduler&) = delete;
    GameJobScheduler& operator=(const GameJobScheduler&) = delete;

    /// Enqueue @p job. Nothing is retained after it runs.
    /// @return JobScheduleFailed if the pool refused the job.
    GameResult<void> post(JobFunc job);

    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace qe::foundation
