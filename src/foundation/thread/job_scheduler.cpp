/// @file job_scheduler.cpp
/// @brief GameJobScheduler implementation wrapping kcenon thread_system.

#include "qe/foundation/job_scheduler.hpp"

#include "qe/foundation/game_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <exception>
#include <string>
#include <vector>

namespace qe::foundation {

struct GameJobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers = 0;
};

GameJobScheduler::GameJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->workers = numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("QuestJobScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

GameJobScheduler::~GameJobScheduler() {
    impl_->pool->stop(false); // graceful: wait for running jobs
}

GameResult<void> GameJobScheduler::post(JobFunc job) {
    auto threadJob = kcenon::thread::job_builder()
        .name("qe_post")
        .priority(kcenon::thread::job_priority::normal)
        .work([fn = std::move(job)]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                QE_LOG_ERROR(LogCategory::Core, std::string("posted job threw: ") + e.what());
            } catch (...) {
                QE_LOG_ERROR(LogCategory::Core, "posted job threw a non-standard exception");
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return GameResult<void>::ok();
}

std::size_t GameJobScheduler::workerCount() const noexcept {
    return impl_->workers;
}

}  // namespace qe::foundation
