/// @file event_dispatcher.cpp
/// @brief EventDispatcher implementation.

#include "qe/dispatch/event_dispatcher.hpp"

#include <exception>
#include <string>
#include <vector>

#include "qe/foundation/game_logger.hpp"

namespace qe::dispatch {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// -- DispatcherConfig ---------------------------------------------------------

GameResult<DispatcherConfig> DispatcherConfig::fromConfig(
    const foundation::ConfigManager& config) {
    DispatcherConfig result;

    auto capacity = config.getOr<int64_t>("dispatcher.queue_capacity",
                                          static_cast<int64_t>(kDefaultQueueCapacity));
    if (capacity.hasError()) {
        return GameResult<DispatcherConfig>::err(capacity.error());
    }
    if (capacity.value() < 1) {
        return GameResult<DispatcherConfig>::err(GameError(
            ErrorCode::ConfigInvalidValue, "dispatcher.queue_capacity must be at least 1"));
    }

    auto workers = config.getOr<int64_t>("dispatcher.worker_threads", 0);
    if (workers.hasError()) {
        return GameResult<DispatcherConfig>::err(workers.error());
    }
    if (workers.value() < 0) {
        return GameResult<DispatcherConfig>::err(GameError(
            ErrorCode::ConfigInvalidValue, "dispatcher.worker_threads must not be negative"));
    }

    result.queueCapacity = static_cast<std::size_t>(capacity.value());
    result.workerThreads = static_cast<std::size_t>(workers.value());
    return GameResult<DispatcherConfig>::ok(result);
}

// -- Construction -------------------------------------------------------------

EventDispatcher::EventDispatcher(DispatcherConfig config) : config_(config) {
    if (config_.queueCapacity == 0) {
        config_.queueCapacity = 1;
    }
    if (config_.workerThreads > 0) {
        scheduler_ = std::make_unique<foundation::GameJobScheduler>(config_.workerThreads);
    }
    QE_LOG_INFO(LogCategory::Dispatch,
                std::string("event dispatcher started in ")
                    + (scheduler_ ? "pooled" : "manual") + " mode, queue capacity "
                    + std::to_string(config_.queueCapacity));
}

EventDispatcher::~EventDispatcher() {
    shutdown();
}

void EventDispatcher::shutdown() {
    std::unique_lock lock(mutex_);
    if (!stopping_) {
        stopping_ = true;
        QE_LOG_INFO(LogCategory::Dispatch, "event dispatcher shutting down");
    }
    idleCv_.wait(lock, [this] { return activeDrains_ == 0; });
}

// -- Handler wiring -----------------------------------------------------------

void EventDispatcher::attach(GameplayEventHandler& handler) {
    std::lock_guard lock(mutex_);
    handler_ = &handler;
}

void EventDispatcher::detach() {
    std::unique_lock lock(mutex_);
    handler_ = nullptr;
    idleCv_.wait(lock, [this] { return activeDrains_ == 0; });
}

// -- Inbound ------------------------------------------------------------------

GameResult<void> EventDispatcher::submitEvent(PlayerId player, quest::GameplayEvent event) {
    bool scheduleDrain = false;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return GameResult<void>::err(
                GameError(ErrorCode::DispatchError, "dispatcher is shutting down"));
        }
        if (handler_ == nullptr) {
            return GameResult<void>::err(
                GameError(ErrorCode::NoEventHandler, "no gameplay event handler attached"));
        }

        auto& queue = queues_[player];
        if (queue.events.size() >= config_.queueCapacity) {
            LogContext ctx;
            ctx.playerId = player;
            ctx.extra["event"] = std::string(quest::gameplayEventName(event));
            QE_LOG_CTX(LogLevel::Warning, LogCategory::Dispatch,
                       "inbound queue full, event rejected", ctx);
            return GameResult<void>::err(
                GameError(ErrorCode::EventQueueFull, "player event queue is full"));
        }

        queue.events.push_back(std::move(event));
        if (scheduler_ && !queue.draining) {
            queue.draining = true;
            ++activeDrains_;
            scheduleDrain = true;
        }
    }

    if (scheduleDrain) {
        auto posted = scheduler_->post([this, player] { drainPlayer(player); });
        if (posted.hasError()) {
            // The event stays queued; the next submit or processPending()
            // picks it up.
            std::lock_guard lock(mutex_);
            finishDrainLocked(player);
            QE_LOG_ERROR(LogCategory::Dispatch,
                         "failed to schedule drain for player "
                             + std::to_string(player.value()));
        }
    }
    return GameResult<void>::ok();
}

std::size_t EventDispatcher::processPending() {
    std::vector<PlayerId> ready;
    {
        std::lock_guard lock(mutex_);
        for (auto& [player, queue] : queues_) {
            if (!queue.events.empty() && !queue.draining) {
                queue.draining = true;
                ++activeDrains_;
                ready.push_back(player);
            }
        }
    }

    std::size_t handled = 0;
    for (auto player : ready) {
        handled += drainPlayer(player);
    }
    return handled;
}

void EventDispatcher::waitIdle() {
    std::unique_lock lock(mutex_);
    idleCv_.wait(lock, [this] { return activeDrains_ == 0; });
}

std::size_t EventDispatcher::pendingCount(PlayerId player) const {
    std::lock_guard lock(mutex_);
    auto it = queues_.find(player);
    return it == queues_.end() ? 0 : it->second.events.size();
}

std::size_t EventDispatcher::queuedPlayerCount() const {
    std::lock_guard lock(mutex_);
    return queues_.size();
}

std::size_t EventDispatcher::drainPlayer(PlayerId player) {
    // Releases the drain slot if anything escapes the loop below.
    struct DrainSlot {
        EventDispatcher& self;
        PlayerId player;
        bool released = false;

        ~DrainSlot() {
            if (!released) {
                std::lock_guard lock(self.mutex_);
                self.finishDrainLocked(player);
            }
        }
    } slot{*this, player};

    std::size_t handled = 0;
    while (true) {
        quest::GameplayEvent event;
        GameplayEventHandler* handler = nullptr;
        {
            std::lock_guard lock(mutex_);
            auto& queue = queues_[player];
            if (queue.events.empty() || handler_ == nullptr || stopping_) {
                finishDrainLocked(player);
                slot.released = true;
                return handled;
            }
            event = std::move(queue.events.front());
            queue.events.pop_front();
            handler = handler_;
        }

        try {
            handler->onGameplayEvent(player, event);
        } catch (const std::exception& e) {
            LogContext ctx;
            ctx.playerId = player;
            ctx.extra["event"] = std::string(quest::gameplayEventName(event));
            ctx.extra["what"] = e.what();
            QE_LOG_CTX(LogLevel::Error, LogCategory::Dispatch,
                       "gameplay event handler threw, event dropped", ctx);
        } catch (...) {
            LogContext ctx;
            ctx.playerId = player;
            ctx.extra["event"] = std::string(quest::gameplayEventName(event));
            QE_LOG_CTX(LogLevel::Error, LogCategory::Dispatch,
                       "gameplay event handler threw a non-standard exception, event dropped",
                       ctx);
        }
        ++handled;
        processed_.fetch_add(1, std::memory_order_relaxed);
    }
}

void EventDispatcher::finishDrainLocked(PlayerId player) {
    auto it = queues_.find(player);
    if (it != queues_.end()) {
        it->second.draining = false;
        if (it->second.events.empty()) {
            queues_.erase(it);
        }
    }
    --activeDrains_;
    if (activeDrains_ == 0) {
        idleCv_.notify_all();
    }
}

}  // namespace qe::dispatch
