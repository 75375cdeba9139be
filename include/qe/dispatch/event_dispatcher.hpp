#pragma once

/// @file event_dispatcher.hpp
/// @brief Inbound per-player gameplay queues and outbound lifecycle routing.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "qe/dispatch/lifecycle_bus.hpp"
#include "qe/foundation/config_manager.hpp"
#include "qe/foundation/game_result.hpp"
#include "qe/foundation/job_scheduler.hpp"
#include "qe/foundation/types.hpp"
#include "qe/quest/gameplay_event.hpp"

namespace qe::dispatch {

using foundation::PlayerId;

/// Default per-player inbound queue capacity.
constexpr std::size_t kDefaultQueueCapacity = 256;

/// Dispatcher settings.
struct DispatcherConfig {
    std::size_t queueCapacity = kDefaultQueueCapacity;  ///< Max queued events per player.
    std::size_t workerThreads = 0;                      ///< 0 = manual processPending().

    /// Read "dispatcher.queue_capacity" and "dispatcher.worker_threads",
    /// defaulting absent keys.
    /// @return ConfigTypeMismatch or ConfigInvalidValue on bad values.
    [[nodiscard]] static foundation::GameResult<DispatcherConfig> fromConfig(
        const foundation::ConfigManager& config);
};

/// Consumer of inbound gameplay events (implemented by QuestEngine).
///
/// Called for one player at a time, in arrival order. Implementations must
/// not throw across this boundary; anything thrown, of any type, is logged
/// and the event dropped.
class GameplayEventHandler {
public:
    virtual ~GameplayEventHandler() = default;
    virtual void onGameplayEvent(PlayerId player, const quest::GameplayEvent& event) = 0;
};

/// Single logical bus for both event families.
///
/// Inbound: submitEvent() appends to a bounded FIFO per player. In pooled
/// mode (workerThreads > 0) a drain job runs on the kcenon thread pool for
/// each player with queued events; at most one drain per player exists at a
/// time, so a player's events reach the handler strictly in order while
/// different players drain in parallel. In manual mode queued events wait
/// for processPending().
///
/// Outbound: the engine enqueues lifecycle events with enqueueLifecycle()
/// and triggers deliverLifecycle() once its transition is committed.
///
/// Usage:
/// @code
///   EventDispatcher dispatcher(DispatcherConfig{.workerThreads = 4});
///   QuestEngine engine(registry, evaluator, dispatcher, facts);  // attaches
///   dispatcher.subscribe<QuestCompleted>([](const QuestCompleted& e) { ... });
///   dispatcher.submitEvent(PlayerId(7), Interacted{"elder"});
///   dispatcher.waitIdle();
/// @endcode
class EventDispatcher {
public:
    explicit EventDispatcher(DispatcherConfig config = {});
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // -- Inbound --------------------------------------------------------------

    /// Route inbound events to @p handler. Replaces any previous handler.
    void attach(GameplayEventHandler& handler);

    /// Stop routing inbound events; blocks until in-flight drains finish.
    /// Must not be called from inside the handler.
    void detach();

    /// Queue a gameplay event for @p player.
    /// @return NoEventHandler if nothing is attached, EventQueueFull if the
    ///         player's queue is at capacity, DispatchError after shutdown.
    foundation::GameResult<void> submitEvent(PlayerId player, quest::GameplayEvent event);

    /// Drain every idle player's queue on the calling thread.
    /// @return Number of events handed to the handler.
    std::size_t processPending();

    /// Block until no drain is running or scheduled.
    void waitIdle();

    /// Reject further submits and wait for running drains to stop. A drain
    /// finishes the event in hand; events still queued are discarded
    /// undelivered. Idempotent; the destructor calls it.
    /// Must not be called from inside the handler.
    void shutdown();

    /// Events currently queued for @p player.
    [[nodiscard]] std::size_t pendingCount(PlayerId player) const;

    /// Players with queued or draining events. Queues are dropped once empty.
    [[nodiscard]] std::size_t queuedPlayerCount() const;

    /// Events handed to the handler since construction.
    [[nodiscard]] uint64_t processedCount() const noexcept {
        return processed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool isPooled() const noexcept { return scheduler_ != nullptr; }

    [[nodiscard]] const DispatcherConfig& config() const noexcept { return config_; }

    // -- Outbound -------------------------------------------------------------

    template <typename E>
    SubscriptionId subscribe(std::function<void(const E&)> handler, int32_t priority = 0) {
        return lifecycle_.Subscribe<E>(std::move(handler), priority);
    }

    void unsubscribe(SubscriptionId id) { lifecycle_.Unsubscribe(id); }

    /// Queue a lifecycle event; delivered by the next deliverLifecycle().
    template <typename E>
    void enqueueLifecycle(E event) {
        lifecycle_.Enqueue(std::move(event));
    }

    /// Deliver queued lifecycle events to subscribers.
    std::size_t deliverLifecycle() { return lifecycle_.Deliver(); }

    [[nodiscard]] const LifecycleBus& lifecycleBus() const noexcept { return lifecycle_; }

private:
    struct PlayerQueue {
        std::deque<quest::GameplayEvent> events;
        bool draining = false;
    };

    /// Hand @p player's events to the handler until the queue is empty.
    /// Caller must have marked the queue draining and counted it active.
    std::size_t drainPlayer(PlayerId player);

    /// Clear @p player's draining mark and drop its queue if empty
    /// (caller holds mutex_).
    void finishDrainLocked(PlayerId player);

    DispatcherConfig config_;
    LifecycleBus lifecycle_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::unordered_map<PlayerId, PlayerQueue> queues_;
    GameplayEventHandler* handler_ = nullptr;
    std::size_t activeDrains_ = 0;
    bool stopping_ = false;
    std::atomic<uint64_t> processed_{0};

    std::unique_ptr<foundation::GameJobScheduler> scheduler_;
};

}  // namespace qe::dispatch
