#pragma once

/// @file lifecycle_bus.hpp
/// @brief Typed outbound bus for quest lifecycle events.
///
/// Events are enqueued by the engine inside the critical section that
/// commits a transition and delivered afterwards, outside any engine lock.

#include <algorithm>
#include <any>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "qe/foundation/game_logger.hpp"

namespace qe::dispatch {

/// Unique identifier for a lifecycle subscription.
using SubscriptionId = uint64_t;

/// Type-keyed publish/subscribe queue with exactly-once FIFO delivery.
///
/// Handlers are invoked in priority order (lower value = higher priority);
/// within the same priority, in subscription order.
///
/// Delivery runs on one thread at a time. A Deliver() call made while
/// another delivery is in progress (including re-entrantly from a handler)
/// returns immediately; the running delivery picks up the new events.
/// A handler that throws, with any type, is logged and skipped.
///
/// Usage:
/// @code
///   LifecycleBus bus;
///   auto id = bus.Subscribe<QuestCompleted>([](const QuestCompleted& e) {
///       grantRewards(e.playerId, e.rewards);
///   });
///   bus.Enqueue(QuestCompleted{player, "intro_quest", {}});
///   bus.Deliver();
///   bus.Unsubscribe(id);
/// @endcode
class LifecycleBus {
public:
    LifecycleBus() = default;
    ~LifecycleBus() = default;

    LifecycleBus(const LifecycleBus&) = delete;
    LifecycleBus& operator=(const LifecycleBus&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe a handler for events of type E.
    ///
    /// @param handler   Callback invoked for every delivered E.
    /// @param priority  Handler priority (lower = called first, default 0).
    /// @return A unique subscription ID for later unsubscription.
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler,
                             int32_t priority = 0) {
        std::lock_guard lock(mutex_);

        auto id = nextId_++;
        auto typeIdx = std::type_index(typeid(E));

        HandlerEntry entry;
        entry.id = id;
        entry.priority = priority;
        entry.handler = [fn = std::move(handler)](const std::any& event) {
            fn(std::any_cast<const E&>(event));
        };

        auto& handlers = handlers_[typeIdx];
        handlers.push_back(std::move(entry));
        std::stable_sort(handlers.begin(), handlers.end(),
                         [](const HandlerEntry& a, const HandlerEntry& b) {
                             return a.priority < b.priority;
                         });

        subscriptionTypes_.insert_or_assign(id, typeIdx);
        return id;
    }

    /// Remove a subscription by ID. Unknown IDs are ignored.
    void Unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        auto typeIt = subscriptionTypes_.find(id);
        if (typeIt == subscriptionTypes_.end()) {
            return;
        }

        auto handlersIt = handlers_.find(typeIt->second);
        if (handlersIt != handlers_.end()) {
            auto& vec = handlersIt->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
            if (vec.empty()) {
                handlers_.erase(handlersIt);
            }
        }
        subscriptionTypes_.erase(typeIt);
    }

    // -- Enqueue / deliver ----------------------------------------------------

    /// Queue an event for the next Deliver().
    template <typename E>
    void Enqueue(E event) {
        std::lock_guard lock(mutex_);
        pending_.push_back(Pending{std::type_index(typeid(E)), std::any(std::move(event))});
    }

    /// Deliver every queued event in FIFO order.
    ///
    /// @return Number of events this call delivered (0 if another thread
    ///         is already delivering).
    std::size_t Deliver() {
        std::size_t delivered = 0;
        while (true) {
            if (delivering_.exchange(true, std::memory_order_acq_rel)) {
                return delivered;
            }
            {
                DeliveryFlag flag{delivering_};
                delivered += drain();
            }

            // An event enqueued between the last drain and the flag reset
            // would otherwise wait for the next Deliver().
            std::lock_guard lock(mutex_);
            if (pending_.empty()) {
                return delivered;
            }
        }
    }

    // -- Queries --------------------------------------------------------------

    /// Total number of active subscriptions across all event types.
    [[nodiscard]] std::size_t HandlerCount() const {
        std::lock_guard lock(mutex_);
        std::size_t count = 0;
        for (const auto& [_, handlers] : handlers_) {
            count += handlers.size();
        }
        return count;
    }

    /// Number of handlers for a specific event type.
    template <typename E>
    [[nodiscard]] std::size_t HandlerCountFor() const {
        std::lock_guard lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(E)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

    /// Number of events waiting for delivery.
    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        int32_t priority = 0;
        std::function<void(const std::any&)> handler;
    };

    /// Clears the single-delivery flag when a drain leaves scope.
    struct DeliveryFlag {
        std::atomic<bool>& flag;
        ~DeliveryFlag() { flag.store(false, std::memory_order_release); }
    };

    struct Pending {
        std::type_index type;
        std::any event;
    };

    /// Swap out and dispatch the queue until it stays empty.
    std::size_t drain() {
        std::size_t delivered = 0;
        while (true) {
            std::vector<Pending> batch;
            {
                std::lock_guard lock(mutex_);
                if (pending_.empty()) {
                    return delivered;
                }
                batch.swap(pending_);
            }
            for (const auto& item : batch) {
                dispatchOne(item);
                ++delivered;
            }
        }
    }

    void dispatchOne(const Pending& item) const {
        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = handlers_.find(item.type);
            if (it == handlers_.end()) {
                return;
            }
            snapshot = it->second;
        }
        for (const auto& entry : snapshot) {
            try {
                entry.handler(item.event);
            } catch (const std::exception& e) {
                QE_LOG_ERROR(foundation::LogCategory::Dispatch,
                             std::string("lifecycle subscriber threw: ") + e.what());
            } catch (...) {
                QE_LOG_ERROR(foundation::LogCategory::Dispatch,
                             "lifecycle subscriber threw a non-standard exception");
            }
        }
    }

    /// Handler table: type_index -> sorted handler list.
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;

    /// Reverse lookup: subscription ID -> type_index.
    std::unordered_map<SubscriptionId, std::type_index> subscriptionTypes_;

    std::vector<Pending> pending_;
    std::atomic<bool> delivering_{false};
    SubscriptionId nextId_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace qe::dispatch
