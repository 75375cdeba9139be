#pragma once

/// @file instance_store.hpp
/// @brief Per-player quest instance storage with per-player locking.

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "qe/foundation/types.hpp"
#include "qe/quest/quest_instance.hpp"

namespace qe::quest {

using foundation::PlayerId;

/// Everything the engine tracks for one player.
struct PlayerQuestState {
    std::vector<QuestInstance> instances;   ///< In creation order.
    std::unordered_set<QuestId> announced;  ///< Quests already reported as available.
    std::vector<PendingReward> pendingRewards;

    [[nodiscard]] QuestInstance* find(std::string_view questId);
    [[nodiscard]] const QuestInstance* find(std::string_view questId) const;

    /// Number of instances with status Active.
    [[nodiscard]] std::size_t activeCount() const;
};

/// Owns every player's PlayerQuestState.
///
/// Each player has its own mutex; a Lease holds it for the duration of one
/// engine operation, so all mutations for a player are serialized while
/// different players proceed in parallel. The player table itself is
/// guarded by a shared_mutex and only write-locked when a new player
/// appears. Player slots are never removed, so a Lease stays valid for its
/// whole lifetime.
class QuestInstanceStore {
public:
    /// Exclusive access to one player's state.
    class Lease {
    public:
        Lease(std::unique_lock<std::mutex> lock, PlayerQuestState& state)
            : lock_(std::move(lock)), state_(&state) {}

        [[nodiscard]] PlayerQuestState& state() noexcept { return *state_; }
        [[nodiscard]] const PlayerQuestState& state() const noexcept { return *state_; }
        PlayerQuestState* operator->() noexcept { return state_; }
        const PlayerQuestState* operator->() const noexcept { return state_; }

        /// Release the player lock before the lease goes out of scope.
        void release() { lock_.unlock(); }

    private:
        std::unique_lock<std::mutex> lock_;
        PlayerQuestState* state_;
    };

    QuestInstanceStore() = default;

    QuestInstanceStore(const QuestInstanceStore&) = delete;
    QuestInstanceStore& operator=(const QuestInstanceStore&) = delete;

    /// Lock @p player's state, creating it empty on first use.
    [[nodiscard]] Lease acquire(PlayerId player);

    /// Lock @p player's state only if the player is known.
    [[nodiscard]] std::optional<Lease> find(PlayerId player);

    /// Every player that has state.
    [[nodiscard]] std::vector<PlayerId> players() const;

    [[nodiscard]] std::size_t playerCount() const;

private:
    struct Slot {
        std::mutex mutex;
        PlayerQuestState state;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<PlayerId, std::unique_ptr<Slot>> slots_;
};

}  // namespace qe::quest
