/// @file instance_store.cpp
/// @brief QuestInstanceStore implementation.

#include "qe/quest/instance_store.hpp"

#include <algorithm>

namespace qe::quest {

QuestInstance* PlayerQuestState::find(std::string_view questId) {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [questId](const QuestInstance& i) { return i.questId == questId; });
    return it != instances.end() ? &(*it) : nullptr;
}

const QuestInstance* PlayerQuestState::find(std::string_view questId) const {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [questId](const QuestInstance& i) { return i.questId == questId; });
    return it != instances.end() ? &(*it) : nullptr;
}

std::size_t PlayerQuestState::activeCount() const {
    return static_cast<std::size_t>(
        std::count_if(instances.begin(), instances.end(), [](const QuestInstance& i) {
            return i.status == QuestStatus::Active;
        }));
}

QuestInstanceStore::Lease QuestInstanceStore::acquire(PlayerId player) {
    Slot* slot = nullptr;
    {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(player);
        if (it != slots_.end()) {
            slot = it->second.get();
        }
    }
    if (slot == nullptr) {
        std::unique_lock lock(mutex_);
        auto& entry = slots_[player];
        if (!entry) {
            entry = std::make_unique<Slot>();
        }
        slot = entry.get();
    }
    return Lease(std::unique_lock(slot->mutex), slot->state);
}

std::optional<QuestInstanceStore::Lease> QuestInstanceStore::find(PlayerId player) {
    Slot* slot = nullptr;
    {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(player);
        if (it == slots_.end()) {
            return std::nullopt;
        }
        slot = it->second.get();
    }
    return Lease(std::unique_lock(slot->mutex), slot->state);
}

std::vector<PlayerId> QuestInstanceStore::players() const {
    std::shared_lock lock(mutex_);
    std::vector<PlayerId> result;
    result.reserve(slots_.size());
    for (const auto& [player, slot] : slots_) {
        result.push_back(player);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t QuestInstanceStore::playerCount() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

}  // namespace qe::quest
