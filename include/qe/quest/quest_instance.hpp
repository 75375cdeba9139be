#pragma once

/// @file quest_instance.hpp
/// @brief Per-player quest progress records and their persistence snapshot.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "qe/foundation/types.hpp"
#include "qe/quest/quest_definition.hpp"
#include "qe/quest/quest_types.hpp"

namespace qe::quest {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// A player's progress against one quest definition.
///
/// Invariants (checked on restore):
///   - currentObjective <= objective count
///   - Active    => currentObjective <  objective count
///   - Completed <=> currentObjective == objective count
///   - progress[i] <= required[i]; progress[i] == required[i] for i < currentObjective
struct QuestInstance {
    QuestId questId;
    QuestStatus status = QuestStatus::Available;
    std::size_t currentObjective = 0;
    std::vector<int32_t> progress;               ///< One counter per objective.
    std::map<std::string, std::string> choices;  ///< Choice id -> chosen option.
    std::optional<TimePoint> acceptedAt;
    std::optional<TimePoint> completedAt;
    std::optional<TimePoint> failedAt;
    std::optional<TimePoint> abandonedAt;

    [[nodiscard]] bool isTerminal() const noexcept { return quest::isTerminal(status); }
};

/// Rewards recorded on completion, waiting for the reward collaborator.
struct PendingReward {
    QuestId questId;
    RewardList rewards;
    TimePoint completedAt{};
};

/// Serializable export of every instance a player owns.
struct PlayerQuestSnapshot {
    foundation::PlayerId playerId;
    std::vector<QuestInstance> instances;
};

}  // namespace qe::quest
