#pragma once

/// @file quest_definition.hpp
/// @brief Immutable quest templates: objectives, prerequisites, rewards.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "qe/quest/condition.hpp"
#include "qe/quest/quest_types.hpp"

namespace qe::quest {

/// One step of a quest's ordered completion sequence.
struct ObjectiveTemplate {
    ObjectiveKind kind = ObjectiveKind::TalkToNpc;
    std::string target;     ///< NPC id, item id or choice id depending on kind.
    int32_t required = 1;   ///< Count needed to satisfy the objective.
};

/// Reward key -> amount (e.g. "xp" -> 100, "item:potion" -> 2).
using RewardList = std::map<std::string, int64_t>;

/// Static quest definition, shared read-only by every player.
///
/// Plain aggregate; QuestDefinitionRegistry::create() validates it.
struct QuestDefinition {
    QuestId id;
    std::string name;
    std::string description;
    std::vector<ObjectiveTemplate> objectives;
    ConditionSet prerequisites;
    RewardList rewards;
    std::optional<std::string> giver;           ///< Opaque quest-giver reference.
    std::map<std::string, QuestId> branches;    ///< Choice option -> follow-up quest.
    std::chrono::seconds timeLimit{0};          ///< 0 = no limit.

    [[nodiscard]] std::size_t objectiveCount() const noexcept { return objectives.size(); }

    [[nodiscard]] bool isTimed() const noexcept { return timeLimit.count() > 0; }

    /// Follow-up quest unlocked by choosing @p option, if any.
    [[nodiscard]] std::optional<QuestId> followUpFor(const std::string& option) const {
        auto it = branches.find(option);
        if (it == branches.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

}  // namespace qe::quest
