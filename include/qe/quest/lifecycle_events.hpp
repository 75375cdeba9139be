#pragma once

/// @file lifecycle_events.hpp
/// @brief Outbound lifecycle notifications emitted by the QuestEngine.
///
/// One event is delivered per committed transition. Subscribers (dialogue,
/// UI, persistence, rewards) register through EventDispatcher::subscribe<E>().

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "qe/foundation/types.hpp"
#include "qe/quest/quest_definition.hpp"

namespace qe::quest {

using foundation::PlayerId;

/// Prerequisites became satisfied, or the quest was offered.
struct QuestAvailable {
    PlayerId playerId;
    QuestId questId;
};

struct QuestAccepted {
    PlayerId playerId;
    QuestId questId;
};

struct QuestObjectiveProgressed {
    PlayerId playerId;
    QuestId questId;
    std::size_t objectiveIndex = 0;
    int32_t progress = 0;
    int32_t required = 0;
};

struct QuestCompleted {
    PlayerId playerId;
    QuestId questId;
    RewardList rewards;
};

struct QuestFailed {
    PlayerId playerId;
    QuestId questId;
    std::string reason;
};

struct QuestAbandoned {
    PlayerId playerId;
    QuestId questId;
};

struct QuestChoiceMade {
    PlayerId playerId;
    QuestId questId;
    std::string choiceId;
    std::string option;
    std::optional<QuestId> followUp;  ///< Branch target for this option, if any.
};

}  // namespace qe::quest
