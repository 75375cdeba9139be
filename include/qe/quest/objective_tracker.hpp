#pragma once

/// @file objective_tracker.hpp
/// @brief Matches gameplay events against a quest's current objective.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "qe/quest/gameplay_event.hpp"
#include "qe/quest/quest_definition.hpp"
#include "qe/quest/quest_instance.hpp"

namespace qe::quest {

/// Option picked for a make-choice objective.
struct ChoiceRecord {
    std::string choiceId;
    std::string option;
};

/// Progress change computed for the current objective.
struct ObjectiveDelta {
    std::size_t objectiveIndex = 0;
    int32_t previous = 0;
    int32_t progress = 0;      ///< New count, clamped to required.
    int32_t required = 0;
    bool satisfied = false;    ///< Objective became satisfied by this event.
    std::optional<ChoiceRecord> choice;
};

/// Stateless objective matcher.
///
/// Only the current objective is considered: events for later objectives
/// are ignored, not buffered, so objectives complete in declared order.
/// The tracker computes the delta; the QuestEngine commits it.
class ObjectiveTracker {
public:
    /// Compute the effect of @p event on @p instance.
    ///
    /// @return nullopt when the instance is not Active, the event does not
    ///         match the current objective, the objective is already
    ///         satisfied, or the event carries a non-positive quantity.
    [[nodiscard]] std::optional<ObjectiveDelta> apply(const QuestInstance& instance,
                                                      const QuestDefinition& definition,
                                                      const GameplayEvent& event) const;
};

}  // namespace qe::quest
