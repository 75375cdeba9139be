/// @file objective_tracker.cpp
/// @brief ObjectiveTracker implementation.

#include "qe/quest/objective_tracker.hpp"

namespace qe::quest {

namespace {

/// Amount an event contributes to @p objective, 0 when it does not match.
int32_t matchAmount(const ObjectiveTemplate& objective, const GameplayEvent& event,
                    std::optional<ChoiceRecord>& choice) {
    switch (objective.kind) {
        case ObjectiveKind::TalkToNpc:
        case ObjectiveKind::ReturnToNpc:
            if (const auto* e = std::get_if<Interacted>(&event); e && e->npcId == objective.target) {
                return 1;
            }
            return 0;
        case ObjectiveKind::CollectItem:
            if (const auto* e = std::get_if<ItemCollected>(&event);
                e && e->itemId == objective.target && e->quantity > 0) {
                return e->quantity;
            }
            return 0;
        case ObjectiveKind::MakeChoice:
            if (const auto* e = std::get_if<ChoiceMade>(&event);
                e && e->choiceId == objective.target && !e->option.empty()) {
                choice = ChoiceRecord{e->choiceId, e->option};
                return 1;
            }
            return 0;
    }
    return 0;
}

}  // namespace

std::optional<ObjectiveDelta> ObjectiveTracker::apply(const QuestInstance& instance,
                                                      const QuestDefinition& definition,
                                                      const GameplayEvent& event) const {
    if (instance.status != QuestStatus::Active) {
        return std::nullopt;
    }
    const auto index = instance.currentObjective;
    if (index >= definition.objectives.size() || index >= instance.progress.size()) {
        return std::nullopt;
    }

    const auto& objective = definition.objectives[index];
    const auto current = instance.progress[index];
    if (current >= objective.required) {
        return std::nullopt;
    }

    std::optional<ChoiceRecord> choice;
    const auto amount = matchAmount(objective, event, choice);
    if (amount <= 0) {
        return std::nullopt;
    }

    ObjectiveDelta delta;
    delta.objectiveIndex = index;
    delta.previous = current;
    // Clamp without overflowing on huge quantities.
    delta.progress = amount >= objective.required - current ? objective.required
                                                            : current + amount;
    delta.required = objective.required;
    delta.satisfied = delta.progress >= objective.required;
    delta.choice = std::move(choice);
    return delta;
}

}  // namespace qe::quest
