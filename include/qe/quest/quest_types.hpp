#pragma once

/// @file quest_types.hpp
/// @brief Enumerations and constants for the quest engine.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace qe::quest {

/// Default maximum number of Active quests per player.
constexpr std::size_t kMaxActiveQuests = 25;

/// Maximum number of objectives per quest definition.
constexpr std::size_t kMaxObjectivesPerQuest = 8;

/// Stored quest instance status.
///
/// Locked is implicit: a quest without an instance whose prerequisites do
/// not hold.
///
/// Available -> Active -> Completed
///     \          \-> Failed
///      \----------\-> Abandoned
enum class QuestStatus : uint8_t {
    Available,  ///< Offered to the player, not yet accepted.
    Active,     ///< Accepted, objectives in progress.
    Completed,  ///< Every objective satisfied.
    Failed,     ///< Failed explicitly or by time limit.
    Abandoned   ///< Dropped or declined by the player.
};

/// Objective kind; decides which gameplay event can advance it.
enum class ObjectiveKind : uint8_t {
    TalkToNpc,    ///< Interacted(npcId)
    CollectItem,  ///< ItemCollected(itemId, quantity)
    ReturnToNpc,  ///< Interacted(npcId), usually the quest giver
    MakeChoice    ///< ChoiceMade(choiceId, option)
};

/// Terminal statuses accept no further mutation.
constexpr bool isTerminal(QuestStatus status) noexcept {
    return status == QuestStatus::Completed
           || status == QuestStatus::Failed
           || status == QuestStatus::Abandoned;
}

constexpr std::string_view questStatusName(QuestStatus status) {
    switch (status) {
        case QuestStatus::Available: return "Available";
        case QuestStatus::Active:    return "Active";
        case QuestStatus::Completed: return "Completed";
        case QuestStatus::Failed:    return "Failed";
        case QuestStatus::Abandoned: return "Abandoned";
    }
    return "Unknown";
}

constexpr std::string_view objectiveKindName(ObjectiveKind kind) {
    switch (kind) {
        case ObjectiveKind::TalkToNpc:   return "talk_to_npc";
        case ObjectiveKind::CollectItem: return "collect_item";
        case ObjectiveKind::ReturnToNpc: return "return_to_npc";
        case ObjectiveKind::MakeChoice:  return "make_choice";
    }
    return "unknown";
}

}  // namespace qe::quest
