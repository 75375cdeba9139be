#pragma once

/// @file condition.hpp
/// @brief Prerequisite conditions and the fact snapshot they are evaluated
///        against.
///
/// Conditions form a closed tagged variant with strongly typed fields.
/// Anything the engine does not model natively goes through
/// CustomCondition, resolved by a predicate registered on the evaluator.

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "qe/foundation/types.hpp"

namespace qe::quest {

using foundation::QuestId;

/// Player level must be at least minLevel.
struct PlayerLevelCondition {
    uint32_t minLevel = 0;
};

/// The given quest must have been completed.
struct QuestCompletedCondition {
    QuestId questId;
};

/// The given quest must have recorded a choice with the given option.
struct QuestChoiceCondition {
    QuestId questId;
    std::string option;
};

/// Host-defined condition identified by kind.
struct CustomCondition {
    std::string kind;
    std::map<std::string, std::string> parameters;
};

using Condition = std::variant<PlayerLevelCondition,
                               QuestCompletedCondition,
                               QuestChoiceCondition,
                               CustomCondition>;

/// Prerequisite set; satisfied when every condition holds.
using ConditionSet = std::vector<Condition>;

/// Read-only view of player facts consulted by the condition evaluator.
struct FactSnapshot {
    uint32_t playerLevel = 0;
    std::unordered_set<QuestId> completedQuests;
    /// quest id -> (choice id -> chosen option)
    std::unordered_map<QuestId, std::unordered_map<std::string, std::string>> choices;
    /// Free-form facts for custom conditions (faction, region, flags, ...).
    std::unordered_map<std::string, std::string> attributes;
};

/// Short human-readable form, used in diagnostics.
std::string describeCondition(const Condition& condition);

}  // namespace qe::quest
