/// @file definition_registry.cpp
/// @brief QuestDefinitionRegistry validation and lookup.

#include "qe/quest/definition_registry.hpp"

#include <string>
#include <unordered_set>

#include "qe/foundation/game_logger.hpp"

namespace qe::quest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<QuestDefinitionRegistry> invalid(const QuestId& id, const std::string& why) {
    auto message = "quest '" + id + "': " + why;
    QE_LOG_ERROR(LogCategory::Config, message);
    return GameResult<QuestDefinitionRegistry>::err(
        GameError(ErrorCode::InvalidDefinition, std::move(message)));
}

/// Quest id referenced by a condition, or nullptr for non-quest conditions.
const QuestId* referencedQuest(const Condition& condition) {
    if (const auto* completed = std::get_if<QuestCompletedCondition>(&condition)) {
        return &completed->questId;
    }
    if (const auto* choice = std::get_if<QuestChoiceCondition>(&condition)) {
        return &choice->questId;
    }
    return nullptr;
}

}  // namespace

GameResult<QuestDefinitionRegistry> QuestDefinitionRegistry::create(
    std::vector<QuestDefinition> definitions) {
    std::unordered_set<QuestId> ids;
    for (const auto& def : definitions) {
        if (def.id.empty()) {
            return invalid(def.id, "empty quest id");
        }
        if (!ids.insert(def.id).second) {
            return invalid(def.id, "duplicate quest id");
        }
    }

    for (const auto& def : definitions) {
        if (def.objectives.empty()) {
            return invalid(def.id, "no objectives");
        }
        if (def.objectives.size() > kMaxObjectivesPerQuest) {
            return invalid(def.id, "more than " + std::to_string(kMaxObjectivesPerQuest)
                                       + " objectives");
        }
        for (std::size_t i = 0; i < def.objectives.size(); ++i) {
            const auto& obj = def.objectives[i];
            if (obj.target.empty()) {
                return invalid(def.id, "objective " + std::to_string(i) + " has no target");
            }
            if (obj.required < 1) {
                return invalid(def.id, "objective " + std::to_string(i)
                                           + " requires fewer than 1");
            }
        }
        for (const auto& condition : def.prerequisites) {
            if (const auto* custom = std::get_if<CustomCondition>(&condition);
                custom && custom->kind.empty()) {
                return invalid(def.id, "custom condition without a kind");
            }
            const auto* ref = referencedQuest(condition);
            if (ref == nullptr) {
                continue;
            }
            if (*ref == def.id) {
                return invalid(def.id, "prerequisite references the quest itself");
            }
            if (!ids.contains(*ref)) {
                return invalid(def.id, "prerequisite references unknown quest '" + *ref + "'");
            }
        }
        for (const auto& [option, followUp] : def.branches) {
            if (option.empty() || !ids.contains(followUp)) {
                return invalid(def.id, "branch '" + option + "' leads to unknown quest '"
                                           + followUp + "'");
            }
        }
        if (def.timeLimit.count() < 0) {
            return invalid(def.id, "negative time limit");
        }
    }

    QuestDefinitionRegistry registry;
    registry.definitions_ = std::move(definitions);
    for (std::size_t i = 0; i < registry.definitions_.size(); ++i) {
        const auto& def = registry.definitions_[i];
        registry.index_.emplace(def.id, i);
        std::unordered_set<QuestId> seen;
        for (const auto& condition : def.prerequisites) {
            const auto* ref = referencedQuest(condition);
            if (ref != nullptr && seen.insert(*ref).second) {
                registry.dependents_[*ref].push_back(i);
            }
        }
    }

    QE_LOG_INFO(LogCategory::Config,
                "quest registry built with " + std::to_string(registry.size()) + " definitions");
    return GameResult<QuestDefinitionRegistry>::ok(std::move(registry));
}

const QuestDefinition* QuestDefinitionRegistry::find(std::string_view questId) const {
    auto it = index_.find(QuestId(questId));
    return it != index_.end() ? &definitions_[it->second] : nullptr;
}

std::vector<const QuestDefinition*> QuestDefinitionRegistry::dependentsOf(
    std::string_view questId) const {
    std::vector<const QuestDefinition*> result;
    auto it = dependents_.find(QuestId(questId));
    if (it == dependents_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (auto idx : it->second) {
        result.push_back(&definitions_[idx]);
    }
    return result;
}

}  // namespace qe::quest
