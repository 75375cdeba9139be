#pragma once

/// @file definition_registry.hpp
/// @brief Immutable, validated catalog of quest definitions.

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "qe/foundation/game_result.hpp"
#include "qe/quest/quest_definition.hpp"

namespace qe::quest {

/// Read-only quest catalog.
///
/// Built once through create(), which rejects the whole catalog if any
/// definition is malformed. After construction nothing mutates it, so it is
/// shared between threads without locking.
class QuestDefinitionRegistry {
public:
    /// Validate @p definitions and build the catalog.
    ///
    /// Rejected with InvalidDefinition: empty or duplicate ids, no
    /// objectives, more than kMaxObjectivesPerQuest objectives, empty
    /// objective targets, required counts below 1, prerequisites or branch
    /// targets naming unknown quests, a quest requiring itself, empty
    /// custom kinds and negative time limits.
    [[nodiscard]] static foundation::GameResult<QuestDefinitionRegistry> create(
        std::vector<QuestDefinition> definitions);

    /// Look up a definition, nullptr if unknown.
    [[nodiscard]] const QuestDefinition* find(std::string_view questId) const;

    [[nodiscard]] bool contains(std::string_view questId) const { return find(questId) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return definitions_.size(); }

    /// All definitions in registration order.
    [[nodiscard]] const std::vector<QuestDefinition>& definitions() const noexcept {
        return definitions_;
    }

    /// Definitions whose prerequisites reference @p questId through a
    /// quest-completed or quest-choice condition.
    [[nodiscard]] std::vector<const QuestDefinition*> dependentsOf(std::string_view questId) const;

private:
    QuestDefinitionRegistry() = default;

    std::vector<QuestDefinition> definitions_;
    std::unordered_map<QuestId, std::size_t> index_;
    std::unordered_map<QuestId, std::vector<std::size_t>> dependents_;
};

}  // namespace qe::quest
