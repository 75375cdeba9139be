#pragma once

/// @file definition_loader.hpp
/// @brief YAML quest catalog loading.
///
/// Catalog layout:
/// @code
///   quests:
///     - id: moral_choice
///       name: "A Moral Choice"
///       giver: elder
///       prerequisites:
///         - { type: player_level, min: 3 }
///         - { type: quest_completed, quest: intro_quest }
///         - { type: custom, kind: faction, params: { name: guild } }
///       objectives:
///         - { kind: make_choice, target: help_or_harm }
///       rewards: { xp: 50 }
///       branches: { help: help_followup, harm: harm_followup }
///       time_limit_seconds: 600
/// @endcode

#include <filesystem>
#include <string_view>
#include <vector>

#include "qe/foundation/game_result.hpp"
#include "qe/quest/quest_definition.hpp"

namespace qe::quest {

/// Parse a quest catalog from YAML text.
///
/// @return The definitions in file order, ConfigLoadFailed for YAML syntax
///         errors, or InvalidDefinition for unknown kinds and missing or
///         mistyped fields. Semantic validation is left to
///         QuestDefinitionRegistry::create().
[[nodiscard]] foundation::GameResult<std::vector<QuestDefinition>> parseQuestDefinitions(
    std::string_view yamlText);

/// Load a quest catalog from a YAML file.
[[nodiscard]] foundation::GameResult<std::vector<QuestDefinition>> loadQuestDefinitions(
    const std::filesystem::path& path);

}  // namespace qe::quest
