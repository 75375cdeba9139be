#pragma once

/// @file engine_config.hpp
/// @brief Tunables for QuestEngine.

#include <cstddef>

#include "qe/foundation/config_manager.hpp"
#include "qe/foundation/game_result.hpp"
#include "qe/quest/quest_types.hpp"

namespace qe::quest {

struct EngineConfig {
    /// Upper bound on simultaneously Active instances per player.
    std::size_t maxActiveQuests = kMaxActiveQuests;

    /// Read "engine.max_active_quests" (default kMaxActiveQuests).
    /// @return ConfigTypeMismatch or ConfigInvalidValue if the value is not
    ///         a positive integer.
    [[nodiscard]] static foundation::GameResult<EngineConfig> fromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace qe::quest
