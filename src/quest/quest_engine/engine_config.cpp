/// @file engine_config.cpp
/// @brief EngineConfig loading.

#include "qe/quest/engine_config.hpp"

#include <cstdint>

namespace qe::quest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

GameResult<EngineConfig> EngineConfig::fromConfig(const foundation::ConfigManager& config) {
    auto maxActive = config.getOr<int64_t>("engine.max_active_quests",
                                           static_cast<int64_t>(kMaxActiveQuests));
    if (maxActive.hasError()) {
        return GameResult<EngineConfig>::err(maxActive.error());
    }
    if (maxActive.value() < 1) {
        return GameResult<EngineConfig>::err(GameError(
            ErrorCode::ConfigInvalidValue, "engine.max_active_quests must be at least 1"));
    }

    EngineConfig result;
    result.maxActiveQuests = static_cast<std::size_t>(maxActive.value());
    return GameResult<EngineConfig>::ok(result);
}

}  // namespace qe::quest
