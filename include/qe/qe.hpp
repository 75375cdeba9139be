#pragma once

/// @file qe.hpp
/// @brief Convenience header pulling in the public quest engine API.

#include "qe/version.hpp"

#include "qe/foundation/config_manager.hpp"
#include "qe/foundation/error_code.hpp"
#include "qe/foundation/game_error.hpp"
#include "qe/foundation/game_logger.hpp"
#include "qe/foundation/game_result.hpp"
#include "qe/foundation/job_scheduler.hpp"
#include "qe/foundation/types.hpp"

#include "qe/dispatch/event_dispatcher.hpp"
#include "qe/dispatch/lifecycle_bus.hpp"

#include "qe/quest/condition.hpp"
#include "qe/quest/condition_evaluator.hpp"
#include "qe/quest/definition_loader.hpp"
#include "qe/quest/definition_registry.hpp"
#include "qe/quest/engine_config.hpp"
#include "qe/quest/fact_provider.hpp"
#include "qe/quest/gameplay_event.hpp"
#include "qe/quest/lifecycle_events.hpp"
#include "qe/quest/objective_tracker.hpp"
#include "qe/quest/quest_engine.hpp"
#include "qe/quest/quest_instance.hpp"
#include "qe/quest/quest_types.hpp"
