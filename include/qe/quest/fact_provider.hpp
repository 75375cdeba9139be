#pragma once

/// @file fact_provider.hpp
/// @brief Host-side source of player facts for condition evaluation.

#include "qe/foundation/types.hpp"
#include "qe/quest/condition.hpp"

namespace qe::quest {

/// Supplies a fresh FactSnapshot for a player on every evaluation.
///
/// Called while the engine holds that player's lock, so implementations
/// must not call back into the engine. May be called from any dispatcher
/// worker thread.
class FactProvider {
public:
    virtual ~FactProvider() = default;

    [[nodiscard]] virtual FactSnapshot getSnapshot(foundation::PlayerId player) const = 0;
};

}  // namespace qe::quest
