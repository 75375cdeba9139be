#pragma once

/// @file gameplay_event.hpp
/// @brief Inbound gameplay events that drive objective progress.

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace qe::quest {

/// The player interacted with (talked to) an NPC.
struct Interacted {
    std::string npcId;
};

/// The player picked up @p quantity of an item.
struct ItemCollected {
    std::string itemId;
    int32_t quantity = 1;
};

/// The player picked @p option for a choice point.
struct ChoiceMade {
    std::string choiceId;
    std::string option;
};

/// The player entered the world; triggers an availability sweep.
struct PlayerJoined {};

using GameplayEvent = std::variant<Interacted, ItemCollected, ChoiceMade, PlayerJoined>;

inline std::string_view gameplayEventName(const GameplayEvent& event) {
    switch (event.index()) {
        case 0: return "Interacted";
        case 1: return "ItemCollected";
        case 2: return "ChoiceMade";
        case 3: return "PlayerJoined";
        default: return "Unknown";
    }
}

}  // namespace qe::quest
