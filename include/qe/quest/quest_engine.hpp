#pragma once

/// @file quest_engine.hpp
/// @brief QuestEngine: per-player quest state machine and progression.
///
/// Owns every quest instance and is their only writer. Consumes gameplay
/// events from the EventDispatcher, advances objectives through the
/// ObjectiveTracker, and publishes lifecycle events back on the dispatcher.

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "qe/dispatch/event_dispatcher.hpp"
#include "qe/foundation/game_result.hpp"
#include "qe/foundation/types.hpp"
#include "qe/quest/condition_evaluator.hpp"
#include "qe/quest/definition_registry.hpp"
#include "qe/quest/engine_config.hpp"
#include "qe/quest/fact_provider.hpp"
#include "qe/quest/gameplay_event.hpp"
#include "qe/quest/instance_store.hpp"
#include "qe/quest/objective_tracker.hpp"
#include "qe/quest/quest_instance.hpp"

namespace qe::quest {

/// Reason attached to QuestFailed when a timed quest runs out.
inline constexpr const char* kTimeLimitExpiredReason = "time limit expired";

/// Quest state machine.
///
/// States: Locked (no instance) -> Available -> Active -> Completed, with
/// terminal Failed (from Active) and Abandoned (from Active or Available).
///
/// Every command runs under the player's lease from QuestInstanceStore:
/// validate, mutate, enqueue lifecycle events, release, then deliver. A
/// command either commits fully or returns an error with state untouched.
/// Different players never share a lock.
///
/// The registry, evaluator and fact provider must outlive the engine and
/// are only read. The engine attaches itself to @p dispatcher as the
/// gameplay handler on construction and detaches on destruction.
///
/// Usage:
/// @code
///   auto registry = QuestDefinitionRegistry::create(loadQuestDefinitions(path).value());
///   ConditionEvaluator evaluator;
///   EventDispatcher dispatcher;
///   QuestEngine engine(registry.value(), evaluator, dispatcher, facts);
///
///   engine.acceptQuest(PlayerId(7), "intro_quest");
///   dispatcher.submitEvent(PlayerId(7), Interacted{"elder"});
///   dispatcher.processPending();
/// @endcode
class QuestEngine final : public dispatch::GameplayEventHandler {
public:
    using ClockFunc = std::function<TimePoint()>;

    /// @param clock  Time source for instance timestamps; system_clock when empty.
    QuestEngine(const QuestDefinitionRegistry& registry,
                const ConditionEvaluator& evaluator,
                dispatch::EventDispatcher& dispatcher,
                const FactProvider& facts,
                EngineConfig config = {},
                ClockFunc clock = {});
    ~QuestEngine() override;

    QuestEngine(const QuestEngine&) = delete;
    QuestEngine& operator=(const QuestEngine&) = delete;

    // -- Commands -------------------------------------------------------------

    /// Materialize an Available instance (a quest giver offers the quest).
    /// Offering an already offered quest succeeds without effect.
    /// @return NotFound, NotAvailable, AlreadyActive or InstanceTerminal.
    foundation::GameResult<void> offerQuest(PlayerId player, const QuestId& questId);

    /// Available -> Active. Emits QuestAccepted.
    /// @return NotFound, AlreadyActive, InstanceTerminal, NotAvailable or
    ///         CapacityExceeded.
    foundation::GameResult<void> acceptQuest(PlayerId player, const QuestId& questId);

    /// Active|Available -> Abandoned. Emits QuestAbandoned.
    /// @return NotFound if there is no instance, InstanceTerminal if already final.
    foundation::GameResult<void> abandonQuest(PlayerId player, const QuestId& questId);

    /// Active -> Failed. Emits QuestFailed with @p reason.
    /// @return NotFound, NotActive for an Available instance, InstanceTerminal.
    foundation::GameResult<void> failQuest(PlayerId player, const QuestId& questId,
                                           std::string reason);

    /// Apply @p event to one quest's current objective.
    /// @return The committed delta, or nullopt if the event did not match.
    ///         NotFound, NotActive or InstanceTerminal when the instance
    ///         cannot progress.
    foundation::GameResult<std::optional<ObjectiveDelta>> applyEventToQuest(
        PlayerId player, const QuestId& questId, const GameplayEvent& event);

    /// Apply @p event to every Active quest of @p player. PlayerJoined runs
    /// an availability refresh instead.
    /// @return Number of instances whose objective advanced.
    std::size_t applyEvent(PlayerId player, const GameplayEvent& event);

    /// Re-evaluate every locked quest for @p player and emit QuestAvailable
    /// for the newly available ones.
    /// @return Number of QuestAvailable events emitted.
    std::size_t refreshAvailability(PlayerId player);

    /// Fail every Active timed quest whose limit has elapsed at @p now.
    /// @return Number of instances failed.
    std::size_t expireTimedQuests(TimePoint now);

    /// Hand the player's pending completion rewards to the caller, once.
    std::vector<PendingReward> takePendingRewards(PlayerId player);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::vector<QuestInstance> listActiveQuests(PlayerId player);

    /// Quests whose prerequisites hold and that are not engaged past Available.
    [[nodiscard]] std::vector<QuestId> listAvailableQuests(PlayerId player);

    /// @return NotFound if the player has no instance of @p questId.
    [[nodiscard]] foundation::GameResult<QuestInstance> getProgress(PlayerId player,
                                                                    const QuestId& questId);

    /// False for unknown quests and for quests engaged past Available.
    [[nodiscard]] bool isAvailable(PlayerId player, const QuestId& questId);

    // -- Persistence ----------------------------------------------------------

    [[nodiscard]] PlayerQuestSnapshot exportState(PlayerId player);

    /// Replace @p player's instances with @p snapshot.
    /// @return CorruptSnapshot (state untouched) if any record is invalid.
    foundation::GameResult<void> restoreState(PlayerId player,
                                              const PlayerQuestSnapshot& snapshot);

    // -- GameplayEventHandler -------------------------------------------------

    void onGameplayEvent(PlayerId player, const GameplayEvent& event) override;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Provider snapshot with the player's own history layered on top.
    FactSnapshot buildFacts(PlayerId player, const PlayerQuestState& state) const;

    bool availableLocked(const QuestDefinition& def, const PlayerQuestState& state,
                         const FactSnapshot& facts) const;

    /// Emit QuestAvailable for candidates that just became available and
    /// re-arm the ones that no longer are.
    std::size_t announceAvailability(PlayerId player, PlayerQuestState& state,
                                     const std::vector<const QuestDefinition*>& candidates);

    /// Write @p delta into @p instance and enqueue the resulting events.
    void commitDelta(PlayerId player, PlayerQuestState& state, QuestInstance& instance,
                     const QuestDefinition& def, const ObjectiveDelta& delta);

    foundation::GameResult<void> validateSnapshot(const PlayerQuestSnapshot& snapshot) const;

    TimePoint now() const { return clock_ ? clock_() : Clock::now(); }

    const QuestDefinitionRegistry& registry_;
    const ConditionEvaluator& evaluator_;
    dispatch::EventDispatcher& dispatcher_;
    const FactProvider& facts_;
    EngineConfig config_;
    ClockFunc clock_;

    ObjectiveTracker tracker_;
    QuestInstanceStore store_;
};

}  // namespace qe::quest
