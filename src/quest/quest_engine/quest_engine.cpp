/// @file quest_engine.cpp
/// @brief QuestEngine implementation.

#include "qe/quest/quest_engine.hpp"

#include <unordered_set>
#include <utility>
#include <variant>

#include "qe/foundation/game_logger.hpp"
#include "qe/quest/lifecycle_events.hpp"

namespace qe::quest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

GameResult<void> reject(ErrorCode code, std::string message) {
    return GameResult<void>::err(GameError(code, std::move(message)));
}

LogContext questContext(PlayerId player, const QuestId& questId) {
    LogContext ctx;
    ctx.playerId = player;
    ctx.questId = questId;
    return ctx;
}

QuestInstance makeInstance(const QuestDefinition& def) {
    QuestInstance instance;
    instance.questId = def.id;
    instance.status = QuestStatus::Available;
    instance.progress.assign(def.objectiveCount(), 0);
    return instance;
}

GameResult<void> corrupt(const QuestId& questId, std::string message) {
    LogContext ctx;
    ctx.questId = questId;
    ctx.extra["reason"] = message;
    QE_LOG_CTX(LogLevel::Warning, LogCategory::Persistence, "rejected corrupt snapshot", ctx);
    return reject(ErrorCode::CorruptSnapshot, std::move(message));
}

}  // namespace

// -- Construction -------------------------------------------------------------

QuestEngine::QuestEngine(const QuestDefinitionRegistry& registry,
                         const ConditionEvaluator& evaluator,
                         dispatch::EventDispatcher& dispatcher,
                         const FactProvider& facts,
                         EngineConfig config,
                         ClockFunc clock)
    : registry_(registry),
      evaluator_(evaluator),
      dispatcher_(dispatcher),
      facts_(facts),
      config_(config),
      clock_(std::move(clock)) {
    if (config_.maxActiveQuests == 0) {
        QE_LOG_WARN(LogCategory::Quest, "max active quests of 0 replaced by the default");
        config_.maxActiveQuests = kMaxActiveQuests;
    }
    dispatcher_.attach(*this);
    QE_LOG_INFO(LogCategory::Quest,
                "quest engine ready with " + std::to_string(registry_.size()) + " definitions");
}

QuestEngine::~QuestEngine() {
    dispatcher_.detach();
}

// -- Commands -----------------------------------------------------------------

GameResult<void> QuestEngine::offerQuest(PlayerId player, const QuestId& questId) {
    const auto* def = registry_.find(questId);
    if (def == nullptr) {
        return reject(ErrorCode::NotFound, "unknown quest: " + questId);
    }

    auto lease = store_.acquire(player);
    auto& state = lease.state();
    if (const auto* existing = state.find(questId)) {
        if (existing->isTerminal()) {
            return reject(ErrorCode::InstanceTerminal, "quest already finished: " + questId);
        }
        if (existing->status == QuestStatus::Active) {
            return reject(ErrorCode::AlreadyActive, "quest already active: " + questId);
        }
        return GameResult<void>::ok();
    }

    if (!evaluator_.evaluate(def->prerequisites, buildFacts(player, state))) {
        return reject(ErrorCode::NotAvailable, "prerequisites not met: " + questId);
    }

    state.instances.push_back(makeInstance(*def));
    if (state.announced.insert(questId).second) {
        dispatcher_.enqueueLifecycle(QuestAvailable{player, questId});
    }
    lease.release();

    QE_LOG_CTX(LogLevel::Info, LogCategory::Quest, "quest offered",
               questContext(player, questId));
    dispatcher_.deliverLifecycle();
    return GameResult<void>::ok();
}

GameResult<void> QuestEngine::acceptQuest(PlayerId player, const QuestId& questId) {
    const auto* def = registry_.find(questId);
    if (def == nullptr) {
        return reject(ErrorCode::NotFound, "unknown quest: " + questId);
    }

    auto lease = store_.acquire(player);
    auto& state = lease.state();
    auto* instance = state.find(questId);
    if (instance != nullptr) {
        if (instance->isTerminal()) {
            return reject(ErrorCode::InstanceTerminal, "quest already finished: " + questId);
        }
        if (instance->status == QuestStatus::Active) {
            return reject(ErrorCode::AlreadyActive, "quest already active: " + questId);
        }
    }

    if (!evaluator_.evaluate(def->prerequisites, buildFacts(player, state))) {
        return reject(ErrorCode::NotAvailable, "prerequisites not met: " + questId);
    }
    if (state.activeCount() >= config_.maxActiveQuests) {
        return reject(ErrorCode::CapacityExceeded,
                      "active quest limit of " + std::to_string(config_.maxActiveQuests)
                          + " reached");
    }

    if (instance == nullptr) {
        state.instances.push_back(makeInstance(*def));
        instance = &state.instances.back();
    }
    instance->status = QuestStatus::Active;
    instance->currentObjective = 0;
    instance->progress.assign(def->objectiveCount(), 0);
    instance->acceptedAt = now();
    state.announced.erase(questId);

    dispatcher_.enqueueLifecycle(QuestAccepted{player, questId});
    lease.release();

    QE_LOG_CTX(LogLevel::Info, LogCategory::Quest, "quest accepted",
               questContext(player, questId));
    dispatcher_.deliverLifecycle();
    return GameResult<void>::ok();
}

GameResult<void> QuestEngine::abandonQuest(PlayerId player, const QuestId& questId) {
    if (!registry_.contains(questId)) {
        return reject(ErrorCode::NotFound, "unknown quest: " + questId);
    }

    auto lease = store_.acquire(player);
    auto* instance = lease.state().find(questId);
    if (instance == nullptr) {
        return reject(ErrorCode::NotFound, "no instance of quest: " + questId);
    }
    if (instance->isTerminal()) {
        return reject(ErrorCode::InstanceTerminal, "quest already finished: " + questId);
    }

    instance->status = QuestStatus::Abandoned;
    instance->abandonedAt = now();
    dispatcher_.enqueueLifecycle(QuestAbandoned{player, questId});
    lease.release();

    QE_LOG_CTX(LogLevel::Info, LogCategory::Quest, "quest abandoned",
               questContext(player, questId));
    dispatcher_.deliverLifecycle();
    return GameResult<void>::ok();
}

GameResult<void> QuestEngine::failQuest(PlayerId player, const QuestId& questId,
                                        std::string reason) {
    if (!registry_.contains(questId)) {
        return reject(ErrorCode::NotFound, "unknown quest: " + questId);
    }

    auto lease = store_.acquire(player);
    auto* instance = lease.state().find(questId);
    if (instance == nullptr) {
        return reject(ErrorCode::NotFound, "no instance of quest: " + questId);
    }
    if (instance->isTerminal()) {
        return reject(ErrorCode::InstanceTerminal, "quest already finished: " + questId);
    }
    if (instance->status != QuestStatus::Active) {
        return reject(ErrorCode::NotActive, "quest not active: " + questId);
    }

    instance->status = QuestStatus::Failed;
    instance->failedAt = now();

    auto ctx = questContext(player, questId);
    ctx.extra["reason"] = reason;
    dispatcher_.enqueueLifecycle(QuestFailed{player, questId, std::move(reason)});
    lease.release();

    QE_LOG_CTX(LogLevel::Info, LogCategory::Quest, "quest failed", ctx);
    dispatcher_.deliverLifecycle();
    return GameResult<void>::ok();
}

GameResult<std::optional<ObjectiveDelta>> QuestEngine::applyEventToQuest(
    PlayerId player, const QuestId& questId, const GameplayEvent& event) {
    using DeltaResult = GameResult<std::optional<ObjectiveDelta>>;

    const auto* def = registry_.find(questId);
    if (def == nullptr) {
        return DeltaResult::err(GameError(ErrorCode::NotFound, "unknown quest: " + questId));
    }

    auto lease = store_.acquire(player);
    auto& state = lease.state();
    auto* instance = state.find(questId);
    if (instance == nullptr) {
        return DeltaResult::err(
            GameError(ErrorCode::NotFound, "no instance of quest: " + questId));
    }
    if (instance->isTerminal()) {
        return DeltaResult::err(
            GameError(ErrorCode::InstanceTerminal, "quest already finished: " + questId));
    }
    if (instance->status != QuestStatus::Active) {
        return DeltaResult::err(GameError(ErrorCode::NotActive, "quest not active: " + questId));
    }

    auto delta = tracker_.apply(*instance, *def, event);
    if (delta) {
        commitDelta(player, state, *instance, *def, *delta);
    }
    lease.release();

    dispatcher_.deliverLifecycle();
    return DeltaResult::ok(std::move(delta));
}

std::size_t QuestEngine::applyEvent(PlayerId player, const GameplayEvent& event) {
    if (std::holds_alternative<PlayerJoined>(event)) {
        refreshAvailability(player);
        return 0;
    }

    auto lease = store_.acquire(player);
    auto& state = lease.state();
    std::size_t advanced = 0;
    for (auto& instance : state.instances) {
        if (instance.status != QuestStatus::Active) {
            continue;
        }
        const auto* def = registry_.find(instance.questId);
        if (def == nullptr) {
            continue;
        }
        auto delta = tracker_.apply(instance, *def, event);
        if (!delta) {
            continue;
        }
        commitDelta(player, state, instance, *def, *delta);
        ++advanced;
    }
    lease.release();

    dispatcher_.deliverLifecycle();
    return advanced;
}

std::size_t QuestEngine::refreshAvailability(PlayerId player) {
    std::vector<const QuestDefinition*> candidates;
    candidates.reserve(registry_.size());
    for (const auto& def : registry_.definitions()) {
        candidates.push_back(&def);
    }

    auto lease = store_.acquire(player);
    auto announced = announceAvailability(player, lease.state(), candidates);
    lease.release();

    dispatcher_.deliverLifecycle();
    return announced;
}

std::size_t QuestEngine::expireTimedQuests(TimePoint now) {
    std::size_t expired = 0;
    for (auto player : store_.players()) {
        auto lease = store_.find(player);
        if (!lease) {
            continue;
        }
        for (auto& instance : lease->state().instances) {
            if (instance.status != QuestStatus::Active || !instance.acceptedAt) {
                continue;
            }
            const auto* def = registry_.find(instance.questId);
            if (def == nullptr || !def->isTimed()) {
                continue;
            }
            if (*instance.acceptedAt + def->timeLimit > now) {
                continue;
            }

            instance.status = QuestStatus::Failed;
            instance.failedAt = now;
            dispatcher_.enqueueLifecycle(
                QuestFailed{player, instance.questId, kTimeLimitExpiredReason});
            QE_LOG_CTX(LogLevel::Info, LogCategory::Quest, "timed quest expired",
                       questContext(player, instance.questId));
            ++expired;
        }
        lease->release();
        dispatcher_.deliverLifecycle();
    }
    return expired;
}

std::vector<PendingReward> QuestEngine::takePendingRewards(PlayerId player) {
    std::vector<PendingReward> rewards;
    auto lease = store_.find(player);
    if (lease) {
        rewards.swap(lease->state().pendingRewards);
    }
    return rewards;
}

// -- Queries ------------------------------------------------------------------

std::vector<QuestInstance> QuestEngine::listActiveQuests(PlayerId player) {
    std::vector<QuestInstance> active;
    auto lease = store_.find(player);
    if (!lease) {
        return active;
    }
    for (const auto& instance : lease->state().instances) {
        if (instance.status == QuestStatus::Active) {
            active.push_back(instance);
        }
    }
    return active;
}

std::vector<QuestId> QuestEngine::listAvailableQuests(PlayerId player) {
    PlayerQuestState empty;
    auto lease = store_.find(player);
    const PlayerQuestState& state = lease ? lease->state() : empty;

    const auto facts = buildFacts(player, state);
    std::vector<QuestId> available;
    for (const auto& def : registry_.definitions()) {
        if (availableLocked(def, state, facts)) {
            available.push_back(def.id);
        }
    }
    return available;
}

GameResult<QuestInstance> QuestEngine::getProgress(PlayerId player, const QuestId& questId) {
    auto lease = store_.find(player);
    const QuestInstance* instance = lease ? lease->state().find(questId) : nullptr;
    if (instance == nullptr) {
        return GameResult<QuestInstance>::err(
            GameError(ErrorCode::NotFound, "no instance of quest: " + questId));
    }
    return GameResult<QuestInstance>::ok(*instance);
}

bool QuestEngine::isAvailable(PlayerId player, const QuestId& questId) {
    const auto* def = registry_.find(questId);
    if (def == nullptr) {
        return false;
    }
    PlayerQuestState empty;
    auto lease = store_.find(player);
    const PlayerQuestState& state = lease ? lease->state() : empty;
    return availableLocked(*def, state, buildFacts(player, state));
}

// -- Persistence --------------------------------------------------------------

PlayerQuestSnapshot QuestEngine::exportState(PlayerId player) {
    PlayerQuestSnapshot snapshot;
    snapshot.playerId = player;
    auto lease = store_.find(player);
    if (lease) {
        snapshot.instances = lease->state().instances;
    }
    return snapshot;
}

GameResult<void> QuestEngine::restoreState(PlayerId player, const PlayerQuestSnapshot& snapshot) {
    if (snapshot.playerId != player) {
        LogContext ctx;
        ctx.playerId = player;
        QE_LOG_CTX(LogLevel::Warning, LogCategory::Persistence,
                   "snapshot belongs to another player", ctx);
        return reject(ErrorCode::CorruptSnapshot, "snapshot belongs to another player");
    }
    if (auto valid = validateSnapshot(snapshot); valid.hasError()) {
        return valid;
    }

    auto lease = store_.acquire(player);
    lease->instances = snapshot.instances;
    lease->announced.clear();
    lease.release();

    LogContext ctx;
    ctx.playerId = player;
    ctx.extra["instances"] = std::to_string(snapshot.instances.size());
    QE_LOG_CTX(LogLevel::Info, LogCategory::Persistence, "player quest state restored", ctx);
    return GameResult<void>::ok();
}

GameResult<void> QuestEngine::validateSnapshot(const PlayerQuestSnapshot& snapshot) const {
    std::unordered_set<QuestId> seen;
    for (const auto& record : snapshot.instances) {
        const auto* def = registry_.find(record.questId);
        if (def == nullptr) {
            return corrupt(record.questId, "unknown quest '" + record.questId + "'");
        }
        if (!seen.insert(record.questId).second) {
            return corrupt(record.questId, "duplicate record for '" + record.questId + "'");
        }

        const auto count = def->objectiveCount();
        const auto index = record.currentObjective;
        if (index > count) {
            return corrupt(record.questId, "objective index " + std::to_string(index)
                                               + " exceeds objective count "
                                               + std::to_string(count));
        }
        if (record.progress.size() != count) {
            return corrupt(record.questId, "progress has " + std::to_string(record.progress.size())
                                               + " entries, expected " + std::to_string(count));
        }

        switch (record.status) {
            case QuestStatus::Available:
                if (index != 0) {
                    return corrupt(record.questId, "available instance has advanced");
                }
                break;
            case QuestStatus::Completed:
                if (index != count) {
                    return corrupt(record.questId, "completed instance has open objectives");
                }
                break;
            case QuestStatus::Active:
            case QuestStatus::Failed:
            case QuestStatus::Abandoned:
                if (index >= count) {
                    return corrupt(record.questId,
                                   std::string(questStatusName(record.status))
                                       + " instance has every objective satisfied");
                }
                break;
        }

        for (std::size_t i = 0; i < count; ++i) {
            const auto& objective = def->objectives[i];
            const auto value = record.progress[i];
            if (value < 0 || value > objective.required) {
                return corrupt(record.questId,
                               "progress out of bounds at objective " + std::to_string(i));
            }
            if (i < index && value != objective.required) {
                return corrupt(record.questId,
                               "passed objective " + std::to_string(i) + " is not satisfied");
            }
            if (i > index && value != 0) {
                return corrupt(record.questId,
                               "future objective " + std::to_string(i) + " has progress");
            }
            if (i < index && objective.kind == ObjectiveKind::MakeChoice
                && !record.choices.contains(objective.target)) {
                return corrupt(record.questId, "choice '" + objective.target + "' not recorded");
            }
        }
        if (record.status == QuestStatus::Available && record.progress[0] != 0) {
            return corrupt(record.questId, "available instance has progress");
        }
    }
    return GameResult<void>::ok();
}

// -- GameplayEventHandler -----------------------------------------------------

void QuestEngine::onGameplayEvent(PlayerId player, const GameplayEvent& event) {
    const auto advanced = applyEvent(player, event);
    if (advanced == 0 && !std::holds_alternative<PlayerJoined>(event)) {
        LogContext ctx;
        ctx.playerId = player;
        ctx.extra["event"] = std::string(gameplayEventName(event));
        QE_LOG_CTX(LogLevel::Debug, LogCategory::Objective,
                   "gameplay event matched no active objective", ctx);
    }
}

// -- Internals ----------------------------------------------------------------

FactSnapshot QuestEngine::buildFacts(PlayerId player, const PlayerQuestState& state) const {
    auto facts = facts_.getSnapshot(player);
    for (const auto& instance : state.instances) {
        if (instance.status == QuestStatus::Completed) {
            facts.completedQuests.insert(instance.questId);
        }
        for (const auto& [choiceId, option] : instance.choices) {
            facts.choices[instance.questId][choiceId] = option;
        }
    }
    return facts;
}

bool QuestEngine::availableLocked(const QuestDefinition& def, const PlayerQuestState& state,
                                  const FactSnapshot& facts) const {
    if (const auto* instance = state.find(def.id);
        instance != nullptr && instance->status != QuestStatus::Available) {
        return false;
    }
    return evaluator_.evaluate(def.prerequisites, facts);
}

std::size_t QuestEngine::announceAvailability(
    PlayerId player, PlayerQuestState& state,
    const std::vector<const QuestDefinition*>& candidates) {
    const auto facts = buildFacts(player, state);
    std::size_t announced = 0;
    for (const auto* def : candidates) {
        if (!availableLocked(*def, state, facts)) {
            state.announced.erase(def->id);
            continue;
        }
        if (state.announced.insert(def->id).second) {
            dispatcher_.enqueueLifecycle(QuestAvailable{player, def->id});
            QE_LOG_CTX(LogLevel::Debug, LogCategory::Quest, "quest became available",
                       questContext(player, def->id));
            ++announced;
        }
    }
    return announced;
}

void QuestEngine::commitDelta(PlayerId player, PlayerQuestState& state, QuestInstance& instance,
                              const QuestDefinition& def, const ObjectiveDelta& delta) {
    instance.progress[delta.objectiveIndex] = delta.progress;
    if (delta.progress != delta.previous) {
        dispatcher_.enqueueLifecycle(QuestObjectiveProgressed{
            player, def.id, delta.objectiveIndex, delta.progress, delta.required});
    }

    std::optional<QuestId> followUp;
    if (delta.choice) {
        instance.choices[delta.choice->choiceId] = delta.choice->option;
        followUp = def.followUpFor(delta.choice->option);
        dispatcher_.enqueueLifecycle(QuestChoiceMade{
            player, def.id, delta.choice->choiceId, delta.choice->option, followUp});

        auto ctx = questContext(player, def.id);
        ctx.extra["choice"] = delta.choice->choiceId;
        ctx.extra["option"] = delta.choice->option;
        QE_LOG_CTX(LogLevel::Info, LogCategory::Objective, "choice recorded", ctx);
    }

    bool completed = false;
    if (delta.satisfied) {
        ++instance.currentObjective;
        if (instance.currentObjective == def.objectiveCount()) {
            const auto at = now();
            instance.status = QuestStatus::Completed;
            instance.completedAt = at;
            state.pendingRewards.push_back(PendingReward{def.id, def.rewards, at});
            dispatcher_.enqueueLifecycle(QuestCompleted{player, def.id, def.rewards});
            QE_LOG_CTX(LogLevel::Info, LogCategory::Quest, "quest completed",
                       questContext(player, def.id));
            completed = true;
        }
    }

    if (completed || delta.choice) {
        auto candidates = registry_.dependentsOf(def.id);
        if (followUp) {
            if (const auto* next = registry_.find(*followUp)) {
                candidates.push_back(next);
            }
        }
        announceAvailability(player, state, candidates);
    }
}

}  // namespace qe::quest
