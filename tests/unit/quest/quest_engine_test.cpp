#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "qe/dispatch/event_dispatcher.hpp"
#include "qe/foundation/config_manager.hpp"
#include "qe/quest/quest_engine.hpp"
#include "quest/quest_test_support.hpp"

using namespace qe::foundation;
using namespace qe::quest;
using qe::dispatch::EventDispatcher;
using namespace std::chrono_literals;

namespace {

const PlayerId kPlayer{1};
const PlayerId kOtherPlayer{2};

}  // namespace

class QuestEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = QuestDefinitionRegistry::create(test::standardCatalog());
        ASSERT_TRUE(registry.hasValue());
        registry_ = std::make_unique<QuestDefinitionRegistry>(std::move(registry).value());
        recorder_ = std::make_unique<test::LifecycleRecorder>(dispatcher_);
        makeEngine(EngineConfig{});
    }

    void makeEngine(EngineConfig config) {
        engine_.reset();
        engine_ = std::make_unique<QuestEngine>(*registry_, evaluator_, dispatcher_, facts_, config,
                                                [this] { return now_; });
    }

    /// Route an event through the dispatcher and drain it.
    void send(const GameplayEvent& event, PlayerId player = kPlayer) {
        ASSERT_TRUE(dispatcher_.submitEvent(player, event).hasValue());
        dispatcher_.processPending();
    }

    QuestInstance progress(const QuestId& questId, PlayerId player = kPlayer) {
        auto result = engine_->getProgress(player, questId);
        EXPECT_TRUE(result.hasValue()) << questId;
        return result.hasValue() ? result.value() : QuestInstance{};
    }

    TimePoint now_ = TimePoint{} + 1000h;
    ConditionEvaluator evaluator_;
    EventDispatcher dispatcher_;
    test::TestFacts facts_;
    std::unique_ptr<QuestDefinitionRegistry> registry_;
    std::unique_ptr<test::LifecycleRecorder> recorder_;
    std::unique_ptr<QuestEngine> engine_;
};

// =============================================================================
// Reference scenarios
// =============================================================================

TEST_F(QuestEngineTest, TalkToElderCompletesIntroQuest) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    auto accepted = progress("intro_quest");
    EXPECT_EQ(accepted.status, QuestStatus::Active);
    EXPECT_EQ(accepted.currentObjective, 0u);
    EXPECT_EQ(accepted.acceptedAt, now_);

    send(Interacted{"elder"});

    auto done = progress("intro_quest");
    EXPECT_EQ(done.status, QuestStatus::Completed);
    EXPECT_EQ(done.currentObjective, 1u);
    EXPECT_EQ(done.progress, std::vector<int32_t>{1});
    EXPECT_EQ(done.completedAt, now_);

    EXPECT_EQ(recorder_->count("completed:intro_quest"), 1u);
    ASSERT_EQ(recorder_->completed().size(), 1u);
    EXPECT_EQ(recorder_->completed()[0].rewards.at("xp"), 100);

    EXPECT_EQ(recorder_->events(),
              (std::vector<std::string>{"accepted:intro_quest", "progressed:intro_quest",
                                        "completed:intro_quest", "available:sequel_quest"}));
}

TEST_F(QuestEngineTest, LevelGateControlsAvailability) {
    facts_.setLevel(kPlayer, 5);
    EXPECT_FALSE(engine_->isAvailable(kPlayer, "advanced_quest"));

    auto rejected = engine_->acceptQuest(kPlayer, "advanced_quest");
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::NotAvailable);
    EXPECT_FALSE(engine_->getProgress(kPlayer, "advanced_quest").hasValue());

    facts_.setLevel(kPlayer, 10);
    EXPECT_TRUE(engine_->isAvailable(kPlayer, "advanced_quest"));
    EXPECT_TRUE(engine_->acceptQuest(kPlayer, "advanced_quest").hasValue());
}

TEST_F(QuestEngineTest, RepeatedCollectionDoesNotAdvance) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "scroll_quest").hasValue());

    send(ItemCollected{"scroll", 1});
    auto first = progress("scroll_quest");
    EXPECT_EQ(first.progress[0], 1);
    EXPECT_EQ(first.status, QuestStatus::Completed);

    send(ItemCollected{"scroll", 1});
    auto second = progress("scroll_quest");
    EXPECT_EQ(second.progress[0], 1);
    EXPECT_EQ(second.currentObjective, 1u);
    EXPECT_EQ(recorder_->count("progressed:scroll_quest"), 1u);
    EXPECT_EQ(recorder_->count("completed:scroll_quest"), 1u);
}

TEST_F(QuestEngineTest, ChoiceUnlocksFollowUpForThatPlayerOnly) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "moral_choice").hasValue());
    ASSERT_TRUE(engine_->acceptQuest(kOtherPlayer, "moral_choice").hasValue());
    recorder_->clear();

    send(ChoiceMade{"help_or_harm", "help"});

    auto instance = progress("moral_choice");
    EXPECT_EQ(instance.status, QuestStatus::Completed);
    EXPECT_EQ(instance.choices.at("help_or_harm"), "help");

    ASSERT_EQ(recorder_->choices().size(), 1u);
    const auto& made = recorder_->choices()[0];
    EXPECT_EQ(made.choiceId, "help_or_harm");
    EXPECT_EQ(made.option, "help");
    ASSERT_TRUE(made.followUp.has_value());
    EXPECT_EQ(*made.followUp, "help_followup");

    EXPECT_EQ(recorder_->events(),
              (std::vector<std::string>{"progressed:moral_choice", "choice:moral_choice",
                                        "completed:moral_choice", "available:help_followup"}));

    EXPECT_TRUE(engine_->isAvailable(kPlayer, "help_followup"));
    EXPECT_FALSE(engine_->isAvailable(kPlayer, "harm_followup"));
    EXPECT_FALSE(engine_->isAvailable(kOtherPlayer, "help_followup"));
    EXPECT_TRUE(engine_->acceptQuest(kPlayer, "help_followup").hasValue());
}

// =============================================================================
// Accept / offer
// =============================================================================

TEST_F(QuestEngineTest, AcceptErrors) {
    auto unknown = engine_->acceptQuest(kPlayer, "no_such_quest");
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::NotFound);

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    auto twice = engine_->acceptQuest(kPlayer, "intro_quest");
    ASSERT_TRUE(twice.hasError());
    EXPECT_EQ(twice.error().code(), ErrorCode::AlreadyActive);

    send(Interacted{"elder"});
    auto finished = engine_->acceptQuest(kPlayer, "intro_quest");
    ASSERT_TRUE(finished.hasError());
    EXPECT_EQ(finished.error().code(), ErrorCode::InstanceTerminal);
    EXPECT_EQ(recorder_->count("accepted:intro_quest"), 1u);
}

TEST_F(QuestEngineTest, CapacityLimitsActiveQuests) {
    makeEngine(EngineConfig{2});
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "scroll_quest").hasValue());

    auto full = engine_->acceptQuest(kPlayer, "gather_quest");
    ASSERT_TRUE(full.hasError());
    EXPECT_EQ(full.error().code(), ErrorCode::CapacityExceeded);
    EXPECT_FALSE(engine_->getProgress(kPlayer, "gather_quest").hasValue());

    // Other players have their own budget.
    EXPECT_TRUE(engine_->acceptQuest(kOtherPlayer, "gather_quest").hasValue());

    ASSERT_TRUE(engine_->abandonQuest(kPlayer, "scroll_quest").hasValue());
    EXPECT_TRUE(engine_->acceptQuest(kPlayer, "gather_quest").hasValue());
}

TEST_F(QuestEngineTest, ZeroCapacityFallsBackToDefault) {
    makeEngine(EngineConfig{0});
    EXPECT_EQ(engine_->config().maxActiveQuests, kMaxActiveQuests);
}

TEST_F(QuestEngineTest, OfferCreatesAvailableInstance) {
    ASSERT_TRUE(engine_->offerQuest(kPlayer, "intro_quest").hasValue());
    auto offered = progress("intro_quest");
    EXPECT_EQ(offered.status, QuestStatus::Available);
    EXPECT_EQ(offered.currentObjective, 0u);
    EXPECT_EQ(offered.progress, std::vector<int32_t>{0});
    EXPECT_FALSE(offered.acceptedAt.has_value());

    EXPECT_TRUE(engine_->offerQuest(kPlayer, "intro_quest").hasValue());
    EXPECT_EQ(recorder_->count("available:intro_quest"), 1u);
    EXPECT_TRUE(engine_->isAvailable(kPlayer, "intro_quest"));

    // Offered quests do not take events until accepted.
    send(Interacted{"elder"});
    EXPECT_EQ(progress("intro_quest").progress[0], 0);

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    auto active = engine_->offerQuest(kPlayer, "intro_quest");
    ASSERT_TRUE(active.hasError());
    EXPECT_EQ(active.error().code(), ErrorCode::AlreadyActive);
}

TEST_F(QuestEngineTest, OfferRequiresPrerequisites) {
    auto locked = engine_->offerQuest(kPlayer, "advanced_quest");
    ASSERT_TRUE(locked.hasError());
    EXPECT_EQ(locked.error().code(), ErrorCode::NotAvailable);

    auto unknown = engine_->offerQuest(kPlayer, "missing");
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::NotFound);
}

// =============================================================================
// Terminal transitions
// =============================================================================

TEST_F(QuestEngineTest, AbandonActiveOrOfferedQuest) {
    auto none = engine_->abandonQuest(kPlayer, "scroll_quest");
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code(), ErrorCode::NotFound);

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "scroll_quest").hasValue());
    ASSERT_TRUE(engine_->abandonQuest(kPlayer, "scroll_quest").hasValue());
    auto abandoned = progress("scroll_quest");
    EXPECT_EQ(abandoned.status, QuestStatus::Abandoned);
    EXPECT_EQ(abandoned.abandonedAt, now_);
    EXPECT_EQ(recorder_->count("abandoned:scroll_quest"), 1u);

    ASSERT_TRUE(engine_->offerQuest(kPlayer, "gather_quest").hasValue());
    ASSERT_TRUE(engine_->abandonQuest(kPlayer, "gather_quest").hasValue());
    EXPECT_EQ(progress("gather_quest").status, QuestStatus::Abandoned);
    EXPECT_FALSE(engine_->isAvailable(kPlayer, "gather_quest"));
}

TEST_F(QuestEngineTest, TerminalInstancesNeverTransition) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "scroll_quest").hasValue());
    ASSERT_TRUE(engine_->abandonQuest(kPlayer, "scroll_quest").hasValue());
    const auto before = progress("scroll_quest");

    for (const auto& result : {engine_->abandonQuest(kPlayer, "scroll_quest"),
                               engine_->acceptQuest(kPlayer, "scroll_quest"),
                               engine_->offerQuest(kPlayer, "scroll_quest"),
                               engine_->failQuest(kPlayer, "scroll_quest", "late")}) {
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::InstanceTerminal);
    }
    auto applied = engine_->applyEventToQuest(kPlayer, "scroll_quest", ItemCollected{"scroll", 1});
    ASSERT_TRUE(applied.hasError());
    EXPECT_EQ(applied.error().code(), ErrorCode::InstanceTerminal);

    const auto after = progress("scroll_quest");
    EXPECT_EQ(after.status, before.status);
    EXPECT_EQ(after.progress, before.progress);
    EXPECT_EQ(recorder_->count("abandoned:scroll_quest"), 1u);
}

TEST_F(QuestEngineTest, FailQuest) {
    auto none = engine_->failQuest(kPlayer, "intro_quest", "x");
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code(), ErrorCode::NotFound);

    ASSERT_TRUE(engine_->offerQuest(kPlayer, "intro_quest").hasValue());
    auto offered = engine_->failQuest(kPlayer, "intro_quest", "x");
    ASSERT_TRUE(offered.hasError());
    EXPECT_EQ(offered.error().code(), ErrorCode::NotActive);

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    ASSERT_TRUE(engine_->failQuest(kPlayer, "intro_quest", "escort died").hasValue());

    auto failed = progress("intro_quest");
    EXPECT_EQ(failed.status, QuestStatus::Failed);
    EXPECT_EQ(failed.failedAt, now_);
    ASSERT_EQ(recorder_->failed().size(), 1u);
    EXPECT_EQ(recorder_->failed()[0].reason, "escort died");

    // A failed quest never counts as completed.
    EXPECT_FALSE(engine_->isAvailable(kPlayer, "sequel_quest"));
}

// =============================================================================
// Progress
// =============================================================================

TEST_F(QuestEngineTest, MultiStepQuestAdvancesInOrder) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "gather_quest").hasValue());

    send(Interacted{"elder"});  // too early, dropped
    send(ItemCollected{"herb", 3});
    send(ItemCollected{"herb", 3});

    auto mid = progress("gather_quest");
    EXPECT_EQ(mid.currentObjective, 1u);
    EXPECT_EQ(mid.progress, (std::vector<int32_t>{5, 0}));
    EXPECT_EQ(mid.status, QuestStatus::Active);

    send(ItemCollected{"herb", 3});  // objective already satisfied
    send(Interacted{"elder"});

    auto done = progress("gather_quest");
    EXPECT_EQ(done.status, QuestStatus::Completed);
    EXPECT_EQ(done.currentObjective, 2u);
    EXPECT_EQ(done.progress, (std::vector<int32_t>{5, 1}));

    auto progressed = recorder_->progressed();
    ASSERT_EQ(progressed.size(), 3u);
    EXPECT_EQ(progressed[0].progress, 3);
    EXPECT_EQ(progressed[1].progress, 5);
    EXPECT_EQ(progressed[1].required, 5);
    EXPECT_EQ(progressed[2].objectiveIndex, 1u);
}

TEST_F(QuestEngineTest, ApplyEventToQuest) {
    auto none = engine_->applyEventToQuest(kPlayer, "intro_quest", Interacted{"elder"});
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code(), ErrorCode::NotFound);

    ASSERT_TRUE(engine_->offerQuest(kPlayer, "intro_quest").hasValue());
    auto offered = engine_->applyEventToQuest(kPlayer, "intro_quest", Interacted{"elder"});
    ASSERT_TRUE(offered.hasError());
    EXPECT_EQ(offered.error().code(), ErrorCode::NotActive);

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    auto miss = engine_->applyEventToQuest(kPlayer, "intro_quest", Interacted{"guard"});
    ASSERT_TRUE(miss.hasValue());
    EXPECT_FALSE(miss.value().has_value());

    auto hit = engine_->applyEventToQuest(kPlayer, "intro_quest", Interacted{"elder"});
    ASSERT_TRUE(hit.hasValue());
    ASSERT_TRUE(hit.value().has_value());
    EXPECT_TRUE(hit.value()->satisfied);
    EXPECT_EQ(progress("intro_quest").status, QuestStatus::Completed);
}

TEST_F(QuestEngineTest, ApplyEventAdvancesEveryMatchingQuest) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "gather_quest").hasValue());
    EXPECT_EQ(engine_->applyEvent(kPlayer, ItemCollected{"herb", 5}), 1u);

    EXPECT_EQ(engine_->applyEvent(kPlayer, Interacted{"elder"}), 2u);
    EXPECT_EQ(progress("intro_quest").status, QuestStatus::Completed);
    EXPECT_EQ(progress("gather_quest").status, QuestStatus::Completed);

    EXPECT_EQ(engine_->applyEvent(kPlayer, Interacted{"elder"}), 0u);
}

TEST_F(QuestEngineTest, IndexInvariantsHoldAfterMixedActivity) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "gather_quest").hasValue());
    ASSERT_TRUE(engine_->offerQuest(kPlayer, "scroll_quest").hasValue());
    send(ItemCollected{"herb", 2});
    send(Interacted{"elder"});
    send(ItemCollected{"herb", 9});

    for (const auto& instance : engine_->exportState(kPlayer).instances) {
        const auto* def = registry_->find(instance.questId);
        ASSERT_NE(def, nullptr);
        EXPECT_LE(instance.currentObjective, def->objectiveCount());
        EXPECT_EQ(instance.status == QuestStatus::Completed,
                  instance.currentObjective == def->objectiveCount());
        for (std::size_t i = 0; i < def->objectiveCount(); ++i) {
            EXPECT_LE(instance.progress[i], def->objectives[i].required);
            if (i < instance.currentObjective) {
                EXPECT_EQ(instance.progress[i], def->objectives[i].required);
            }
        }
    }
}

// =============================================================================
// Availability
// =============================================================================

TEST_F(QuestEngineTest, ListAvailableQuests) {
    EXPECT_EQ(engine_->listAvailableQuests(kPlayer),
              (std::vector<QuestId>{"intro_quest", "scroll_quest", "gather_quest",
                                    "moral_choice", "timed_quest"}));

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    ASSERT_TRUE(engine_->offerQuest(kPlayer, "scroll_quest").hasValue());
    EXPECT_EQ(engine_->listAvailableQuests(kPlayer),
              (std::vector<QuestId>{"scroll_quest", "gather_quest", "moral_choice",
                                    "timed_quest"}));

    EXPECT_FALSE(engine_->isAvailable(kPlayer, "unknown_quest"));
}

TEST_F(QuestEngineTest, ListActiveQuests) {
    EXPECT_TRUE(engine_->listActiveQuests(kPlayer).empty());
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "scroll_quest").hasValue());
    ASSERT_TRUE(engine_->offerQuest(kPlayer, "gather_quest").hasValue());
    send(ItemCollected{"scroll", 1});

    auto active = engine_->listActiveQuests(kPlayer);
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].questId, "intro_quest");
}

TEST_F(QuestEngineTest, AvailabilityAnnouncedOncePerTransition) {
    EXPECT_EQ(engine_->refreshAvailability(kPlayer), 5u);
    EXPECT_EQ(engine_->refreshAvailability(kPlayer), 0u);

    facts_.setLevel(kPlayer, 10);
    EXPECT_EQ(engine_->refreshAvailability(kPlayer), 1u);
    EXPECT_EQ(recorder_->count("available:advanced_quest"), 1u);

    // Dropping below the gate re-arms the announcement.
    facts_.setLevel(kPlayer, 4);
    EXPECT_EQ(engine_->refreshAvailability(kPlayer), 0u);
    facts_.setLevel(kPlayer, 12);
    EXPECT_EQ(engine_->refreshAvailability(kPlayer), 1u);
    EXPECT_EQ(recorder_->count("available:advanced_quest"), 2u);
}

TEST_F(QuestEngineTest, PlayerJoinedTriggersRefresh) {
    send(PlayerJoined{});
    auto events = recorder_->eventsFor(kPlayer);
    EXPECT_EQ(events.size(), 5u);
    EXPECT_EQ(recorder_->count("available:intro_quest"), 1u);

    send(PlayerJoined{});
    EXPECT_EQ(recorder_->eventsFor(kPlayer).size(), 5u);
}

TEST_F(QuestEngineTest, UnknownCustomConditionKeepsQuestLocked) {
    auto def = test::quest("guild_quest",
                           {test::objective(ObjectiveKind::TalkToNpc, "master")},
                           {CustomCondition{"guild_rank", {{"min", "3"}}}});
    auto registry = QuestDefinitionRegistry::create({def});
    ASSERT_TRUE(registry.hasValue());

    ConditionEvaluator evaluator;
    EventDispatcher dispatcher;
    QuestEngine engine(registry.value(), evaluator, dispatcher, facts_);

    EXPECT_FALSE(engine.isAvailable(kPlayer, "guild_quest"));
    auto rejected = engine.acceptQuest(kPlayer, "guild_quest");
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::NotAvailable);
    EXPECT_GE(evaluator.diagnosticCount(), 2u);
}

TEST_F(QuestEngineTest, CustomConditionReadsProviderAttributes) {
    auto def = test::quest("guild_quest",
                           {test::objective(ObjectiveKind::TalkToNpc, "master")},
                           {CustomCondition{"faction", {{"name", "guild"}}}});
    auto registry = QuestDefinitionRegistry::create({def});
    ASSERT_TRUE(registry.hasValue());

    ConditionEvaluator evaluator;
    ASSERT_TRUE(evaluator
                    .registerCustom("faction",
                                    [](const CustomCondition& c, const FactSnapshot& f) {
                                        auto it = f.attributes.find("faction");
                                        return it != f.attributes.end()
                                               && it->second == c.parameters.at("name");
                                    })
                    .hasValue());
    EventDispatcher dispatcher;
    QuestEngine engine(registry.value(), evaluator, dispatcher, facts_);

    EXPECT_FALSE(engine.isAvailable(kPlayer, "guild_quest"));
    facts_.setAttribute(kPlayer, "faction", "guild");
    EXPECT_TRUE(engine.isAvailable(kPlayer, "guild_quest"));
}

// =============================================================================
// Timed quests
// =============================================================================

TEST_F(QuestEngineTest, TimedQuestExpires) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "timed_quest").hasValue());
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());

    EXPECT_EQ(engine_->expireTimedQuests(now_ + 59s), 0u);
    EXPECT_EQ(progress("timed_quest").status, QuestStatus::Active);

    EXPECT_EQ(engine_->expireTimedQuests(now_ + 60s), 1u);
    auto expired = progress("timed_quest");
    EXPECT_EQ(expired.status, QuestStatus::Failed);
    EXPECT_EQ(expired.failedAt, now_ + 60s);
    ASSERT_EQ(recorder_->failed().size(), 1u);
    EXPECT_EQ(recorder_->failed()[0].reason, kTimeLimitExpiredReason);

    EXPECT_EQ(progress("intro_quest").status, QuestStatus::Active);
    EXPECT_EQ(engine_->expireTimedQuests(now_ + 3600s), 0u);
}

TEST_F(QuestEngineTest, CompletedTimedQuestDoesNotExpire) {
    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "timed_quest").hasValue());
    send(ItemCollected{"gem", 1});
    EXPECT_EQ(engine_->expireTimedQuests(now_ + 120s), 0u);
    EXPECT_EQ(progress("timed_quest").status, QuestStatus::Completed);
}

// =============================================================================
// Rewards and notification
// =============================================================================

TEST_F(QuestEngineTest, PendingRewardsHandedOverOnce) {
    EXPECT_TRUE(engine_->takePendingRewards(kPlayer).empty());

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "gather_quest").hasValue());
    send(ItemCollected{"herb", 5});
    send(Interacted{"elder"});

    auto rewards = engine_->takePendingRewards(kPlayer);
    ASSERT_EQ(rewards.size(), 1u);
    EXPECT_EQ(rewards[0].questId, "gather_quest");
    EXPECT_EQ(rewards[0].rewards.at("gold"), 25);
    EXPECT_EQ(rewards[0].completedAt, now_);

    EXPECT_TRUE(engine_->takePendingRewards(kPlayer).empty());
}

TEST_F(QuestEngineTest, ThrowingSubscriberDoesNotRollBack) {
    dispatcher_.subscribe<QuestCompleted>(
        [](const QuestCompleted&) { throw std::runtime_error("reward service down"); }, -1);

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    send(Interacted{"elder"});

    EXPECT_EQ(progress("intro_quest").status, QuestStatus::Completed);
    EXPECT_EQ(recorder_->count("completed:intro_quest"), 1u);
}

TEST_F(QuestEngineTest, SubscriberMayCallBackIntoEngine) {
    dispatcher_.subscribe<QuestCompleted>([this](const QuestCompleted& e) {
        if (e.questId == "intro_quest") {
            EXPECT_TRUE(engine_->acceptQuest(e.playerId, "sequel_quest").hasValue());
        }
    });

    ASSERT_TRUE(engine_->acceptQuest(kPlayer, "intro_quest").hasValue());
    send(Interacted{"elder"});

    EXPECT_EQ(progress("sequel_quest").status, QuestStatus::Active);
    EXPECT_EQ(recorder_->events(),
              (std::vector<std::string>{"accepted:intro_quest", "progressed:intro_quest",
                                        "completed:intro_quest", "available:sequel_quest",
                                        "accepted:sequel_quest"}));
}

// =============================================================================
// EngineConfig
// =============================================================================

TEST(EngineConfigTest, DefaultsWhenKeyAbsent) {
    ConfigManager config;
    auto engineConfig = EngineConfig::fromConfig(config);
    ASSERT_TRUE(engineConfig.hasValue());
    EXPECT_EQ(engineConfig.value().maxActiveQuests, kMaxActiveQuests);
}

TEST(EngineConfigTest, ReadsConfiguredLimit) {
    ConfigManager config;
    config.set<int>("engine.max_active_quests", 3);
    auto engineConfig = EngineConfig::fromConfig(config);
    ASSERT_TRUE(engineConfig.hasValue());
    EXPECT_EQ(engineConfig.value().maxActiveQuests, 3u);
}

TEST(EngineConfigTest, RejectsInvalidLimit) {
    ConfigManager config;
    config.set<int>("engine.max_active_quests", 0);
    auto zero = EngineConfig::fromConfig(config);
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::ConfigInvalidValue);

    config.set<std::string>("engine.max_active_quests", "many");
    auto text = EngineConfig::fromConfig(config);
    ASSERT_TRUE(text.hasError());
    EXPECT_EQ(text.error().code(), ErrorCode::ConfigTypeMismatch);
}
