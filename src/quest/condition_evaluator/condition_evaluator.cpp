/// @file condition_evaluator.cpp
/// @brief ConditionEvaluator implementation.

#include "qe/quest/condition_evaluator.hpp"

#include <algorithm>
#include <exception>

#include "qe/foundation/game_logger.hpp"

namespace qe::quest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

std::string describeCondition(const Condition& condition) {
    struct Describe {
        std::string operator()(const PlayerLevelCondition& c) const {
            return "player_level(min=" + std::to_string(c.minLevel) + ")";
        }
        std::string operator()(const QuestCompletedCondition& c) const {
            return "quest_completed(" + c.questId + ")";
        }
        std::string operator()(const QuestChoiceCondition& c) const {
            return "quest_choice(" + c.questId + ", " + c.option + ")";
        }
        std::string operator()(const CustomCondition& c) const {
            return "custom(" + c.kind + ")";
        }
    };
    return std::visit(Describe{}, condition);
}

GameResult<void> ConditionEvaluator::registerCustom(std::string kind, CustomPredicate predicate) {
    if (kind.empty() || !predicate) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "custom condition needs a kind and a predicate"));
    }
    auto [it, inserted] = customs_.try_emplace(std::move(kind), std::move(predicate));
    if (!inserted) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "custom condition kind already registered: " + it->first));
    }
    return GameResult<void>::ok();
}

bool ConditionEvaluator::hasCustom(std::string_view kind) const {
    return customs_.find(std::string(kind)) != customs_.end();
}

bool ConditionEvaluator::evaluate(const Condition& condition, const FactSnapshot& facts) const {
    if (const auto* level = std::get_if<PlayerLevelCondition>(&condition)) {
        return facts.playerLevel >= level->minLevel;
    }
    if (const auto* completed = std::get_if<QuestCompletedCondition>(&condition)) {
        return facts.completedQuests.contains(completed->questId);
    }
    if (const auto* choice = std::get_if<QuestChoiceCondition>(&condition)) {
        auto it = facts.choices.find(choice->questId);
        if (it == facts.choices.end()) {
            return false;
        }
        return std::any_of(it->second.begin(), it->second.end(),
                           [&choice](const auto& entry) {
                               return entry.second == choice->option;
                           });
    }
    return evaluateCustom(std::get<CustomCondition>(condition), facts);
}

bool ConditionEvaluator::evaluate(const ConditionSet& conditions, const FactSnapshot& facts) const {
    return std::all_of(conditions.begin(), conditions.end(),
                       [this, &facts](const Condition& c) { return evaluate(c, facts); });
}

bool ConditionEvaluator::evaluateCustom(const CustomCondition& condition,
                                        const FactSnapshot& facts) const {
    auto it = customs_.find(condition.kind);
    if (it == customs_.end()) {
        diagnostics_.fetch_add(1, std::memory_order_relaxed);
        foundation::LogContext ctx;
        ctx.extra["kind"] = condition.kind;
        ctx.extra["error"] = "UnknownConditionKind";
        QE_LOG_CTX(foundation::LogLevel::Warning, LogCategory::Condition,
                   "unknown condition kind treated as unmet", ctx);
        return false;
    }

    try {
        return it->second(condition, facts);
    } catch (const std::exception& e) {
        diagnostics_.fetch_add(1, std::memory_order_relaxed);
        QE_LOG_ERROR(LogCategory::Condition,
                     "custom condition '" + condition.kind + "' threw: " + e.what());
        return false;
    }
}

}  // namespace qe::quest
