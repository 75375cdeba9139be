#pragma once

/// @file condition_evaluator.hpp
/// @brief Pure prerequisite evaluation over a FactSnapshot.

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "qe/foundation/game_result.hpp"
#include "qe/quest/condition.hpp"

namespace qe::quest {

/// Predicate resolving one custom condition kind.
using CustomPredicate = std::function<bool(const CustomCondition&, const FactSnapshot&)>;

/// Evaluates conditions and AND-composed prerequisite sets.
///
/// Evaluation is total: it never fails and never throws. Custom kinds with
/// no registered predicate evaluate to false and are counted as
/// diagnostics, so a malformed or forward-declared condition blocks
/// progress instead of permitting it.
///
/// Register custom predicates before the evaluator is shared with the
/// engine; afterwards it is read-only and safe to use from any thread.
///
/// Example:
/// @code
///   ConditionEvaluator evaluator;
///   evaluator.registerCustom("faction", [](const CustomCondition& c,
///                                          const FactSnapshot& facts) {
///       auto it = facts.attributes.find("faction");
///       return it != facts.attributes.end()
///              && it->second == c.parameters.at("name");
///   });
///   bool ok = evaluator.evaluate(definition.prerequisites, facts);
/// @endcode
class ConditionEvaluator {
public:
    ConditionEvaluator() = default;

    ConditionEvaluator(const ConditionEvaluator&) = delete;
    ConditionEvaluator& operator=(const ConditionEvaluator&) = delete;

    /// Register the predicate for a custom condition kind.
    /// @return InvalidArgument for an empty kind or predicate,
    ///         AlreadyExists if the kind is taken.
    foundation::GameResult<void> registerCustom(std::string kind, CustomPredicate predicate);

    /// Check whether a custom kind has a registered predicate.
    [[nodiscard]] bool hasCustom(std::string_view kind) const;

    /// Evaluate a single condition.
    [[nodiscard]] bool evaluate(const Condition& condition, const FactSnapshot& facts) const;

    /// Evaluate the conjunction of @p conditions (true for an empty set).
    [[nodiscard]] bool evaluate(const ConditionSet& conditions, const FactSnapshot& facts) const;

    /// Number of conditions that could not be evaluated (unknown custom
    /// kind or a throwing predicate) since construction.
    [[nodiscard]] uint64_t diagnosticCount() const noexcept {
        return diagnostics_.load(std::memory_order_relaxed);
    }

private:
    bool evaluateCustom(const CustomCondition& condition, const FactSnapshot& facts) const;

    std::unordered_map<std::string, CustomPredicate> customs_;
    mutable std::atomic<uint64_t> diagnostics_{0};
};

}  // namespace qe::quest
