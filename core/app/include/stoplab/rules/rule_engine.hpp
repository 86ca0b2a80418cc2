#pragma once

#include "stoplab/domain/supervised_universe.hpp"
#include "stoplab/risk/risk_metrics.hpp"
#include "stoplab/rules/rule_set.hpp"

#include <optional>
#include <string>

namespace stoplab {
namespace rules {

// -----------------------------------------------------------------------------
// RuleDecision
// -----------------------------------------------------------------------------
// Outcome of one evaluation: the normalised action, the id of the rule that
// produced it ("DEFAULT_HOLD" when none fired) and that rule's scope.
// -----------------------------------------------------------------------------
struct RuleDecision {
  RuleAction action{RuleAction::Hold};
  std::string rule_id;
  RuleScope scope{RuleScope::Ticker};
};

// -----------------------------------------------------------------------------
// RuleEngine
// -----------------------------------------------------------------------------
//
// @brief  Maps one held ticker's metrics to a HOLD / REDUCE / ZERO decision
//         using a ranked RuleSet.
//
// @details
// Evaluation order:
//   1. A ticker outside the supervised universe returns
//      (ZERO, EXIT_IF_NOT_IN_SUPERVISED) before any ranked rule is read.
//   2. priority_order is walked front to back. Ticker-scoped rules read
//      TickerMetrics, portfolio-scoped rules read PortfolioMetrics. The first
//      block that triggers returns its normalised action and the rule id.
//   3. Nothing triggered: (HOLD, DEFAULT_HOLD).
//
// A condition whose metric is missing or NaN is false.
//
// Thread model:
//   Stateless; evaluate() is a pure function of its arguments.
// -----------------------------------------------------------------------------
class RuleEngine {
 public:
  static constexpr const char* kDefaultHoldId = "DEFAULT_HOLD";

  RuleDecision evaluate(const std::string& ticker,
                        const TickerMetrics& ticker_metrics,
                        const PortfolioMetrics& portfolio_metrics,
                        const RuleSet& rule_set,
                        const domain::SupervisedUniverse& universe) const;

  // False when @p value is missing or NaN, else `value op condition.value`.
  static bool evaluateCondition(const Condition& condition,
                                std::optional<double> value);

  static bool evaluateBlock(const ConditionBlock& block,
                            const TickerMetrics& metrics);
  static bool evaluateBlock(const ConditionBlock& block,
                            const PortfolioMetrics& metrics);
};

}  // namespace rules
}  // namespace stoplab
