#pragma once

#include "stoplab/risk/risk_metrics.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stoplab {
namespace rules {

// -----------------------------------------------------------------------------
// CompareOp
// -----------------------------------------------------------------------------
enum class CompareOp {
  GreaterEqual,
  LessEqual,
  Greater,
  Less,
  Equal,
  NotEqual,
};

// ">=", "<=", ">", "<", "==", "!=". std::nullopt for anything else.
std::optional<CompareOp> parseCompareOp(const std::string& text);
const char* toString(CompareOp op);

// -----------------------------------------------------------------------------
// RuleAction: what a triggered rule asks the simulation to do
// -----------------------------------------------------------------------------
enum class RuleAction {
  Hold,
  Reduce,
  Zero,
};

// -------------------------------------------------------------------------
// normalizeAction(raw)
// -------------------------------------------------------------------------
// ZERO / REDUCE / HOLD pass through, PORTFOLIO_REDUCE -> Reduce,
// TICKER_ZERO -> Zero, anything else (including empty) -> Hold.
// -------------------------------------------------------------------------
RuleAction normalizeAction(const std::string& raw);
const char* toString(RuleAction action);

// -----------------------------------------------------------------------------
// Condition: {metric, op, value}
// -----------------------------------------------------------------------------
// Boolean values in the document are stored as 1.0 / 0.0.
//
// metric is std::nullopt when the document's metric, operator or value could
// not be resolved for the rule's scope. Such a condition reads null and never
// holds, so an all_of containing it never triggers.
// -----------------------------------------------------------------------------
struct Condition {
  std::optional<MetricField> metric;
  CompareOp op{CompareOp::GreaterEqual};
  double value{0.0};
};

// -----------------------------------------------------------------------------
// ConditionBlock
// -----------------------------------------------------------------------------
//
// @details
//   AnyOf   true if at least one condition holds (false when the list is
//           empty).
//   AllOf   true only if every condition holds (vacuously true when the
//           list is empty).
//   Never   the block is absent from the document or has neither list;
//           it never triggers.
// -----------------------------------------------------------------------------
struct ConditionBlock {
  enum class Mode { Never, AnyOf, AllOf };

  Mode mode{Mode::Never};
  std::vector<Condition> conditions;
  RuleAction action{RuleAction::Hold};
};

// -----------------------------------------------------------------------------
// Rule kinds
// -----------------------------------------------------------------------------
//
// @brief  Closed set of rule types a ruleset may rank. Each carries its
//         document id, the metrics it reads (ticker or portfolio scope) and
//         its condition block.
//
// @details
// Portfolio-scoped rules read PortfolioMetrics, and a REDUCE they trigger
// sells `portfolio_reduce.fraction_each_position` instead of the per-ticker
// fraction. The scope is a compile-time attribute of the kind.
// -----------------------------------------------------------------------------
enum class RuleScope { Ticker, Portfolio };

struct HardStop {
  static constexpr std::string_view kId = "HARD_STOP";
  static constexpr std::string_view kBlockKey = "hard_stop";
  static constexpr RuleScope kScope = RuleScope::Ticker;
  ConditionBlock block;
};

struct SoftStop {
  static constexpr std::string_view kId = "SOFT_STOP";
  static constexpr std::string_view kBlockKey = "soft_stop";
  static constexpr RuleScope kScope = RuleScope::Ticker;
  ConditionBlock block;
};

struct PortfolioHardStop {
  static constexpr std::string_view kId = "PORTFOLIO_HARD_STOP";
  static constexpr std::string_view kBlockKey = "portfolio_hard_stop";
  static constexpr RuleScope kScope = RuleScope::Portfolio;
  ConditionBlock block;
};

struct PortfolioSoftStop {
  static constexpr std::string_view kId = "PORTFOLIO_SOFT_STOP";
  static constexpr std::string_view kBlockKey = "portfolio_soft_stop";
  static constexpr RuleScope kScope = RuleScope::Portfolio;
  ConditionBlock block;
};

struct TickerHardStop {
  static constexpr std::string_view kId = "TICKER_HARD_STOP";
  static constexpr std::string_view kBlockKey = "ticker_hard_stop";
  static constexpr RuleScope kScope = RuleScope::Ticker;
  ConditionBlock block;
};

struct SystemicStressSoftStop {
  static constexpr std::string_view kId = "SYSTEMIC_STRESS_SOFT_STOP";
  static constexpr std::string_view kBlockKey = "systemic_stress_soft_stop";
  static constexpr RuleScope kScope = RuleScope::Ticker;
  ConditionBlock block;
};

struct SystemicStressHardStop {
  static constexpr std::string_view kId = "SYSTEMIC_STRESS_HARD_STOP";
  static constexpr std::string_view kBlockKey = "systemic_stress_hard_stop";
  static constexpr RuleScope kScope = RuleScope::Ticker;
  ConditionBlock block;
};

struct IdiosyncraticHardStop {
  static constexpr std::string_view kId = "IDIOSYNCRATIC_HARD_STOP";
  static constexpr std::string_view kBlockKey = "idiosyncratic_hard_stop";
  static constexpr RuleScope kScope = RuleScope::Ticker;
  ConditionBlock block;
};

// Supervised-membership rule. Carries no block: membership is checked by
// RuleEngine before the priority walk, so inside the walk it never fires.
struct ExitIfNotInSupervised {
  static constexpr std::string_view kId = "EXIT_IF_NOT_IN_SUPERVISED";
  static constexpr RuleScope kScope = RuleScope::Ticker;
};

using Rule = std::variant<ExitIfNotInSupervised, HardStop, SoftStop,
                          PortfolioHardStop, PortfolioSoftStop, TickerHardStop,
                          SystemicStressSoftStop, SystemicStressHardStop,
                          IdiosyncraticHardStop>;

std::string_view ruleId(const Rule& rule);
RuleScope ruleScope(const Rule& rule);

// -------------------------------------------------------------------------
// makeRule(id)
// -------------------------------------------------------------------------
// @brief  Default-constructs the rule kind whose kId equals @p id (with a
//         Never block).
// @return std::nullopt for an unknown id.
// -------------------------------------------------------------------------
std::optional<Rule> makeRule(const std::string& id);

// Block of a rule, or nullptr for ExitIfNotInSupervised.
const ConditionBlock* ruleBlock(const Rule& rule);
ConditionBlock* ruleBlock(Rule& rule);

// Document key of a rule's block ("hard_stop", ...), empty when it has none.
std::string_view ruleBlockKey(const Rule& rule);

// -----------------------------------------------------------------------------
// RuleSet
// -----------------------------------------------------------------------------
//
// @brief  Ranked rules plus the action parameters they share.
//
// @details
// priority_order is walked front to back; the first rule whose block
// triggers decides the action for that ticker and day.
// -----------------------------------------------------------------------------
struct RuleSet {
  std::string ruleset_id;
  std::vector<Rule> priority_order;

  /// actions.reduce.fraction_of_position_to_sell
  double reduce_fraction{0.5};

  /// actions.portfolio_reduce.fraction_each_position
  double portfolio_reduce_fraction{0.5};

  /// reentry.quarantine_sessions_after_zero (only when set and non-zero).
  std::optional<int> quarantine_sessions_override;

  // Fraction of the position a REDUCE sells, chosen by the rule's scope.
  double reduceFractionFor(RuleScope scope) const {
    return scope == RuleScope::Portfolio ? portfolio_reduce_fraction
                                         : reduce_fraction;
  }
};

}  // namespace rules
}  // namespace stoplab
