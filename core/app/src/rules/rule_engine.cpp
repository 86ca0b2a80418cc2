#include "stoplab/rules/rule_engine.hpp"

#include <cmath>
#include <type_traits>

namespace stoplab {
namespace rules {

namespace {

template <typename Metrics>
std::optional<double> readMetric(const Condition& condition,
                                 const Metrics& metrics) {
  if (!condition.metric) {
    return std::nullopt;
  }
  return metrics.value(*condition.metric);
}

template <typename Metrics>
bool evaluateBlockOn(const ConditionBlock& block, const Metrics& metrics) {
  switch (block.mode) {
    case ConditionBlock::Mode::Never:
      return false;
    case ConditionBlock::Mode::AnyOf:
      for (const auto& condition : block.conditions) {
        if (RuleEngine::evaluateCondition(condition,
                                          readMetric(condition, metrics))) {
          return true;
        }
      }
      return false;
    case ConditionBlock::Mode::AllOf:
      for (const auto& condition : block.conditions) {
        if (!RuleEngine::evaluateCondition(condition,
                                           readMetric(condition, metrics))) {
          return false;
        }
      }
      return true;
  }
  return false;
}

}  // namespace

bool RuleEngine::evaluateCondition(const Condition& condition,
                                   std::optional<double> value) {
  if (!value || std::isnan(*value)) {
    return false;
  }
  const double v = *value;
  switch (condition.op) {
    case CompareOp::GreaterEqual:
      return v >= condition.value;
    case CompareOp::LessEqual:
      return v <= condition.value;
    case CompareOp::Greater:
      return v > condition.value;
    case CompareOp::Less:
      return v < condition.value;
    case CompareOp::Equal:
      return v == condition.value;
    case CompareOp::NotEqual:
      return v != condition.value;
  }
  return false;
}

bool RuleEngine::evaluateBlock(const ConditionBlock& block,
                               const TickerMetrics& metrics) {
  return evaluateBlockOn(block, metrics);
}

bool RuleEngine::evaluateBlock(const ConditionBlock& block,
                               const PortfolioMetrics& metrics) {
  return evaluateBlockOn(block, metrics);
}

// -----------------------------------------------------------------------------
// evaluate: supervised check, then first triggered rule in priority order
// -----------------------------------------------------------------------------
RuleDecision RuleEngine::evaluate(
    const std::string& ticker, const TickerMetrics& ticker_metrics,
    const PortfolioMetrics& portfolio_metrics, const RuleSet& rule_set,
    const domain::SupervisedUniverse& universe) const {
  if (!universe.contains(ticker)) {
    return RuleDecision{RuleAction::Zero,
                        std::string(ExitIfNotInSupervised::kId),
                        RuleScope::Ticker};
  }

  for (const Rule& rule : rule_set.priority_order) {
    const bool triggered = std::visit(
        [&]([[maybe_unused]] const auto& r) -> bool {
          using Kind = std::decay_t<decltype(r)>;
          if constexpr (std::is_same_v<Kind, ExitIfNotInSupervised>) {
            // Membership already verified above.
            return false;
          } else if constexpr (Kind::kScope == RuleScope::Portfolio) {
            return evaluateBlock(r.block, portfolio_metrics);
          } else {
            return evaluateBlock(r.block, ticker_metrics);
          }
        },
        rule);

    if (triggered) {
      return RuleDecision{ruleBlock(rule)->action, std::string(ruleId(rule)),
                          ruleScope(rule)};
    }
  }

  return RuleDecision{RuleAction::Hold, kDefaultHoldId, RuleScope::Ticker};
}

}  // namespace rules
}  // namespace stoplab
