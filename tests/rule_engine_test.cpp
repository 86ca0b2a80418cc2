// =============================================================================
// rule_engine_test.cpp
// =============================================================================
// Unit tests for stoplab::rules::RuleEngine and the RuleSet helpers.
//
// Validates:
//   - Supervised membership is checked before any ranked rule
//   - Priority: the earliest triggering rule wins
//   - any_of / all_of semantics, including empty lists
//   - Missing and NaN metrics make a condition false
//   - Portfolio-scoped rules read portfolio metrics
//   - Action normalisation
//   - Loaded rules with unresolved or cross-scope metrics never trigger
// =============================================================================

#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/domain/supervised_universe.hpp"
#include "stoplab/risk/risk_metrics.hpp"
#include "stoplab/rules/rule_engine.hpp"
#include "stoplab/rules/rule_set.hpp"
#include "stoplab/rules/rule_set_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace stoplab::rules;
using stoplab::MetricField;
using stoplab::PortfolioMetrics;
using stoplab::TickerMetrics;

namespace {

Condition cond(MetricField metric, CompareOp op, double value) {
  Condition c;
  c.metric = metric;
  c.op = op;
  c.value = value;
  return c;
}

template <typename Kind>
Rule rule(ConditionBlock::Mode mode, std::vector<Condition> conditions,
          RuleAction action) {
  Kind kind;
  kind.block.mode = mode;
  kind.block.conditions = std::move(conditions);
  kind.block.action = action;
  return Rule{std::move(kind)};
}

}  // namespace

// =============================================================================
// Test fixture: universe {AAA, BBB}, a ranked ruleset of three rules.
//
//   1. HARD_STOP            any_of drawdown_20d >= 0.15          -> ZERO
//   2. PORTFOLIO_SOFT_STOP  any_of portfolio drawdown_60d >= 0.10 -> REDUCE
//   3. SOFT_STOP            all_of drawdown_20d >= 0.05,
//                                  close_below_sma_100 == 1      -> REDUCE
// =============================================================================
class RuleEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rule_set.ruleset_id = "TEST";
    rule_set.priority_order.push_back(rule<HardStop>(
        ConditionBlock::Mode::AnyOf,
        {cond(MetricField::Drawdown20d, CompareOp::GreaterEqual, 0.15)},
        RuleAction::Zero));
    rule_set.priority_order.push_back(rule<PortfolioSoftStop>(
        ConditionBlock::Mode::AnyOf,
        {cond(MetricField::Drawdown60d, CompareOp::GreaterEqual, 0.10)},
        RuleAction::Reduce));
    rule_set.priority_order.push_back(rule<SoftStop>(
        ConditionBlock::Mode::AllOf,
        {cond(MetricField::Drawdown20d, CompareOp::GreaterEqual, 0.05),
         cond(MetricField::CloseBelowSma100, CompareOp::Equal, 1.0)},
        RuleAction::Reduce));
  }

  RuleDecision decide(const std::string& ticker, const TickerMetrics& tm,
                      const PortfolioMetrics& pm = {}) const {
    return engine.evaluate(ticker, tm, pm, rule_set, universe);
  }

  RuleEngine engine;
  RuleSet rule_set;
  stoplab::domain::SupervisedUniverse universe{{"AAA", "BBB"}};
};

// -----------------------------------------------------------------------------
// 1. Outside the universe: ZERO regardless of metrics or priority.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, UnsupervisedTickerIsZeroed) {
  const RuleDecision d = decide("XYZ", TickerMetrics{});
  EXPECT_EQ(d.action, RuleAction::Zero);
  EXPECT_EQ(d.rule_id, "EXIT_IF_NOT_IN_SUPERVISED");
}

// -----------------------------------------------------------------------------
// 2. Nothing triggers: HOLD / DEFAULT_HOLD.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, DefaultHold) {
  TickerMetrics tm;
  tm.drawdown_20d = 0.01;
  const RuleDecision d = decide("AAA", tm);
  EXPECT_EQ(d.action, RuleAction::Hold);
  EXPECT_EQ(d.rule_id, RuleEngine::kDefaultHoldId);
}

// -----------------------------------------------------------------------------
// 3. Several rules trigger: the earliest ranked one is reported.
// Why: the ranking is the ruleset author's tie-break.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, EarliestRankedRuleWins) {
  TickerMetrics tm;
  tm.drawdown_20d = 0.20;
  tm.close_below_sma_100 = true;
  PortfolioMetrics pm;
  pm.drawdown_60d = 0.30;

  RuleDecision d = decide("AAA", tm, pm);
  EXPECT_EQ(d.action, RuleAction::Zero);
  EXPECT_EQ(d.rule_id, "HARD_STOP");

  // Below the hard stop: the portfolio rule is next in line.
  tm.drawdown_20d = 0.08;
  d = decide("AAA", tm, pm);
  EXPECT_EQ(d.action, RuleAction::Reduce);
  EXPECT_EQ(d.rule_id, "PORTFOLIO_SOFT_STOP");
  EXPECT_EQ(d.scope, RuleScope::Portfolio);

  // Portfolio calm: the soft stop fires.
  pm.drawdown_60d = 0.0;
  d = decide("AAA", tm, pm);
  EXPECT_EQ(d.rule_id, "SOFT_STOP");
  EXPECT_EQ(d.scope, RuleScope::Ticker);
}

// -----------------------------------------------------------------------------
// 4. all_of needs every condition; one missing metric blocks it.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, AllOfNeedsEveryCondition) {
  TickerMetrics tm;
  tm.drawdown_20d = 0.08;
  EXPECT_EQ(decide("AAA", tm).rule_id, RuleEngine::kDefaultHoldId);

  tm.close_below_sma_100 = false;
  EXPECT_EQ(decide("AAA", tm).rule_id, RuleEngine::kDefaultHoldId);

  tm.close_below_sma_100 = true;
  EXPECT_EQ(decide("AAA", tm).rule_id, "SOFT_STOP");
}

// -----------------------------------------------------------------------------
// 5. Missing or NaN metric values never satisfy a condition, not even !=.
// -----------------------------------------------------------------------------
TEST(RuleConditionTest, MissingAndNanAreFalse) {
  const Condition ne = cond(MetricField::Drawdown20d, CompareOp::NotEqual, 0.1);
  EXPECT_FALSE(RuleEngine::evaluateCondition(ne, std::nullopt));
  EXPECT_FALSE(RuleEngine::evaluateCondition(
      ne, std::numeric_limits<double>::quiet_NaN()));
  EXPECT_TRUE(RuleEngine::evaluateCondition(ne, 0.2));
}

// -----------------------------------------------------------------------------
// 6. Every comparison operator.
// -----------------------------------------------------------------------------
TEST(RuleConditionTest, Operators) {
  const auto check = [](CompareOp op, double v) {
    return RuleEngine::evaluateCondition(cond(MetricField::Drawdown20d, op, 1.0),
                                         v);
  };
  EXPECT_TRUE(check(CompareOp::GreaterEqual, 1.0));
  EXPECT_FALSE(check(CompareOp::Greater, 1.0));
  EXPECT_TRUE(check(CompareOp::LessEqual, 1.0));
  EXPECT_FALSE(check(CompareOp::Less, 1.0));
  EXPECT_TRUE(check(CompareOp::Equal, 1.0));
  EXPECT_TRUE(check(CompareOp::NotEqual, 2.0));

  EXPECT_EQ(parseCompareOp(">="), CompareOp::GreaterEqual);
  EXPECT_FALSE(parseCompareOp("=>").has_value());
}

// -----------------------------------------------------------------------------
// 7. Empty lists: any_of is false, all_of is true, an absent block never
//    triggers.
// -----------------------------------------------------------------------------
TEST(RuleConditionTest, EmptyBlocks) {
  TickerMetrics tm;
  ConditionBlock block;
  EXPECT_FALSE(RuleEngine::evaluateBlock(block, tm));

  block.mode = ConditionBlock::Mode::AnyOf;
  EXPECT_FALSE(RuleEngine::evaluateBlock(block, tm));

  block.mode = ConditionBlock::Mode::AllOf;
  EXPECT_TRUE(RuleEngine::evaluateBlock(block, tm));
}

// -----------------------------------------------------------------------------
// 8. A portfolio rule ignores ticker metrics with the same field.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, PortfolioRuleReadsPortfolioMetrics) {
  RuleSet only_portfolio;
  only_portfolio.priority_order.push_back(rule<PortfolioHardStop>(
      ConditionBlock::Mode::AnyOf,
      {cond(MetricField::Drawdown20d, CompareOp::GreaterEqual, 0.10)},
      RuleAction::Zero));

  TickerMetrics tm;
  tm.drawdown_20d = 0.50;
  PortfolioMetrics pm;
  EXPECT_EQ(engine.evaluate("AAA", tm, pm, only_portfolio, universe).rule_id,
            RuleEngine::kDefaultHoldId);

  pm.drawdown_20d = 0.12;
  const RuleDecision d =
      engine.evaluate("AAA", tm, pm, only_portfolio, universe);
  EXPECT_EQ(d.rule_id, "PORTFOLIO_HARD_STOP");
  EXPECT_EQ(d.action, RuleAction::Zero);
}

// -----------------------------------------------------------------------------
// 9. Raw action strings normalise to three actions.
// -----------------------------------------------------------------------------
TEST(RuleActionTest, Normalisation) {
  EXPECT_EQ(normalizeAction("ZERO"), RuleAction::Zero);
  EXPECT_EQ(normalizeAction("TICKER_ZERO"), RuleAction::Zero);
  EXPECT_EQ(normalizeAction("REDUCE"), RuleAction::Reduce);
  EXPECT_EQ(normalizeAction("PORTFOLIO_REDUCE"), RuleAction::Reduce);
  EXPECT_EQ(normalizeAction("HOLD"), RuleAction::Hold);
  EXPECT_EQ(normalizeAction("SELL_EVERYTHING"), RuleAction::Hold);
  EXPECT_EQ(normalizeAction(""), RuleAction::Hold);
}

// -----------------------------------------------------------------------------
// 10. Rule kinds resolve by id and carry their scope.
// -----------------------------------------------------------------------------
TEST(RuleKindTest, MakeRuleById) {
  auto hard = makeRule("HARD_STOP");
  ASSERT_TRUE(hard.has_value());
  EXPECT_EQ(ruleId(*hard), "HARD_STOP");
  EXPECT_EQ(ruleBlockKey(*hard), "hard_stop");
  EXPECT_EQ(ruleScope(*hard), RuleScope::Ticker);

  auto portfolio = makeRule("PORTFOLIO_HARD_STOP");
  ASSERT_TRUE(portfolio.has_value());
  EXPECT_EQ(ruleScope(*portfolio), RuleScope::Portfolio);

  auto exit_rule = makeRule("EXIT_IF_NOT_IN_SUPERVISED");
  ASSERT_TRUE(exit_rule.has_value());
  EXPECT_EQ(ruleBlock(*exit_rule), nullptr);

  EXPECT_FALSE(makeRule("hard_stop").has_value());

  RuleSet rs;
  rs.reduce_fraction = 0.3;
  rs.portfolio_reduce_fraction = 0.25;
  EXPECT_DOUBLE_EQ(rs.reduceFractionFor(RuleScope::Ticker), 0.3);
  EXPECT_DOUBLE_EQ(rs.reduceFractionFor(RuleScope::Portfolio), 0.25);
}

// -----------------------------------------------------------------------------
// 11. A misspelled metric inside all_of keeps the block from ever firing.
// Why: dropping the condition would leave an empty all_of, which is true for
//      every holding on every day.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, AllOfWithUnknownMetricNeverFires) {
  stoplab::RunDiagnostics diagnostics;
  RuleSetLoader loader(diagnostics);
  const RuleSet loaded = loader.parse(nlohmann::json::parse(R"({
    "priority_order": ["HARD_STOP"],
    "hard_stop": {
      "all_of": [{"metric": "drawdown_20", "op": ">=", "value": 0.15}],
      "action": "ZERO"
    }
  })"));

  TickerMetrics calm;
  calm.drawdown_20d = 0.01;
  TickerMetrics crashed;
  crashed.drawdown_20d = 0.90;
  for (const TickerMetrics& tm : {calm, crashed}) {
    const RuleDecision d = engine.evaluate("AAA", tm, {}, loaded, universe);
    EXPECT_EQ(d.action, RuleAction::Hold);
    EXPECT_EQ(d.rule_id, RuleEngine::kDefaultHoldId);
  }
}

// -----------------------------------------------------------------------------
// 12. Metric names do not cross scopes: a ticker rule naming a portfolio
//     metric, or a portfolio rule naming a ticker metric, reads null.
// -----------------------------------------------------------------------------
TEST_F(RuleEngineTest, MetricNamesDoNotCrossScopes) {
  stoplab::RunDiagnostics diagnostics;
  RuleSetLoader loader(diagnostics);
  const RuleSet loaded = loader.parse(nlohmann::json::parse(R"({
    "priority_order": ["HARD_STOP", "PORTFOLIO_HARD_STOP"],
    "hard_stop": {
      "any_of": [{"metric": "portfolio_drawdown_20d", "op": ">=", "value": 0.15}],
      "action": "ZERO"
    },
    "portfolio_hard_stop": {
      "any_of": [{"metric": "drawdown_20d", "op": ">=", "value": 0.15}],
      "action": "ZERO"
    }
  })"));

  TickerMetrics tm;
  tm.drawdown_20d = 0.5;
  PortfolioMetrics pm;
  pm.drawdown_20d = 0.5;
  const RuleDecision d = engine.evaluate("AAA", tm, pm, loaded, universe);
  EXPECT_EQ(d.action, RuleAction::Hold);
  EXPECT_EQ(d.rule_id, RuleEngine::kDefaultHoldId);
  EXPECT_EQ(diagnostics.warnings.size(), 2u);
}
