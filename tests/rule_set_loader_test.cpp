// =============================================================================
// rule_set_loader_test.cpp
// =============================================================================
// Unit tests for stoplab::rules::RuleSetLoader.
//
// Validates:
//   - A well-formed document yields ranked rules with parsed blocks
//   - Unknown rule ids are warned about and skipped
//   - Unknown metrics and operators are warned about and kept as conditions
//     that never hold
//   - Metric names resolve per rule scope
//   - Boolean condition values become 1 / 0
//   - Reduce fractions, portfolio fallback and quarantine override
//   - Missing files and malformed JSON are recorded as errors
// =============================================================================

#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/rules/rule_set.hpp"
#include "stoplab/rules/rule_set_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace stoplab::rules;
using stoplab::MetricField;
using stoplab::RunDiagnostics;

namespace {

bool hasCode(const std::vector<std::string>& codes, const std::string& code) {
  return std::find(codes.begin(), codes.end(), code) != codes.end();
}

const char* kRulesetText = R"({
  "ruleset_id": "SELL_RULESET_A",
  "priority_order": ["EXIT_IF_NOT_IN_SUPERVISED", "HARD_STOP",
                     "PORTFOLIO_SOFT_STOP", "MOON_STOP", "SOFT_STOP"],
  "hard_stop": {
    "any_of": [
      {"metric": "drawdown_20d", "op": ">=", "value": 0.15},
      {"metric": "cvar_95_1d_252d", "op": ">", "value": 0.06}
    ],
    "action": "ZERO"
  },
  "portfolio_soft_stop": {
    "any_of": [{"metric": "portfolio_drawdown_60d", "op": ">=", "value": 0.1}],
    "action": "PORTFOLIO_REDUCE"
  },
  "soft_stop": {
    "all_of": [
      {"metric": "close_below_sma_200", "op": "==", "value": true},
      {"metric": "vol_60d_over_vol_252d", "op": ">=", "value": 1.4},
      {"metric": "sentiment", "op": ">=", "value": 0.5},
      {"metric": "drawdown_60d", "op": "~", "value": 0.5}
    ],
    "action": "REDUCE"
  },
  "actions": {
    "reduce": {"fraction_of_position_to_sell": 0.5},
    "portfolio_reduce": {"fraction_each_position": 0.25}
  },
  "reentry": {"quarantine_sessions_after_zero": 10}
})";

}  // namespace

// =============================================================================
// Test fixture: a loader writing into its own diagnostics.
// =============================================================================
class RuleSetLoaderTest : public ::testing::Test {
 protected:
  RunDiagnostics diagnostics;
  RuleSetLoader loader{diagnostics};
};

// -----------------------------------------------------------------------------
// 1. A complete document: known rules in order, unknown id skipped.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, ParsesRankedRules) {
  const RuleSet rs = loader.parse(nlohmann::json::parse(kRulesetText));

  EXPECT_EQ(rs.ruleset_id, "SELL_RULESET_A");
  ASSERT_EQ(rs.priority_order.size(), 4u);
  EXPECT_EQ(ruleId(rs.priority_order[0]), "EXIT_IF_NOT_IN_SUPERVISED");
  EXPECT_EQ(ruleId(rs.priority_order[1]), "HARD_STOP");
  EXPECT_EQ(ruleId(rs.priority_order[2]), "PORTFOLIO_SOFT_STOP");
  EXPECT_EQ(ruleId(rs.priority_order[3]), "SOFT_STOP");

  EXPECT_TRUE(hasCode(diagnostics.warnings, "unknown_rule_id:MOON_STOP"));
  EXPECT_TRUE(diagnostics.overallPass());

  const ConditionBlock* hard = ruleBlock(rs.priority_order[1]);
  ASSERT_NE(hard, nullptr);
  EXPECT_EQ(hard->mode, ConditionBlock::Mode::AnyOf);
  EXPECT_EQ(hard->action, RuleAction::Zero);
  ASSERT_EQ(hard->conditions.size(), 2u);
  EXPECT_EQ(hard->conditions[1].metric, MetricField::Cvar95_1d_252d);
  EXPECT_EQ(hard->conditions[1].op, CompareOp::Greater);
  EXPECT_DOUBLE_EQ(hard->conditions[1].value, 0.06);

  const ConditionBlock* portfolio = ruleBlock(rs.priority_order[2]);
  ASSERT_NE(portfolio, nullptr);
  EXPECT_EQ(portfolio->action, RuleAction::Reduce);
  ASSERT_EQ(portfolio->conditions.size(), 1u);
  EXPECT_EQ(portfolio->conditions[0].metric, MetricField::Drawdown60d);
}

// -----------------------------------------------------------------------------
// 2. Conditions with unknown metrics or operators stay in the block with no
//    metric; boolean values become 1.0.
// Why: an all_of must not shrink to the conditions that happened to parse.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, UnresolvedConditionsKeptWithoutMetric) {
  const RuleSet rs = loader.parse(nlohmann::json::parse(kRulesetText));
  const ConditionBlock* soft = ruleBlock(rs.priority_order[3]);
  ASSERT_NE(soft, nullptr);

  EXPECT_EQ(soft->mode, ConditionBlock::Mode::AllOf);
  ASSERT_EQ(soft->conditions.size(), 4u);
  EXPECT_EQ(soft->conditions[0].metric, MetricField::CloseBelowSma200);
  EXPECT_DOUBLE_EQ(soft->conditions[0].value, 1.0);
  EXPECT_EQ(soft->conditions[1].metric, MetricField::Vol60dOver252d);
  EXPECT_FALSE(soft->conditions[2].metric.has_value());
  EXPECT_FALSE(soft->conditions[3].metric.has_value());

  EXPECT_TRUE(
      hasCode(diagnostics.warnings, "unknown_metric:SOFT_STOP:sentiment"));
  EXPECT_TRUE(hasCode(diagnostics.warnings, "unknown_operator:SOFT_STOP:~"));
}

// -----------------------------------------------------------------------------
// 3. Action parameters: both fractions and the quarantine override.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, ActionParameters) {
  const RuleSet rs = loader.parse(nlohmann::json::parse(kRulesetText));
  EXPECT_DOUBLE_EQ(rs.reduce_fraction, 0.5);
  EXPECT_DOUBLE_EQ(rs.portfolio_reduce_fraction, 0.25);
  ASSERT_TRUE(rs.quarantine_sessions_override.has_value());
  EXPECT_EQ(*rs.quarantine_sessions_override, 10);
}

// -----------------------------------------------------------------------------
// 4. Defaults: the portfolio fraction follows the ticker fraction and a zero
//    reentry value is no override.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, DefaultsWhenSectionsAbsent) {
  const RuleSet rs = loader.parse(nlohmann::json::parse(R"({
    "ruleset_id": "MINIMAL",
    "priority_order": ["HARD_STOP"],
    "actions": {"reduce": {"fraction_of_position_to_sell": 0.3}},
    "reentry": {"quarantine_sessions_after_zero": 0}
  })"));

  EXPECT_DOUBLE_EQ(rs.reduce_fraction, 0.3);
  EXPECT_DOUBLE_EQ(rs.portfolio_reduce_fraction, 0.3);
  EXPECT_FALSE(rs.quarantine_sessions_override.has_value());

  // HARD_STOP is ranked but has no block: it never triggers.
  ASSERT_EQ(rs.priority_order.size(), 1u);
  EXPECT_EQ(ruleBlock(rs.priority_order[0])->mode,
            ConditionBlock::Mode::Never);
}

// -----------------------------------------------------------------------------
// 5. Names from the other scope are flagged and kept without a metric.
// Why: such a condition must read null instead of the same-named field of
//      the other metrics record.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, ScopeMismatchReadsNull) {
  const RuleSet rs = loader.parse(nlohmann::json::parse(R"({
    "priority_order": ["PORTFOLIO_HARD_STOP", "HARD_STOP"],
    "portfolio_hard_stop": {
      "any_of": [
        {"metric": "beta_to_ibov_60d", "op": ">", "value": 1.5},
        {"metric": "drawdown_20d", "op": ">=", "value": 0.2},
        {"metric": "portfolio_var_95_1d_252d", "op": ">=", "value": 0.03}
      ],
      "action": "ZERO"
    },
    "hard_stop": {
      "any_of": [{"metric": "portfolio_drawdown_60d", "op": ">=", "value": 0.1}],
      "action": "ZERO"
    }
  })"));

  EXPECT_TRUE(hasCode(diagnostics.warnings,
                      "metric_not_in_scope:PORTFOLIO_HARD_STOP:beta_to_ibov_60d"));
  EXPECT_TRUE(hasCode(diagnostics.warnings,
                      "metric_not_in_scope:PORTFOLIO_HARD_STOP:drawdown_20d"));
  EXPECT_TRUE(hasCode(diagnostics.warnings,
                      "metric_not_in_scope:HARD_STOP:portfolio_drawdown_60d"));

  const ConditionBlock* portfolio = ruleBlock(rs.priority_order[0]);
  ASSERT_EQ(portfolio->conditions.size(), 3u);
  EXPECT_FALSE(portfolio->conditions[0].metric.has_value());
  EXPECT_FALSE(portfolio->conditions[1].metric.has_value());
  EXPECT_EQ(portfolio->conditions[2].metric, MetricField::Var95_1d_252d);

  const ConditionBlock* hard = ruleBlock(rs.priority_order[1]);
  ASSERT_EQ(hard->conditions.size(), 1u);
  EXPECT_FALSE(hard->conditions[0].metric.has_value());
}

// -----------------------------------------------------------------------------
// 6. Missing priority_order is a warning, and the ruleset holds nothing.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, MissingPriorityOrder) {
  const RuleSet rs = loader.parse(nlohmann::json::parse(R"({"ruleset_id": "X"})"));
  EXPECT_TRUE(rs.priority_order.empty());
  EXPECT_TRUE(hasCode(diagnostics.warnings, "ruleset_without_priority_order"));
}

// -----------------------------------------------------------------------------
// 7. Unreadable file and malformed JSON are errors, not exceptions.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, FileErrorsAreRecorded) {
  EXPECT_FALSE(loader.loadFile("/nonexistent/ruleset.json").has_value());
  EXPECT_TRUE(
      hasCode(diagnostics.errors, "ruleset_not_found:/nonexistent/ruleset.json"));

  const std::string path = ::testing::TempDir() + "stoplab_bad_ruleset.json";
  {
    std::ofstream out(path);
    out << "{ \"ruleset_id\": ";
  }
  EXPECT_FALSE(loader.loadFile(path).has_value());
  EXPECT_EQ(diagnostics.errors.size(), 2u);
  EXPECT_EQ(diagnostics.errors[1].rfind("ruleset_parse_error:", 0), 0u);
  std::remove(path.c_str());
}

// -----------------------------------------------------------------------------
// 8. loadFile() round trip through disk.
// -----------------------------------------------------------------------------
TEST_F(RuleSetLoaderTest, LoadsFromDisk) {
  const std::string path = ::testing::TempDir() + "stoplab_ruleset.json";
  {
    std::ofstream out(path);
    out << kRulesetText;
  }
  const auto rs = loader.loadFile(path);
  ASSERT_TRUE(rs.has_value());
  EXPECT_EQ(rs->ruleset_id, "SELL_RULESET_A");
  EXPECT_TRUE(diagnostics.overallPass());
  std::remove(path.c_str());
}
