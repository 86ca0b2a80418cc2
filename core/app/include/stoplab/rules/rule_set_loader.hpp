#pragma once

#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/rules/rule_set.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

namespace stoplab {
namespace rules {

// -----------------------------------------------------------------------------
// RuleSetLoader: JSON ruleset document -> RuleSet
// -----------------------------------------------------------------------------
//
// @brief  Parses and validates a ruleset document once, up front, so the
//         replay never touches strings or JSON.
//
// @details
// Document shape:
//
//   {
//     "ruleset_id": "SELL_RULESET_A",
//     "priority_order": ["HARD_STOP", "PORTFOLIO_SOFT_STOP", ...],
//     "hard_stop": {
//       "any_of": [{"metric": "drawdown_20d", "op": ">=", "value": 0.15}],
//       "action": "ZERO"
//     },
//     ...
//     "actions": {
//       "reduce": {"fraction_of_position_to_sell": 0.5},
//       "portfolio_reduce": {"fraction_each_position": 0.25}
//     },
//     "reentry": {"quarantine_sessions_after_zero": 10}
//   }
//
// Validation (all recorded into the shared RunDiagnostics, never thrown):
//   unknown rule id       warning unknown_rule_id:<id>, rule skipped
//   unknown metric        warning unknown_metric:<rule>:<name>
//   unknown operator      warning unknown_operator:<rule>:<op>
//   missing value         warning invalid_condition_value:<rule>:<name>
//   metric outside the    warning metric_not_in_scope:<rule>:<name>
//   rule's scope          (portfolio_* names in ticker rules, ticker names
//                         in portfolio rules)
//   In each of the condition cases the condition is kept with no metric:
//   it always reads null (false).
//   unreadable file       error ruleset_not_found:<path>
//   malformed JSON        error ruleset_parse_error:<what>
//
// Thread model:
//   Used once during setup on the main thread.
// -----------------------------------------------------------------------------
class RuleSetLoader {
 public:
  explicit RuleSetLoader(RunDiagnostics& diagnostics)
      : diagnostics_(diagnostics) {}

  // -------------------------------------------------------------------------
  // loadFile(path)
  // -------------------------------------------------------------------------
  // @return The parsed RuleSet, or std::nullopt when the file cannot be
  //         read or parsed (an error is recorded).
  // -------------------------------------------------------------------------
  std::optional<RuleSet> loadFile(const std::string& path);

  // Parses an already decoded document. Structural problems inside known
  // keys are recorded as warnings; defaults fill the gaps.
  RuleSet parse(const nlohmann::json& document);

 private:
  ConditionBlock parseBlock(const std::string& rule_id, RuleScope scope,
                            const nlohmann::json& block);

  RunDiagnostics& diagnostics_;
};

}  // namespace rules
}  // namespace stoplab
