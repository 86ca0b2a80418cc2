#include "stoplab/rules/rule_set_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

namespace stoplab {
namespace rules {

namespace {

// Numeric field inside nested objects, or std::nullopt if any level is
// missing or not of the expected type.
std::optional<double> nestedNumber(const nlohmann::json& doc,
                                   const char* section, const char* key) {
  auto outer = doc.find(section);
  if (outer == doc.end() || !outer->is_object()) {
    return std::nullopt;
  }
  auto inner = outer->find(key);
  if (inner == outer->end() || !inner->is_number()) {
    return std::nullopt;
  }
  return inner->get<double>();
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFile: read + decode, converting failures into diagnostics
// -----------------------------------------------------------------------------
std::optional<RuleSet> RuleSetLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    diagnostics_.error("ruleset_not_found:" + path);
    std::cerr << "[RuleSetLoader] ERROR: cannot open ruleset " << path << "\n";
    return std::nullopt;
  }

  try {
    nlohmann::json document = nlohmann::json::parse(in);
    RuleSet rule_set = parse(document);
    std::cout << "[RuleSetLoader] Loaded ruleset '" << rule_set.ruleset_id
              << "' with " << rule_set.priority_order.size()
              << " ranked rule(s) from " << path << "\n";
    return rule_set;
  } catch (const nlohmann::json::exception& e) {
    diagnostics_.error(std::string("ruleset_parse_error:") + e.what());
    std::cerr << "[RuleSetLoader] ERROR: " << path << ": " << e.what() << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// parse: priority walk, per-rule blocks, shared action parameters
// -----------------------------------------------------------------------------
RuleSet RuleSetLoader::parse(const nlohmann::json& document) {
  RuleSet rule_set;
  if (!document.is_object()) {
    diagnostics_.error("ruleset_parse_error:document is not an object");
    return rule_set;
  }

  auto id_it = document.find("ruleset_id");
  if (id_it != document.end() && id_it->is_string()) {
    rule_set.ruleset_id = id_it->get<std::string>();
  }

  auto order_it = document.find("priority_order");
  if (order_it != document.end() && order_it->is_array()) {
    for (const auto& entry : *order_it) {
      if (!entry.is_string()) {
        diagnostics_.warn("unknown_rule_id:" + entry.dump());
        continue;
      }
      const std::string id = entry.get<std::string>();
      std::optional<Rule> rule = makeRule(id);
      if (!rule) {
        diagnostics_.warn("unknown_rule_id:" + id);
        std::cerr << "[RuleSetLoader] WARNING: unknown rule id " << id
                  << " skipped\n";
        continue;
      }

      if (ConditionBlock* block = ruleBlock(*rule)) {
        auto block_it = document.find(std::string(ruleBlockKey(*rule)));
        if (block_it != document.end()) {
          *block = parseBlock(id, ruleScope(*rule), *block_it);
        }
      }
      rule_set.priority_order.push_back(std::move(*rule));
    }
  } else {
    diagnostics_.warn("ruleset_without_priority_order");
  }

  if (auto fraction = nestedNumber(document.value("actions", nlohmann::json{}),
                                   "reduce", "fraction_of_position_to_sell")) {
    rule_set.reduce_fraction = *fraction;
  }
  rule_set.portfolio_reduce_fraction = rule_set.reduce_fraction;
  if (auto fraction = nestedNumber(document.value("actions", nlohmann::json{}),
                                   "portfolio_reduce",
                                   "fraction_each_position")) {
    rule_set.portfolio_reduce_fraction = *fraction;
  }

  if (auto sessions = nestedNumber(document, "reentry",
                                   "quarantine_sessions_after_zero")) {
    if (*sessions != 0.0) {
      rule_set.quarantine_sessions_override = static_cast<int>(*sessions);
    }
  }

  return rule_set;
}

// -----------------------------------------------------------------------------
// parseBlock: any_of / all_of list and the raw action
// -----------------------------------------------------------------------------
ConditionBlock RuleSetLoader::parseBlock(const std::string& rule_id,
                                         RuleScope scope,
                                         const nlohmann::json& block) {
  ConditionBlock result;
  if (!block.is_object()) {
    diagnostics_.warn("invalid_rule_block:" + rule_id);
    return result;
  }

  const nlohmann::json* list = nullptr;
  auto any_it = block.find("any_of");
  auto all_it = block.find("all_of");
  if (any_it != block.end() && any_it->is_array()) {
    result.mode = ConditionBlock::Mode::AnyOf;
    list = &*any_it;
  } else if (all_it != block.end() && all_it->is_array()) {
    result.mode = ConditionBlock::Mode::AllOf;
    list = &*all_it;
  }

  auto action_it = block.find("action");
  if (action_it != block.end() && action_it->is_string()) {
    result.action = normalizeAction(action_it->get<std::string>());
  }

  if (list == nullptr) {
    return result;
  }

  const MetricScope wanted = scope == RuleScope::Portfolio
                                 ? MetricScope::Portfolio
                                 : MetricScope::Ticker;

  for (const auto& item : *list) {
    // Every entry keeps its slot; an unresolved one reads null.
    Condition condition;
    if (!item.is_object()) {
      diagnostics_.warn("invalid_condition:" + rule_id);
      result.conditions.push_back(condition);
      continue;
    }
    const std::string metric_name = item.value("metric", std::string{});
    const std::string op_text = item.value("op", std::string{});
    bool resolved = true;

    std::optional<MetricName> metric = parseMetricName(metric_name);
    if (!metric) {
      diagnostics_.warn("unknown_metric:" + rule_id + ":" + metric_name);
      std::cerr << "[RuleSetLoader] WARNING: " << rule_id
                << " references unknown metric '" << metric_name << "'\n";
      resolved = false;
    } else if (metric->scope != wanted) {
      diagnostics_.warn("metric_not_in_scope:" + rule_id + ":" + metric_name);
      resolved = false;
    }

    std::optional<CompareOp> op = parseCompareOp(op_text);
    if (op) {
      condition.op = *op;
    } else {
      diagnostics_.warn("unknown_operator:" + rule_id + ":" + op_text);
      resolved = false;
    }

    auto value_it = item.find("value");
    if (value_it != item.end() && value_it->is_boolean()) {
      condition.value = value_it->get<bool>() ? 1.0 : 0.0;
    } else if (value_it != item.end() && value_it->is_number()) {
      condition.value = value_it->get<double>();
    } else {
      diagnostics_.warn("invalid_condition_value:" + rule_id + ":" +
                        metric_name);
      resolved = false;
    }

    if (resolved) {
      condition.metric = metric->field;
    }
    result.conditions.push_back(condition);
  }
  return result;
}

}  // namespace rules
}  // namespace stoplab
