#include "stoplab/rules/rule_set.hpp"

#include <type_traits>

namespace stoplab {
namespace rules {

namespace {

template <typename T>
constexpr bool kHasBlock = !std::is_same_v<T, ExitIfNotInSupervised>;

// Tries each alternative of Rule in turn; the first whose kId matches is
// emplaced into out.
template <std::size_t I = 0>
void makeRuleAt(const std::string& id, std::optional<Rule>& out) {
  if constexpr (I < std::variant_size_v<Rule>) {
    using Kind = std::variant_alternative_t<I, Rule>;
    if (id == Kind::kId) {
      out.emplace(std::in_place_type<Kind>);
      return;
    }
    makeRuleAt<I + 1>(id, out);
  }
}

}  // namespace

std::optional<CompareOp> parseCompareOp(const std::string& text) {
  if (text == ">=") return CompareOp::GreaterEqual;
  if (text == "<=") return CompareOp::LessEqual;
  if (text == ">") return CompareOp::Greater;
  if (text == "<") return CompareOp::Less;
  if (text == "==") return CompareOp::Equal;
  if (text == "!=") return CompareOp::NotEqual;
  return std::nullopt;
}

const char* toString(CompareOp op) {
  switch (op) {
    case CompareOp::GreaterEqual:
      return ">=";
    case CompareOp::LessEqual:
      return "<=";
    case CompareOp::Greater:
      return ">";
    case CompareOp::Less:
      return "<";
    case CompareOp::Equal:
      return "==";
    case CompareOp::NotEqual:
      return "!=";
  }
  return "?";
}

RuleAction normalizeAction(const std::string& raw) {
  if (raw == "ZERO" || raw == "TICKER_ZERO") {
    return RuleAction::Zero;
  }
  if (raw == "REDUCE" || raw == "PORTFOLIO_REDUCE") {
    return RuleAction::Reduce;
  }
  return RuleAction::Hold;
}

const char* toString(RuleAction action) {
  switch (action) {
    case RuleAction::Hold:
      return "HOLD";
    case RuleAction::Reduce:
      return "REDUCE";
    case RuleAction::Zero:
      return "ZERO";
  }
  return "HOLD";
}

std::string_view ruleId(const Rule& rule) {
  return std::visit(
      []([[maybe_unused]] const auto& r) -> std::string_view {
        return std::decay_t<decltype(r)>::kId;
      },
      rule);
}

RuleScope ruleScope(const Rule& rule) {
  return std::visit(
      []([[maybe_unused]] const auto& r) {
        return std::decay_t<decltype(r)>::kScope;
      },
      rule);
}

std::optional<Rule> makeRule(const std::string& id) {
  std::optional<Rule> rule;
  makeRuleAt(id, rule);
  return rule;
}

const ConditionBlock* ruleBlock(const Rule& rule) {
  return std::visit(
      []([[maybe_unused]] const auto& r) -> const ConditionBlock* {
        using Kind = std::decay_t<decltype(r)>;
        if constexpr (kHasBlock<Kind>) {
          return &r.block;
        } else {
          return nullptr;
        }
      },
      rule);
}

ConditionBlock* ruleBlock(Rule& rule) {
  return std::visit(
      []([[maybe_unused]] auto& r) -> ConditionBlock* {
        using Kind = std::decay_t<decltype(r)>;
        if constexpr (kHasBlock<Kind>) {
          return &r.block;
        } else {
          return nullptr;
        }
      },
      rule);
}

std::string_view ruleBlockKey(const Rule& rule) {
  return std::visit(
      []([[maybe_unused]] const auto& r) -> std::string_view {
        using Kind = std::decay_t<decltype(r)>;
        if constexpr (kHasBlock<Kind>) {
          return Kind::kBlockKey;
        } else {
          return {};
        }
      },
      rule);
}

}  // namespace rules
}  // namespace stoplab
