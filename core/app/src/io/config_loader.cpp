#include "stoplab/io/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <limits>
#include <optional>

namespace stoplab {
namespace io {

namespace {

// Walks a dotted path ("execution.fees.fixed_per_order"). Returns nullptr
// when any level is absent or not an object.
const nlohmann::json* lookup(const nlohmann::json& doc,
                             const std::string& dotted) {
  const nlohmann::json* node = &doc;
  std::size_t start = 0;
  while (start <= dotted.size()) {
    const std::size_t dot = dotted.find('.', start);
    const std::string key = dotted.substr(
        start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!node->is_object()) {
      return nullptr;
    }
    auto it = node->find(key);
    if (it == node->end()) {
      return nullptr;
    }
    node = &*it;
    if (dot == std::string::npos) {
      return node;
    }
    start = dot + 1;
  }
  return nullptr;
}

// Integer node within [min_value, INT_MAX]. Unsigned nodes are compared
// unsigned so values above LLONG_MAX do not wrap.
bool fitsInt(const nlohmann::json& node, int min_value) {
  constexpr int kMax = std::numeric_limits<int>::max();
  if (node.is_number_unsigned()) {
    const auto value = node.get<unsigned long long>();
    return value <= static_cast<unsigned long long>(kMax) &&
           static_cast<long long>(value) >= min_value;
  }
  const auto value = node.get<long long>();
  return value >= min_value && value <= kMax;
}

class FieldReader {
 public:
  FieldReader(const nlohmann::json& doc, RunDiagnostics& diagnostics)
      : doc_(doc), diagnostics_(diagnostics) {}

  void number(const std::string& key, double& out, double min_value) {
    const nlohmann::json* node = lookup(doc_, key);
    if (node == nullptr) return;
    if (!node->is_number() || node->get<double>() < min_value) {
      invalid(key);
      return;
    }
    out = node->get<double>();
  }

  void integer(const std::string& key, int& out, int min_value) {
    const nlohmann::json* node = lookup(doc_, key);
    if (node == nullptr) return;
    if (!node->is_number_integer() || !fitsInt(*node, min_value)) {
      invalid(key);
      return;
    }
    out = node->get<int>();
  }

  void boolean(const std::string& key, bool& out) {
    const nlohmann::json* node = lookup(doc_, key);
    if (node == nullptr) return;
    if (!node->is_boolean()) {
      invalid(key);
      return;
    }
    out = node->get<bool>();
  }

  void text(const std::string& key, std::string& out) {
    const nlohmann::json* node = lookup(doc_, key);
    if (node == nullptr) return;
    if (!node->is_string()) {
      invalid(key);
      return;
    }
    out = node->get<std::string>();
  }

  void weekday(const std::string& key, Weekday& out) {
    std::string raw;
    text(key, raw);
    if (raw.empty()) return;
    if (auto parsed = parseWeekday(raw)) {
      out = *parsed;
    } else {
      invalid(key);
    }
  }

  void date(const std::string& key, std::optional<Date>& out) {
    std::string raw;
    text(key, raw);
    if (raw.empty()) return;
    if (auto parsed = Date::parse(raw)) {
      out = *parsed;
    } else {
      invalid(key);
    }
  }

 private:
  void invalid(const std::string& key) {
    diagnostics_.error("config_invalid_field:" + key);
    std::cerr << "[ConfigLoader] ERROR: invalid value for " << key
              << ", keeping default\n";
  }

  const nlohmann::json& doc_;
  RunDiagnostics& diagnostics_;
};

}  // namespace

domain::SimulationConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    diagnostics_.error("config_not_found:" + path);
    std::cerr << "[ConfigLoader] ERROR: cannot open " << path
              << ", using defaults\n";
    return domain::SimulationConfig{};
  }

  try {
    const nlohmann::json document = nlohmann::json::parse(in);
    return parse(document);
  } catch (const nlohmann::json::exception& e) {
    diagnostics_.error(std::string("config_parse_error:") + e.what());
    std::cerr << "[ConfigLoader] ERROR: " << path << ": " << e.what() << "\n";
    return domain::SimulationConfig{};
  }
}

domain::SimulationConfig ConfigLoader::parse(const nlohmann::json& document) {
  domain::SimulationConfig config;
  if (!document.is_object()) {
    diagnostics_.error("config_parse_error:document is not an object");
    return config;
  }

  FieldReader read(document, diagnostics_);
  read.number("portfolio.initial_capital", config.initial_capital, 0.0);
  read.integer("portfolio.target_positions", config.target_positions, 0);
  read.number("execution.fees.percent_per_order", config.fees.percent, 0.0);
  read.number("execution.fees.fixed_per_order", config.fees.fixed, 0.0);
  read.integer("execution.sell_settlement_days", config.sell_settlement_days,
               0);
  read.boolean("weekly_buy.enabled", config.weekly_buy_enabled);
  read.weekday("weekly_buy.day_of_week", config.weekly_buy_weekday);
  read.integer("quarantine.sessions_after_zero", config.quarantine_sessions,
               0);
  read.date("horizon.history_warmup_start", config.history_warmup_start);
  read.date("horizon.start_date", config.start_date);
  read.date("horizon.end_date", config.end_date);
  read.text("data.benchmark_ticker", config.benchmark_ticker);

  std::cout << "[ConfigLoader] capital=" << config.initial_capital
            << " target_positions=" << config.target_positions
            << " settlement_days=" << config.sell_settlement_days
            << " quarantine=" << config.quarantine_sessions << "\n";
  return config;
}

}  // namespace io
}  // namespace stoplab
