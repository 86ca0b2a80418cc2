#include "stoplab/engine/report_writer.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace stoplab {

namespace {

std::string fixed(double value, int decimals) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(decimals) << value;
  return os.str();
}

std::string cell(const std::optional<double>& value) {
  if (!value) {
    return {};
  }
  std::ostringstream os;
  os << std::setprecision(10) << *value;
  return os.str();
}

std::string cell(const std::optional<bool>& value) {
  if (!value) {
    return {};
  }
  return *value ? "true" : "false";
}

nlohmann::json optionalDate(const std::optional<Date>& date) {
  return date ? nlohmann::json(date->toString()) : nlohmann::json(nullptr);
}

std::ofstream openFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw std::runtime_error("ReportWriter: cannot create " +
                             path.parent_path().string() + ": " +
                             ec.message());
  }
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("ReportWriter: cannot open " + path.string());
  }
  return out;
}

}  // namespace

void ReportWriter::writeOrdersCsv(std::ostream& out,
                                  const std::vector<domain::Order>& orders) {
  out << "date,action,ticker,qty,price,fee_total,cash_delta_date,"
         "settlement_date,rule_id_or_reason\n";
  for (const auto& o : orders) {
    out << o.date.toString() << ',' << domain::toString(o.side) << ','
        << o.ticker << ',' << o.quantity << ',' << fixed(o.price, 4) << ','
        << fixed(o.fee, 4) << ',' << o.cash_delta_date.toString() << ','
        << o.settlement_date.toString() << ',' << o.reason << '\n';
  }
}

void ReportWriter::writeEquityCsv(
    std::ostream& out, const std::vector<domain::EquitySnapshot>& rows) {
  out << "date,equity\n";
  for (const auto& row : rows) {
    out << row.date.toString() << ',' << fixed(row.equity, 2) << '\n';
  }
}

void ReportWriter::writeDecisionsCsv(
    std::ostream& out, const std::vector<DecisionRecord>& decisions) {
  out << "date,asof_date,ticker,drawdown_20d,drawdown_60d,var_95,cvar_95,"
         "vol_ratio,below_sma_100,below_sma_200,beta,triggered_rule,action\n";
  for (const auto& d : decisions) {
    const TickerMetrics& m = d.metrics;
    out << d.date.toString() << ',' << d.asof_date.toString() << ','
        << d.ticker << ',' << cell(m.drawdown_20d) << ','
        << cell(m.drawdown_60d) << ',' << cell(m.var_95_1d_252d) << ','
        << cell(m.cvar_95_1d_252d) << ',' << cell(m.vol_60d_over_252d) << ','
        << cell(m.close_below_sma_100) << ',' << cell(m.close_below_sma_200)
        << ',' << cell(m.beta_to_benchmark_60d) << ',' << d.rule_id << ','
        << rules::toString(d.action) << '\n';
  }
}

nlohmann::json ReportWriter::summaryJson(const RunSummary& summary) {
  nlohmann::json j;
  j["initial_capital"] = summary.initial_capital;
  j["final_value"] = summary.final_value;
  j["total_return"] = summary.total_return;
  j["max_drawdown"] = summary.max_drawdown;
  j["n_orders"] = summary.n_orders;
  j["n_buy_orders"] = summary.n_buy_orders;
  j["n_sell_orders"] = summary.n_sell_orders;
  j["n_hold"] = summary.n_hold;
  j["n_reduce"] = summary.n_reduce;
  j["n_zero"] = summary.n_zero;
  j["n_quarantine_events"] = summary.n_quarantine_events;
  return j;
}

nlohmann::json ReportWriter::reportJson(
    const SimulationResult& result, const ReportContext& context,
    const std::vector<std::string>& outputs) {
  const RunSummary& s = result.summary;

  nlohmann::json j;
  j["overall_pass"] = result.overallPass();
  j["run_id"] = context.run_id;
  j["inputs"] = {{"config", context.config_path},
                 {"prices", context.prices_path},
                 {"universe", context.universe_path}};
  j["outputs"] = outputs;
  j["errors"] = result.diagnostics.errors;
  j["warnings"] = result.diagnostics.warnings;
  j["decision_metrics_asof"] = "D-1";
  j["warmup_range_used"] = {{"start", optionalDate(s.warmup.start)},
                            {"end", optionalDate(s.warmup.end)},
                            {"count", s.warmup.count}};
  j["counts"] = {{"hold", s.n_hold},
                 {"reduce", s.n_reduce},
                 {"zero", s.n_zero},
                 {"quarantine_events", s.n_quarantine_events},
                 {"orders", s.n_orders}};
  j["ruleset_info"] = {{"ruleset_id", context.ruleset_id},
                       {"ruleset_path", context.ruleset_path}};
  return j;
}

// -----------------------------------------------------------------------------
// writeAll: every artefact, report last so it can list the others
// -----------------------------------------------------------------------------
std::vector<std::string> ReportWriter::writeAll(
    const SimulationResult& result, const ReportContext& context) const {
  std::vector<std::string> outputs;

  const auto orders_path = out_dir_ / "orders" / "orders.csv";
  {
    std::ofstream out = openFile(orders_path);
    writeOrdersCsv(out, result.orders);
  }
  outputs.push_back(orders_path.string());

  const auto equity_path = out_dir_ / "timeseries" / "portfolio_equity.csv";
  {
    std::ofstream out = openFile(equity_path);
    writeEquityCsv(out, result.equity);
  }
  outputs.push_back(equity_path.string());

  const auto decisions_path = out_dir_ / "metrics" / "decisions.csv";
  {
    std::ofstream out = openFile(decisions_path);
    writeDecisionsCsv(out, result.decisions);
  }
  outputs.push_back(decisions_path.string());

  const auto summary_path = out_dir_ / "metrics" / "portfolio_summary.json";
  {
    std::ofstream out = openFile(summary_path);
    out << summaryJson(result.summary).dump(2) << '\n';
  }
  outputs.push_back(summary_path.string());

  const auto report_path = out_dir_ / "lab_run_report.json";
  {
    std::ofstream out = openFile(report_path);
    out << reportJson(result, context, outputs).dump(2) << '\n';
  }
  outputs.push_back(report_path.string());

  std::cout << "[ReportWriter] Wrote " << outputs.size() << " file(s) under "
            << out_dir_.string() << "\n";
  return outputs;
}

}  // namespace stoplab
