#pragma once

#include "stoplab/engine/simulation_engine.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace stoplab {

// Provenance echoed into the run report.
struct ReportContext {
  std::string run_id;
  std::string ruleset_id;
  std::string ruleset_path;
  std::string config_path;
  std::string prices_path;
  std::string universe_path;
};

// -----------------------------------------------------------------------------
// ReportWriter: persists a SimulationResult under an output directory
// -----------------------------------------------------------------------------
//
// @brief  Writes the audit artefacts of one replay.
//
// @details
// Layout below the output directory:
//
//   orders/orders.csv                 date,action,ticker,qty,price,
//                                     fee_total,cash_delta_date,
//                                     settlement_date,rule_id_or_reason
//                                     (price and fee with 4 decimals)
//   timeseries/portfolio_equity.csv   date,equity (2 decimals)
//   metrics/decisions.csv             per-day rule evaluations with the
//                                     asof metrics (empty cell = null)
//   metrics/portfolio_summary.json    RunSummary
//   lab_run_report.json               pass flag, errors, warnings, counts,
//                                     warm-up range, ruleset info, outputs
//
// Column order of the CSV files is fixed; rows follow the result order, so
// identical results give byte-identical files.
//
// The stream writers are public so tests can check content without
// touching the filesystem.
//
// @throws std::runtime_error from writeAll() when a directory cannot be
//         created or a file cannot be opened.
// -----------------------------------------------------------------------------
class ReportWriter {
 public:
  explicit ReportWriter(std::filesystem::path out_dir)
      : out_dir_(std::move(out_dir)) {}

  // Writes every artefact; returns the paths written, report last.
  std::vector<std::string> writeAll(const SimulationResult& result,
                                    const ReportContext& context) const;

  static void writeOrdersCsv(std::ostream& out,
                             const std::vector<domain::Order>& orders);
  static void writeEquityCsv(std::ostream& out,
                             const std::vector<domain::EquitySnapshot>& rows);
  static void writeDecisionsCsv(std::ostream& out,
                                const std::vector<DecisionRecord>& decisions);

  static nlohmann::json summaryJson(const RunSummary& summary);
  static nlohmann::json reportJson(const SimulationResult& result,
                                   const ReportContext& context,
                                   const std::vector<std::string>& outputs);

 private:
  std::filesystem::path out_dir_;
};

}  // namespace stoplab
