#pragma once

#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/domain/simulation_config.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace stoplab {
namespace io {

// -----------------------------------------------------------------------------
// ConfigLoader: JSON run configuration -> SimulationConfig
// -----------------------------------------------------------------------------
//
// @brief  Reads the run configuration document. Every field is optional;
//         anything absent keeps the SimulationConfig default.
//
// @details
// Recognised keys:
//
//   portfolio.initial_capital            number  (default 500000)
//   portfolio.target_positions           integer (default 10)
//   execution.fees.percent_per_order     number  (default 0)
//   execution.fees.fixed_per_order       number  (default 0)
//   execution.sell_settlement_days       integer (default 2)
//   weekly_buy.enabled                   bool    (default true)
//   weekly_buy.day_of_week               "MON".."SUN" (default "MON")
//   quarantine.sessions_after_zero       integer (default 10)
//   horizon.history_warmup_start         "YYYY-MM-DD"
//   horizon.start_date                   "YYYY-MM-DD"
//   horizon.end_date                     "YYYY-MM-DD"
//   data.benchmark_ticker                string  (default "_BVSP")
//
// A field with the wrong type or an out-of-range value records
// config_invalid_field:<dotted.key> as an error and keeps the default. An
// unreadable file records config_not_found:<path>; malformed JSON records
// config_parse_error:<what>. Neither throws.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  explicit ConfigLoader(RunDiagnostics& diagnostics)
      : diagnostics_(diagnostics) {}

  domain::SimulationConfig loadFile(const std::string& path);
  domain::SimulationConfig parse(const nlohmann::json& document);

 private:
  RunDiagnostics& diagnostics_;
};

}  // namespace io
}  // namespace stoplab
