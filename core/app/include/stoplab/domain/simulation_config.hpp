#pragma once

#include "stoplab/time/date.hpp"

#include <optional>
#include <string>

namespace stoplab {
namespace domain {

// -----------------------------------------------------------------------------
// FeeModel: per-order brokerage cost
// -----------------------------------------------------------------------------
// fee = notional * percent + fixed, charged on every buy and every sell.
// -----------------------------------------------------------------------------
struct FeeModel {
  double percent{0.0};
  double fixed{0.0};

  double feeFor(double notional) const { return notional * percent + fixed; }
};

// -----------------------------------------------------------------------------
// SimulationConfig: run-wide parameters
// -----------------------------------------------------------------------------
//
// @brief  Typed configuration handed to runSimulation(). Built once by
//         ConfigLoader (or directly by tests) and copied into the engine.
//
// @details
// Every field has a default so a partially specified document still yields
// a runnable configuration. Dates are optional:
//
//   history_warmup_start  earliest session kept in the trading calendar.
//                         Unset keeps every quote date.
//   start_date            first simulated day is the first session on or
//                         after this date. Unset starts at the first
//                         session of the calendar.
//   end_date              last simulated day. Unset runs to the last
//                         session.
//
// Thread model:
//   Plain value type; copied into SimulationEngine at construction.
// -----------------------------------------------------------------------------
struct SimulationConfig {
  /// Starting cash balance.
  double initial_capital{500000.0};

  /// Number of positions the weekly buy tries to fill.
  int target_positions{10};

  FeeModel fees;

  /// Trading sessions between a sale and the day its proceeds become cash.
  int sell_settlement_days{2};

  bool weekly_buy_enabled{true};
  Weekday weekly_buy_weekday{Weekday::Monday};

  /// Sessions a ticker stays ineligible for buying after a ZERO exit.
  int quarantine_sessions{10};

  std::optional<Date> history_warmup_start;
  std::optional<Date> start_date;
  std::optional<Date> end_date;

  /// Ticker of the benchmark series used for beta and benchmark volatility.
  /// Empty disables benchmark metrics.
  std::string benchmark_ticker{"_BVSP"};
};

}  // namespace domain
}  // namespace stoplab
