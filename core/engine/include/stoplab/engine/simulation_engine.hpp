#pragma once

#include "stoplab/domain/order.hpp"
#include "stoplab/domain/price_history.hpp"
#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/domain/simulation_config.hpp"
#include "stoplab/domain/supervised_universe.hpp"
#include "stoplab/ledger/portfolio_ledger.hpp"
#include "stoplab/risk/risk_metrics.hpp"
#include "stoplab/risk/risk_metrics_engine.hpp"
#include "stoplab/rules/rule_engine.hpp"
#include "stoplab/rules/rule_set.hpp"
#include "stoplab/time/date.hpp"
#include "stoplab/time/trading_calendar.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stoplab {

// -----------------------------------------------------------------------------
// DecisionRecord
// -----------------------------------------------------------------------------
// One rule evaluation of one held ticker on one simulated day, with the
// metrics it was based on (read at asof_date, the previous session).
// -----------------------------------------------------------------------------
struct DecisionRecord {
  Date date;
  Date asof_date;
  std::string ticker;
  rules::RuleAction action{rules::RuleAction::Hold};
  std::string rule_id;
  rules::RuleScope scope{rules::RuleScope::Ticker};
  TickerMetrics metrics;
};

// Calendar sessions before the first simulated day, used to seed the equity
// curve. start/end are unset when there are none.
struct WarmupRange {
  std::optional<Date> start;
  std::optional<Date> end;
  std::size_t count{0};
};

// -----------------------------------------------------------------------------
// RunSummary
// -----------------------------------------------------------------------------
// Headline numbers of a replay. max_drawdown is the largest peak-to-trough
// fraction of the simulated equity rows (only positive peaks count).
// Decision counts come from rule evaluations, order counts from the log.
// -----------------------------------------------------------------------------
struct RunSummary {
  double initial_capital{0.0};
  double final_value{0.0};
  double total_return{0.0};
  double max_drawdown{0.0};

  std::size_t n_orders{0};
  std::size_t n_buy_orders{0};
  std::size_t n_sell_orders{0};

  std::size_t n_hold{0};
  std::size_t n_reduce{0};
  std::size_t n_zero{0};

  std::size_t n_quarantine_events{0};
  WarmupRange warmup;
};

// -----------------------------------------------------------------------------
// SimulationResult: everything a replay hands back
// -----------------------------------------------------------------------------
struct SimulationResult {
  std::vector<domain::Order> orders;
  std::vector<domain::EquitySnapshot> equity;
  std::vector<DecisionRecord> decisions;
  RunSummary summary;
  RunDiagnostics diagnostics;

  bool overallPass() const { return diagnostics.overallPass(); }
};

// -----------------------------------------------------------------------------
// SimulationEngine
// -----------------------------------------------------------------------------
//
// @brief  Replays a sell-only ruleset over historical closes, one trading
//         session at a time, and returns the order log, the equity curve,
//         the decision trace and a summary.
//
// @details
// Setup (all problems become diagnostics, never exceptions):
//
//   1. Metric calendar = every quote date of the supervised tickers.
//      Rolling metrics are materialised for every supervised ticker on it
//      by RiskMetricsEngine (in parallel) before the loop starts.
//   2. Trading calendar = metric calendar dates on or after the warm-up
//      start. Empty -> error no_trading_dates, weekdays between the
//      configured dates are used instead.
//   3. Start = first session on or after start_date (or the first session).
//      None -> error start_date_not_found and start_date is inserted.
//   4. End = end_date (or the last session). end < start -> error
//      invalid_end_date_fallback, the last session is used. Sessions after
//      the end are dropped, so settlements clamp to the end.
//   5. Equity history is seeded with initial capital on every session
//      before the start.
//
// Daily step for each simulated day D (asof = previous session):
//
//   D has no previous session -> skipped, equity row = initial capital.
//   advanceQuarantine(); settleCash(D)
//   portfolio metrics from equity history up to asof
//   evaluate every held ticker (RuleEngine), then execute at the asof close:
//     ZERO    sell all, quarantine, count a quarantine event
//     REDUCE  sell floor(qty * fraction), fraction by rule scope
//     HOLD    nothing; a missing asof close skips the ticker
//   drop empty positions
//   weekly buy (configured weekday, or the first simulated day)
//   equity = cash + marked positions (asof close) + pending settlements
//
// Thread model:
//   run() is single-threaded apart from the metrics pool it spins up during
//   setup. The engine holds no state between runs; one instance can run
//   several replays sequentially.
// -----------------------------------------------------------------------------
class SimulationEngine {
 public:
  static constexpr const char* kWeeklyBuyReason = "WEEKLY_BUY";

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // What: Stores the run configuration. No threads start here; the metrics
  // pool lives only for the setup phase of each run().
  // Input: config, already validated by ConfigLoader or built in code.
  // metrics_workers, the pool size for metric materialisation; 0 picks the
  // hardware concurrency.
  // -------------------------------------------------------------------------
  explicit SimulationEngine(domain::SimulationConfig config,
                            std::size_t metrics_workers = 0);

  // -------------------------------------------------------------------------
  // run(rule_set, prices, universe, setup)
  // -------------------------------------------------------------------------
  // What: Executes one full replay. Setup runs first, then the daily loop
  // over the simulated sessions, then the summary.
  // Why: This is the single entry point main.cpp and the tests drive. Every
  // data problem ends up in the returned diagnostics.
  // Thread-safety: Call from one thread. The metrics pool it starts during
  // setup is joined before the daily loop.
  // Input: rule_set, ranked rules resolved by RuleSetLoader. prices, the
  // read-only close store. universe, the supervised tickers in buy order.
  // setup, diagnostics already collected by the loaders, carried into the
  // result so that overall pass/fail covers loading too.
  // Output: SimulationResult, always returned. When no calendar can be
  // built it has no rows and at least one error.
  // @throws Only on programming errors (ledger misuse); never on bad data.
  // -------------------------------------------------------------------------
  SimulationResult run(const rules::RuleSet& rule_set,
                       const domain::PriceHistory& prices,
                       const domain::SupervisedUniverse& universe,
                       RunDiagnostics setup = {}) const;

  const domain::SimulationConfig& config() const { return config_; }

 private:
  struct Window {
    TradingCalendar calendar;
    std::vector<Date> simulated;
    std::optional<Date> start;
  };

  // Steps 2-4 of setup. calendar is empty when nothing usable exists.
  Window buildWindow(const std::vector<Date>& metric_dates,
                     RunDiagnostics& diagnostics) const;

  // Executes the day's ZERO / REDUCE decisions at the asof close. Tickers
  // without an asof close are skipped.
  void applyDecisions(Date current, Date asof,
                      const std::vector<DecisionRecord>& decisions,
                      const rules::RuleSet& rule_set,
                      const domain::PriceHistory& prices,
                      int quarantine_sessions, PortfolioLedger& ledger,
                      RunSummary& summary) const;

  // Splits cash over the open slots (target_positions minus open positions)
  // taken in universe order, skipping held and quarantined tickers. A
  // chosen ticker without an asof close keeps its slot and buys nothing.
  void weeklyBuy(Date current, Date asof, const domain::PriceHistory& prices,
                 const domain::SupervisedUniverse& universe,
                 PortfolioLedger& ledger) const;

  static double markToMarket(const PortfolioLedger& ledger, Date asof,
                             const domain::PriceHistory& prices);

  static double maxDrawdown(const std::vector<domain::EquitySnapshot>& rows);

  domain::SimulationConfig config_;
  RiskMetricsEngine metrics_engine_;
  rules::RuleEngine rule_engine_;
};

// -----------------------------------------------------------------------------
// runSimulation(config, rule_set, prices, universe, setup)
// -----------------------------------------------------------------------------
// Convenience entry point: builds a SimulationEngine and runs it once.
// -----------------------------------------------------------------------------
SimulationResult runSimulation(const domain::SimulationConfig& config,
                               const rules::RuleSet& rule_set,
                               const domain::PriceHistory& prices,
                               const domain::SupervisedUniverse& universe,
                               RunDiagnostics setup = {});

}  // namespace stoplab
