#include "stoplab/engine/simulation_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <utility>

namespace stoplab {

SimulationEngine::SimulationEngine(domain::SimulationConfig config,
                                   std::size_t metrics_workers)
    : config_(std::move(config)), metrics_engine_(metrics_workers) {}

// -----------------------------------------------------------------------------
// buildWindow: trading calendar, start and end of the replay
// -----------------------------------------------------------------------------
SimulationEngine::Window SimulationEngine::buildWindow(
    const std::vector<Date>& metric_dates, RunDiagnostics& diagnostics) const {
  Window window;

  std::vector<Date> sessions;
  for (const Date& d : metric_dates) {
    if (!config_.history_warmup_start || d >= *config_.history_warmup_start) {
      sessions.push_back(d);
    }
  }
  window.calendar = TradingCalendar(std::move(sessions));

  if (window.calendar.empty()) {
    diagnostics.error("no_trading_dates");
    const std::optional<Date> first = config_.history_warmup_start
                                          ? config_.history_warmup_start
                                          : config_.start_date;
    const std::optional<Date> last =
        config_.end_date ? config_.end_date : config_.start_date;
    if (first && last) {
      window.calendar = TradingCalendar::weekdays(*first, *last);
    }
    if (window.calendar.empty()) {
      diagnostics.error("no_simulation_dates");
      std::cerr << "[SimulationEngine] ERROR: no calendar can be built\n";
      return window;
    }
    std::cerr << "[SimulationEngine] WARNING: no quote dates, falling back to "
              << window.calendar.size() << " weekday session(s)\n";
  }

  Date start = window.calendar.front();
  if (config_.start_date) {
    if (auto first = window.calendar.firstOnOrAfter(*config_.start_date)) {
      start = *first;
    } else {
      diagnostics.error("start_date_not_found");
      window.calendar.insert(*config_.start_date);
      start = *config_.start_date;
    }
  }

  Date end = config_.end_date ? *config_.end_date : window.calendar.back();
  if (end < start) {
    diagnostics.error("invalid_end_date_fallback");
    end = window.calendar.back();
  }
  window.calendar.truncateAfter(end);

  window.start = start;
  window.simulated = window.calendar.between(start, end);
  if (window.simulated.empty()) {
    diagnostics.error("no_simulation_dates");
  }
  return window;
}

// -----------------------------------------------------------------------------
// run: setup, then the sequential daily loop
// -----------------------------------------------------------------------------
SimulationResult SimulationEngine::run(
    const rules::RuleSet& rule_set, const domain::PriceHistory& prices,
    const domain::SupervisedUniverse& universe, RunDiagnostics setup) const {
  SimulationResult result;
  result.diagnostics = std::move(setup);
  RunDiagnostics& diagnostics = result.diagnostics;

  const double initial = config_.initial_capital;
  result.summary.initial_capital = initial;
  result.summary.final_value = initial;

  if (prices.empty()) {
    diagnostics.error("no_prices_loaded");
  }
  for (const auto& ticker : universe.tickers()) {
    if (!prices.empty() && !prices.hasTicker(ticker)) {
      diagnostics.warn("price_missing_for_universe_ticker:" + ticker);
    }
  }
  if (!config_.benchmark_ticker.empty() &&
      !prices.hasTicker(config_.benchmark_ticker)) {
    diagnostics.warn("benchmark_not_found:" + config_.benchmark_ticker);
  }

  const std::vector<Date> metric_dates = prices.datesFor(universe.tickers());
  Window window = buildWindow(metric_dates, diagnostics);
  if (window.calendar.empty() || !window.start) {
    return result;
  }
  const TradingCalendar& calendar = window.calendar;

  const MetricsMatrix metrics = metrics_engine_.computeAll(
      prices, universe.tickers(), metric_dates, config_.benchmark_ticker);

  EquityHistory history;
  for (const Date& d : calendar.dates()) {
    if (d >= *window.start) {
      break;
    }
    history[d] = initial;
    if (!result.summary.warmup.start) {
      result.summary.warmup.start = d;
    }
    result.summary.warmup.end = d;
    ++result.summary.warmup.count;
  }

  const int quarantine_sessions = rule_set.quarantine_sessions_override
                                      ? *rule_set.quarantine_sessions_override
                                      : config_.quarantine_sessions;

  PortfolioLedger ledger(initial, config_.fees, config_.sell_settlement_days,
                         calendar);

  std::cout << "[SimulationEngine] Replaying " << window.simulated.size()
            << " session(s) from " << window.start->toString() << " with "
            << universe.size() << " supervised ticker(s), ruleset '"
            << rule_set.ruleset_id << "'\n";

  for (const Date& current : window.simulated) {
    const std::optional<Date> asof = calendar.previous(current);
    if (!asof) {
      result.equity.push_back(domain::EquitySnapshot{current, initial});
      continue;
    }

    ledger.advanceQuarantine();
    ledger.settleCash(current);

    const PortfolioMetrics portfolio =
        RiskMetricsEngine::computePortfolioMetrics(history, *asof);

    // Evaluate every holding first, execute afterwards: decisions of one
    // ticker never see the trades of another on the same day.
    std::vector<DecisionRecord> today;
    today.reserve(ledger.positions().size());
    for (const Holding& holding : ledger.positions()) {
      DecisionRecord record;
      record.date = current;
      record.asof_date = *asof;
      record.ticker = holding.ticker;
      record.metrics = metrics.at(holding.ticker, *asof);

      const rules::RuleDecision decision = rule_engine_.evaluate(
          holding.ticker, record.metrics, portfolio, rule_set, universe);
      record.action = decision.action;
      record.rule_id = decision.rule_id;
      record.scope = decision.scope;

      switch (decision.action) {
        case rules::RuleAction::Hold:
          ++result.summary.n_hold;
          break;
        case rules::RuleAction::Reduce:
          ++result.summary.n_reduce;
          break;
        case rules::RuleAction::Zero:
          ++result.summary.n_zero;
          break;
      }
      today.push_back(std::move(record));
    }

    applyDecisions(current, *asof, today, rule_set, prices,
                   quarantine_sessions, ledger, result.summary);
    ledger.dropEmptyPositions();

    const bool buy_day =
        (config_.weekly_buy_enabled &&
         current.weekday() == config_.weekly_buy_weekday) ||
        current == window.simulated.front();
    if (buy_day) {
      weeklyBuy(current, *asof, prices, universe, ledger);
    }

    const double equity = markToMarket(ledger, *asof, prices);
    history[current] = equity;
    result.equity.push_back(domain::EquitySnapshot{current, equity});

    result.decisions.insert(result.decisions.end(),
                            std::make_move_iterator(today.begin()),
                            std::make_move_iterator(today.end()));
  }

  result.orders = ledger.orders();

  RunSummary& summary = result.summary;
  summary.n_orders = result.orders.size();
  for (const auto& order : result.orders) {
    if (order.side == domain::Side::Buy) {
      ++summary.n_buy_orders;
    } else {
      ++summary.n_sell_orders;
    }
  }
  if (!result.equity.empty()) {
    summary.final_value = result.equity.back().equity;
  }
  summary.total_return = initial != 0.0 ? summary.final_value / initial - 1.0
                                        : 0.0;
  summary.max_drawdown = maxDrawdown(result.equity);

  std::cout << "[SimulationEngine] Finished: final_value="
            << summary.final_value << " orders=" << summary.n_orders
            << " quarantine_events=" << summary.n_quarantine_events
            << " errors=" << diagnostics.errors.size() << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// applyDecisions: ZERO / REDUCE at the asof close
// -----------------------------------------------------------------------------
void SimulationEngine::applyDecisions(
    Date current, Date asof, const std::vector<DecisionRecord>& decisions,
    const rules::RuleSet& rule_set, const domain::PriceHistory& prices,
    int quarantine_sessions, PortfolioLedger& ledger,
    RunSummary& summary) const {
  for (const auto& decision : decisions) {
    if (decision.action == rules::RuleAction::Hold) {
      continue;
    }
    const std::optional<double> price = prices.close(decision.ticker, asof);
    if (!price) {
      continue;
    }
    const std::int64_t held = ledger.quantity(decision.ticker);
    if (held <= 0) {
      continue;
    }

    if (decision.action == rules::RuleAction::Zero) {
      ledger.applySell(current, decision.ticker, held, *price,
                       decision.rule_id);
      ledger.quarantine(decision.ticker, quarantine_sessions);
      ++summary.n_quarantine_events;
      continue;
    }

    const double fraction = rule_set.reduceFractionFor(decision.scope);
    const std::int64_t sell_qty = std::min(
        held, static_cast<std::int64_t>(
                  std::floor(static_cast<double>(held) * fraction)));
    if (sell_qty > 0) {
      ledger.applySell(current, decision.ticker, sell_qty, *price,
                       decision.rule_id);
    }
  }
}

// -----------------------------------------------------------------------------
// weeklyBuy: equal split of cash over the first open slots
// -----------------------------------------------------------------------------
void SimulationEngine::weeklyBuy(Date current, Date asof,
                                 const domain::PriceHistory& prices,
                                 const domain::SupervisedUniverse& universe,
                                 PortfolioLedger& ledger) const {
  const long long open = static_cast<long long>(config_.target_positions) -
                         static_cast<long long>(ledger.openPositionCount());
  if (open <= 0 || !(ledger.cash() > 0.0)) {
    return;
  }

  std::vector<std::string> selected;
  for (const auto& ticker : universe.tickers()) {
    if (static_cast<long long>(selected.size()) >= open) {
      break;
    }
    if (ledger.holds(ticker) || ledger.isQuarantined(ticker)) {
      continue;
    }
    selected.push_back(ticker);
  }
  if (selected.empty()) {
    return;
  }

  const domain::FeeModel& fees = config_.fees;
  const double allocation = ledger.cash() / static_cast<double>(selected.size());
  for (const auto& ticker : selected) {
    const std::optional<double> price = prices.close(ticker, asof);
    if (!price || *price <= 0.0) {
      continue;
    }
    std::int64_t qty = static_cast<std::int64_t>(
        std::floor(std::max(allocation - fees.fixed, 0.0) / *price));
    if (qty <= 0) {
      continue;
    }
    const double notional = static_cast<double>(qty) * *price;
    if (notional + fees.feeFor(notional) > ledger.cash()) {
      qty = static_cast<std::int64_t>(
          std::floor(std::max(ledger.cash() - fees.fixed, 0.0) / *price));
    }
    if (qty <= 0) {
      continue;
    }
    if (!ledger.applyBuy(current, ticker, qty, *price, kWeeklyBuyReason)) {
      std::cerr << "[SimulationEngine] WARNING: weekly buy of " << qty << " "
                << ticker << " on " << current.toString()
                << " rejected, insufficient cash\n";
    }
  }
}

double SimulationEngine::markToMarket(const PortfolioLedger& ledger, Date asof,
                                      const domain::PriceHistory& prices) {
  double positions_value = 0.0;
  for (const Holding& holding : ledger.positions()) {
    if (auto price = prices.close(holding.ticker, asof)) {
      positions_value += static_cast<double>(holding.quantity) * *price;
    }
  }
  return ledger.cash() + positions_value + ledger.pendingTotal();
}

double SimulationEngine::maxDrawdown(
    const std::vector<domain::EquitySnapshot>& rows) {
  double peak = 0.0;
  bool have_peak = false;
  double worst = 0.0;
  for (const auto& row : rows) {
    if (!have_peak || row.equity > peak) {
      peak = row.equity;
      have_peak = true;
    }
    if (peak > 0.0) {
      worst = std::max(worst, (peak - row.equity) / peak);
    }
  }
  return worst;
}

SimulationResult runSimulation(const domain::SimulationConfig& config,
                               const rules::RuleSet& rule_set,
                               const domain::PriceHistory& prices,
                               const domain::SupervisedUniverse& universe,
                               RunDiagnostics setup) {
  SimulationEngine engine(config);
  return engine.run(rule_set, prices, universe, std::move(setup));
}

}  // namespace stoplab
