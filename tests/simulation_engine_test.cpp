// =============================================================================
// simulation_engine_test.cpp
// =============================================================================
// End-to-end tests for stoplab::SimulationEngine and stoplab::ReportWriter.
//
// Validates:
//   - First-day allocation across the first open universe slots
//   - HARD_STOP exit at the asof close, quarantine and re-entry timing
//   - Sale proceeds settle exactly sell_settlement_days sessions later
//   - REDUCE fraction chosen by the rule's scope
//   - Rule priority decides between overlapping rules
//   - Cash never negative, quantities never negative
//   - Equity moves only with held marks and fees from one day to the next
//   - Replays are reproducible across metric worker counts
//   - Setup problems become diagnostics, not exceptions
//   - Report file formats
//
// Price path used by most tests (weekday sessions from 2024-01-01):
//   AAA  100 for sessions 0..24, 80 from session 25 on
//   BBB  50 flat
//   CCC  25 flat
// Session 25 (2024-02-05) is the first asof with a 20% 20-day drawdown.
// =============================================================================

#include "stoplab/domain/order.hpp"
#include "stoplab/domain/price_history.hpp"
#include "stoplab/domain/simulation_config.hpp"
#include "stoplab/domain/supervised_universe.hpp"
#include "stoplab/engine/report_writer.hpp"
#include "stoplab/engine/simulation_engine.hpp"
#include "stoplab/rules/rule_set.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using stoplab::Date;
using stoplab::ReportWriter;
using stoplab::SimulationEngine;
using stoplab::SimulationResult;
using stoplab::domain::Order;
using stoplab::domain::Side;
using namespace stoplab::rules;

namespace {

constexpr int kSessions = 41;

// Session i of a Monday-start weekday calendar.
Date session(int i) {
  return Date::fromYmd(2024, 1, 1).addDays(7 * (i / 5) + i % 5);
}

Rule stopRule(std::optional<Rule> rule, stoplab::MetricField metric,
              double threshold, RuleAction action) {
  ConditionBlock* block = ruleBlock(*rule);
  block->mode = ConditionBlock::Mode::AnyOf;
  block->conditions.push_back(
      Condition{metric, CompareOp::GreaterEqual, threshold});
  block->action = action;
  return std::move(*rule);
}

std::vector<Order> ordersFor(const SimulationResult& result,
                             const std::string& ticker, Side side) {
  std::vector<Order> out;
  for (const auto& o : result.orders) {
    if (o.ticker == ticker && o.side == side) {
      out.push_back(o);
    }
  }
  return out;
}

bool hasCode(const std::vector<std::string>& codes, const std::string& code) {
  return std::find(codes.begin(), codes.end(), code) != codes.end();
}

}  // namespace

// =============================================================================
// Test fixture: three supervised tickers, fee-free, start at session 21.
// =============================================================================
class SimulationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (int i = 0; i < kSessions; ++i) {
      prices.addQuote("AAA", session(i), i < 25 ? 100.0 : 80.0);
      prices.addQuote("BBB", session(i), 50.0);
      prices.addQuote("CCC", session(i), 25.0);
    }

    config.initial_capital = 500000.0;
    config.target_positions = 2;
    config.sell_settlement_days = 2;
    config.weekly_buy_enabled = true;
    config.weekly_buy_weekday = stoplab::Weekday::Monday;
    config.quarantine_sessions = 10;
    config.start_date = session(21);
    config.benchmark_ticker = "";

    hard_stop.ruleset_id = "HARD_ONLY";
    hard_stop.priority_order.push_back(*makeRule("EXIT_IF_NOT_IN_SUPERVISED"));
    hard_stop.priority_order.push_back(
        stopRule(makeRule("HARD_STOP"), stoplab::MetricField::Drawdown20d,
                 0.15, RuleAction::Zero));
  }

  SimulationResult run(std::size_t workers = 2) const {
    return SimulationEngine(config, workers).run(hard_stop, prices, universe);
  }

  stoplab::domain::PriceHistory prices;
  stoplab::domain::SupervisedUniverse universe{{"AAA", "BBB", "CCC"}};
  stoplab::domain::SimulationConfig config;
  RuleSet hard_stop;
};

// -----------------------------------------------------------------------------
// 1. First simulated day: cash split over the first two eligible tickers.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, FirstDayAllocation) {
  config.end_date = session(23);
  const SimulationResult result = run();

  ASSERT_TRUE(result.overallPass());
  ASSERT_EQ(result.orders.size(), 2u);

  const Order& a = result.orders[0];
  EXPECT_EQ(a.ticker, "AAA");
  EXPECT_EQ(a.side, Side::Buy);
  EXPECT_EQ(a.quantity, 2500);
  EXPECT_EQ(a.date, session(21));
  EXPECT_EQ(a.reason, SimulationEngine::kWeeklyBuyReason);

  EXPECT_EQ(result.orders[1].ticker, "BBB");
  EXPECT_EQ(result.orders[1].quantity, 5000);
  EXPECT_TRUE(ordersFor(result, "CCC", Side::Buy).empty());

  ASSERT_EQ(result.equity.size(), 3u);
  for (const auto& row : result.equity) {
    EXPECT_DOUBLE_EQ(row.equity, 500000.0);
  }
  EXPECT_EQ(result.summary.warmup.count, 21u);
  EXPECT_EQ(result.summary.warmup.start, session(0));
  EXPECT_EQ(result.summary.warmup.end, session(20));
}

// -----------------------------------------------------------------------------
// 2. HARD_STOP: full exit at the asof close, settled two sessions later,
//    ticker skipped by the next weekly buy.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, HardStopExitsAndQuarantines) {
  const SimulationResult result = run();
  ASSERT_TRUE(result.overallPass());

  const auto sells = ordersFor(result, "AAA", Side::Sell);
  ASSERT_EQ(sells.size(), 1u);
  const Order& exit = sells.front();
  EXPECT_EQ(exit.date, session(26));
  EXPECT_EQ(exit.quantity, 2500);
  EXPECT_DOUBLE_EQ(exit.price, 80.0);
  EXPECT_EQ(exit.reason, "HARD_STOP");
  EXPECT_EQ(exit.settlement_date, session(28));
  EXPECT_EQ(exit.cash_delta_date, session(28));

  // Monday 2024-02-12: AAA quarantined, BBB held -> CCC with the settled cash.
  const auto ccc = ordersFor(result, "CCC", Side::Buy);
  ASSERT_EQ(ccc.size(), 1u);
  EXPECT_EQ(ccc.front().date, session(30));
  EXPECT_EQ(ccc.front().quantity, 8000);
  EXPECT_EQ(ordersFor(result, "AAA", Side::Buy).size(), 1u);

  EXPECT_EQ(result.summary.n_zero, 1u);
  EXPECT_EQ(result.summary.n_reduce, 0u);
  EXPECT_EQ(result.summary.n_quarantine_events, 1u);
  EXPECT_EQ(result.summary.n_sell_orders, 1u);
  EXPECT_EQ(result.summary.n_buy_orders, 3u);

  EXPECT_DOUBLE_EQ(result.summary.final_value, 450000.0);
  EXPECT_NEAR(result.summary.total_return, -0.1, 1e-12);
  EXPECT_NEAR(result.summary.max_drawdown, 0.1, 1e-12);
}

// -----------------------------------------------------------------------------
// 3. Quarantine of n sessions blocks through S + n - 1.
// Why: the counter is decremented at the start of every session.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, QuarantineBoundary) {
  config.target_positions = 3;

  config.quarantine_sessions = 10;
  auto result = run();
  auto rebuys = ordersFor(result, "AAA", Side::Buy);
  ASSERT_EQ(rebuys.size(), 2u);
  EXPECT_EQ(rebuys[1].date, session(40));

  config.quarantine_sessions = 9;
  result = run();
  rebuys = ordersFor(result, "AAA", Side::Buy);
  ASSERT_EQ(rebuys.size(), 2u);
  EXPECT_EQ(rebuys[1].date, session(35));
  // 133 280 of proceeds + 100 of leftover cash at 80 per share.
  EXPECT_EQ(rebuys[1].quantity, 1667);
  EXPECT_DOUBLE_EQ(rebuys[1].price, 80.0);

  // A ruleset override wins over the configured length.
  hard_stop.quarantine_sessions_override = 10;
  result = run();
  EXPECT_EQ(ordersFor(result, "AAA", Side::Buy)[1].date, session(40));
}

// -----------------------------------------------------------------------------
// 4. Sale proceeds are not spendable before settlement.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, ProceedsWaitForSettlement) {
  // Tuesday buys fall on the sale day and on the settlement day.
  config.weekly_buy_weekday = stoplab::Weekday::Tuesday;
  config.sell_settlement_days = 5;
  const SimulationResult result = run();

  const auto sells = ordersFor(result, "AAA", Side::Sell);
  ASSERT_EQ(sells.size(), 1u);
  EXPECT_EQ(sells.front().settlement_date, session(31));

  // Tuesday 2024-02-13 (session 31) is the first buy day with settled cash.
  const auto ccc = ordersFor(result, "CCC", Side::Buy);
  ASSERT_EQ(ccc.size(), 1u);
  EXPECT_EQ(ccc.front().date, session(31));
  EXPECT_GE(ccc.front().date, sells.front().settlement_date);
}

// -----------------------------------------------------------------------------
// 5. REDUCE sells a fraction picked by scope.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, ReduceFractionByScope) {
  hard_stop.priority_order.push_back(stopRule(
      makeRule("PORTFOLIO_SOFT_STOP"), stoplab::MetricField::Drawdown20d,
      0.05, RuleAction::Reduce));
  hard_stop.reduce_fraction = 0.5;
  hard_stop.portfolio_reduce_fraction = 0.25;

  const SimulationResult result = run();
  const auto bbb = ordersFor(result, "BBB", Side::Sell);
  ASSERT_FALSE(bbb.empty());
  // Portfolio equity dropped 10% on session 26; BBB is trimmed the day after.
  EXPECT_EQ(bbb.front().date, session(27));
  EXPECT_EQ(bbb.front().quantity, 1250);
  EXPECT_EQ(bbb.front().reason, "PORTFOLIO_SOFT_STOP");
  EXPECT_GT(result.summary.n_reduce, 0u);
}

// -----------------------------------------------------------------------------
// 6. Priority: the first matching rule in the ranking acts.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, PriorityOrderDecides) {
  RuleSet soft_first;
  soft_first.reduce_fraction = 0.5;
  soft_first.priority_order.push_back(
      stopRule(makeRule("SOFT_STOP"), stoplab::MetricField::Drawdown20d, 0.10,
               RuleAction::Reduce));
  soft_first.priority_order.push_back(
      stopRule(makeRule("HARD_STOP"), stoplab::MetricField::Drawdown20d, 0.15,
               RuleAction::Zero));

  SimulationResult result =
      SimulationEngine(config, 2).run(soft_first, prices, universe);
  auto sells = ordersFor(result, "AAA", Side::Sell);
  ASSERT_FALSE(sells.empty());
  EXPECT_EQ(sells.front().reason, "SOFT_STOP");
  EXPECT_EQ(sells.front().quantity, 1250);
  EXPECT_EQ(result.summary.n_quarantine_events, 0u);

  std::swap(soft_first.priority_order[0], soft_first.priority_order[1]);
  result = SimulationEngine(config, 2).run(soft_first, prices, universe);
  sells = ordersFor(result, "AAA", Side::Sell);
  ASSERT_EQ(sells.size(), 1u);
  EXPECT_EQ(sells.front().reason, "HARD_STOP");
  EXPECT_EQ(sells.front().quantity, 2500);
}

// -----------------------------------------------------------------------------
// 7. Fees: a buy that cannot cover its fee is rejected, cash stays >= 0.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, FeesNeverDriveCashNegative) {
  config.fees.percent = 0.001;
  config.fees.fixed = 10.0;
  config.end_date = session(22);
  const SimulationResult result = run();

  // AAA takes 250 159.90 of the 500 000; BBB's resized order still needs
  // 250 059.80 against 249 840.10 and is dropped.
  ASSERT_EQ(result.orders.size(), 1u);
  EXPECT_EQ(result.orders[0].ticker, "AAA");
  EXPECT_EQ(result.orders[0].quantity, 2499);
  EXPECT_NEAR(result.orders[0].fee, 259.9, 1e-9);
  for (const auto& row : result.equity) {
    EXPECT_GT(row.equity, 0.0);
  }
}

// -----------------------------------------------------------------------------
// 8. Quantities never go negative and every order is inside the window.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, OrderLogConsistency) {
  hard_stop.priority_order.push_back(stopRule(
      makeRule("SOFT_STOP"), stoplab::MetricField::Drawdown20d, 0.0,
      RuleAction::Reduce));
  const SimulationResult result = run();

  std::map<std::string, std::int64_t> held;
  for (const auto& o : result.orders) {
    EXPECT_GT(o.quantity, 0);
    EXPECT_GE(o.date, session(21));
    EXPECT_LE(o.date, session(kSessions - 1));
    held[o.ticker] += o.side == Side::Buy ? o.quantity : -o.quantity;
    EXPECT_GE(held[o.ticker], 0) << o.ticker << " " << o.date.toString();
  }
  EXPECT_EQ(result.equity.size(), 20u);
}

// -----------------------------------------------------------------------------
// 9. Identical inputs give identical outputs for any metric worker count.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, ReproducibleAcrossWorkerCounts) {
  const SimulationResult one = run(1);
  const SimulationResult many = run(8);

  std::ostringstream a_orders, b_orders, a_equity, b_equity, a_dec, b_dec;
  ReportWriter::writeOrdersCsv(a_orders, one.orders);
  ReportWriter::writeOrdersCsv(b_orders, many.orders);
  ReportWriter::writeEquityCsv(a_equity, one.equity);
  ReportWriter::writeEquityCsv(b_equity, many.equity);
  ReportWriter::writeDecisionsCsv(a_dec, one.decisions);
  ReportWriter::writeDecisionsCsv(b_dec, many.decisions);

  EXPECT_EQ(a_orders.str(), b_orders.str());
  EXPECT_EQ(a_equity.str(), b_equity.str());
  EXPECT_EQ(a_dec.str(), b_dec.str());
}

// -----------------------------------------------------------------------------
// 10. No prices: errors recorded, empty result, no exception.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, NoPricesIsDiagnosed) {
  stoplab::domain::SimulationConfig defaults;
  const SimulationResult result = SimulationEngine(defaults, 1).run(
      hard_stop, stoplab::domain::PriceHistory{}, universe);

  EXPECT_FALSE(result.overallPass());
  EXPECT_TRUE(hasCode(result.diagnostics.errors, "no_prices_loaded"));
  EXPECT_TRUE(hasCode(result.diagnostics.errors, "no_trading_dates"));
  EXPECT_TRUE(hasCode(result.diagnostics.warnings, "benchmark_not_found:_BVSP"));
  EXPECT_TRUE(result.orders.empty());
  EXPECT_TRUE(result.equity.empty());
  EXPECT_DOUBLE_EQ(result.summary.final_value, defaults.initial_capital);
}

// -----------------------------------------------------------------------------
// 11. Window fallbacks: unknown start is inserted, bad end is replaced.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, WindowFallbacks) {
  config.start_date = session(kSessions - 1).addDays(10);
  SimulationResult result = run();
  EXPECT_TRUE(hasCode(result.diagnostics.errors, "start_date_not_found"));
  ASSERT_EQ(result.equity.size(), 1u);
  EXPECT_EQ(result.equity.front().date, *config.start_date);

  config.start_date = session(30);
  config.end_date = session(25);
  result = run();
  EXPECT_TRUE(hasCode(result.diagnostics.errors, "invalid_end_date_fallback"));
  EXPECT_EQ(result.equity.back().date, session(kSessions - 1));

  // Loader diagnostics are carried into the result.
  stoplab::RunDiagnostics setup;
  setup.warn("price_row_invalid:7");
  config.end_date.reset();
  result = SimulationEngine(config, 1).run(hard_stop, prices, universe, setup);
  EXPECT_TRUE(result.overallPass());
  EXPECT_TRUE(hasCode(result.diagnostics.warnings, "price_row_invalid:7"));
}

// -----------------------------------------------------------------------------
// 12. A universe ticker with no prices is a warning; the run continues.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, MissingUniverseTickerWarned) {
  universe = stoplab::domain::SupervisedUniverse({"AAA", "BBB", "CCC", "DDD"});
  const SimulationResult result = run();
  EXPECT_TRUE(result.overallPass());
  EXPECT_TRUE(hasCode(result.diagnostics.warnings,
                      "price_missing_for_universe_ticker:DDD"));
  EXPECT_FALSE(result.orders.empty());
}

// -----------------------------------------------------------------------------
// 13. Report formats: fixed decimals, empty cells for null metrics.
// -----------------------------------------------------------------------------
TEST(ReportWriterTest, CsvFormats) {
  Order order;
  order.date = session(3);
  order.side = Side::Sell;
  order.ticker = "AAA";
  order.quantity = 10;
  order.price = 12.5;
  order.fee = 0.125;
  order.cash_delta_date = session(5);
  order.settlement_date = session(5);
  order.reason = "HARD_STOP";

  std::ostringstream orders;
  ReportWriter::writeOrdersCsv(orders, {order});
  EXPECT_EQ(orders.str(),
            "date,action,ticker,qty,price,fee_total,cash_delta_date,"
            "settlement_date,rule_id_or_reason\n"
            "2024-01-04,SELL,AAA,10,12.5000,0.1250,2024-01-08,2024-01-08,"
            "HARD_STOP\n");

  std::ostringstream equity;
  ReportWriter::writeEquityCsv(equity, {{session(0), 1234.5}});
  EXPECT_EQ(equity.str(), "date,equity\n2024-01-01,1234.50\n");

  stoplab::DecisionRecord record;
  record.date = session(1);
  record.asof_date = session(0);
  record.ticker = "BBB";
  record.rule_id = "DEFAULT_HOLD";
  record.metrics.drawdown_20d = 0.25;
  record.metrics.close_below_sma_100 = true;
  std::ostringstream decisions;
  ReportWriter::writeDecisionsCsv(decisions, {record});
  const std::string text = decisions.str();
  EXPECT_NE(text.find("\n2024-01-02,2024-01-01,BBB,0.25,,,,,true,,,"
                      "DEFAULT_HOLD,HOLD\n"),
            std::string::npos)
      << text;
}

// -----------------------------------------------------------------------------
// 14. writeAll() lays out every artefact and the report lists them.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, WriteAllCreatesLayout) {
  const SimulationResult result = run();
  const std::filesystem::path dir =
      std::filesystem::path(::testing::TempDir()) / "stoplab_report_test";
  std::filesystem::remove_all(dir);

  stoplab::ReportContext context;
  context.run_id = "unit";
  context.ruleset_id = hard_stop.ruleset_id;
  const auto outputs = ReportWriter(dir).writeAll(result, context);

  ASSERT_EQ(outputs.size(), 5u);
  for (const auto& path : outputs) {
    EXPECT_TRUE(std::filesystem::exists(path)) << path;
  }
  EXPECT_TRUE(std::filesystem::exists(dir / "orders" / "orders.csv"));
  EXPECT_TRUE(
      std::filesystem::exists(dir / "timeseries" / "portfolio_equity.csv"));

  std::ifstream in(dir / "lab_run_report.json");
  const nlohmann::json report = nlohmann::json::parse(in);
  EXPECT_TRUE(report["overall_pass"].get<bool>());
  EXPECT_EQ(report["decision_metrics_asof"], "D-1");
  EXPECT_EQ(report["counts"]["zero"], 1);
  EXPECT_EQ(report["warmup_range_used"]["count"], 21);
  EXPECT_EQ(report["warmup_range_used"]["start"], "2024-01-01");
  EXPECT_EQ(report["ruleset_info"]["ruleset_id"], "HARD_ONLY");
  EXPECT_EQ(report["outputs"].size(), 4u);

  const nlohmann::json summary = ReportWriter::summaryJson(result.summary);
  EXPECT_DOUBLE_EQ(summary["final_value"].get<double>(), 450000.0);

  std::filesystem::remove_all(dir);
}

// -----------------------------------------------------------------------------
// 15. Cash and equity rebuilt from the order log agree with every equity row.
// Why: trades execute at the asof close, so a day's equity moves only with
//      the marks of what was already held and the fees paid that day.
// -----------------------------------------------------------------------------
TEST_F(SimulationEngineTest, EquityConservedAcrossDays) {
  config.fees.percent = 0.001;
  config.fees.fixed = 10.0;
  hard_stop.priority_order.push_back(stopRule(
      makeRule("SOFT_STOP"), stoplab::MetricField::Drawdown20d, 0.0,
      RuleAction::Reduce));
  const SimulationResult result = run();

  ASSERT_EQ(result.equity.size(), 20u);
  ASSERT_FALSE(ordersFor(result, "AAA", Side::Sell).empty());

  auto close = [&](const std::string& ticker, Date d) {
    return *prices.close(ticker, d);
  };

  std::map<std::string, std::int64_t> previous_held;
  double previous_equity = 0.0;
  for (std::size_t row = 0; row < result.equity.size(); ++row) {
    const int i = 21 + static_cast<int>(row);
    const Date today = session(i);
    const Date asof = session(i - 1);
    ASSERT_EQ(result.equity[row].date, today);

    double cash = config.initial_capital;
    double pending = 0.0;
    double fees_today = 0.0;
    std::map<std::string, std::int64_t> held;
    for (const auto& o : result.orders) {
      if (o.date > today) {
        continue;
      }
      const double notional = static_cast<double>(o.quantity) * o.price;
      if (o.side == Side::Buy) {
        cash -= notional + o.fee;
        held[o.ticker] += o.quantity;
      } else {
        if (o.settlement_date <= today) {
          cash += notional - o.fee;
        } else {
          pending += notional - o.fee;
        }
        held[o.ticker] -= o.quantity;
      }
      if (o.date == today) {
        fees_today += o.fee;
      }
    }

    EXPECT_GE(cash, -1e-6) << today.toString();
    double marks = 0.0;
    for (const auto& [ticker, qty] : held) {
      marks += static_cast<double>(qty) * close(ticker, asof);
    }
    const double equity = result.equity[row].equity;
    EXPECT_NEAR(equity, cash + pending + marks, 1e-4) << today.toString();

    if (row > 0) {
      double price_move = 0.0;
      for (const auto& [ticker, qty] : previous_held) {
        price_move += static_cast<double>(qty) *
                      (close(ticker, asof) - close(ticker, session(i - 2)));
      }
      EXPECT_NEAR(equity - previous_equity, price_move - fees_today, 1e-4)
          << today.toString();
    }
    previous_held = held;
    previous_equity = equity;
  }
}
