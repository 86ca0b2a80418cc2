#pragma once

#include "stoplab/domain/price_history.hpp"
#include "stoplab/risk/risk_metrics.hpp"
#include "stoplab/risk/rolling_window.hpp"
#include "stoplab/time/date.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace stoplab {

// Equity value per simulated (or warm-up) day, in date order.
using EquityHistory = std::map<Date, double>;

// -----------------------------------------------------------------------------
// MetricsMatrix: materialised (date x ticker) metrics
// -----------------------------------------------------------------------------
//
// @brief  Output of RiskMetricsEngine::computeAll(): one TickerMetrics per
//         ticker per date of the metric calendar.
//
// @details
// Built completely before the replay starts and read-only afterwards. A
// lookup for an unknown ticker or a date outside the metric calendar returns
// an all-null TickerMetrics, which every rule condition treats as false.
// -----------------------------------------------------------------------------
class MetricsMatrix {
 public:
  MetricsMatrix() = default;
  explicit MetricsMatrix(std::vector<Date> dates);

  // @throws std::invalid_argument if @p series does not have one entry per
  //         date.
  void setSeries(const std::string& ticker, std::vector<TickerMetrics> series);

  TickerMetrics at(const std::string& ticker, Date date) const;

  bool hasTicker(const std::string& ticker) const {
    return series_.count(ticker) > 0;
  }
  const std::vector<Date>& dates() const { return dates_; }

 private:
  std::vector<Date> dates_;
  std::unordered_map<std::string, std::vector<TickerMetrics>> series_;
};

// -----------------------------------------------------------------------------
// RiskMetricsEngine
// -----------------------------------------------------------------------------
//
// @brief  Batch computation of rolling per-ticker risk indicators and
//         on-demand portfolio indicators from the equity curve.
//
// @details
// Ticker metrics at date t (all need a full trailing window, else null):
//
//   drawdown_20d / _60d    1 - close / rolling max(close, 20 / 60)
//   var_95_1d_252d         -(5th percentile of the last 252 daily returns)
//   cvar_95_1d_252d        -(mean of those returns <= the 5th percentile)
//   vol_60d_over_252d      annualised stdev(60) / annualised stdev(252)
//   close_below_sma_100/200  close < simple moving average
//   beta_to_benchmark_60d  cov60(ticker, benchmark) / var60(benchmark)
//   benchmark_vol_60d      annualised stdev(60) of benchmark returns
//
// Parallelism:
//   computeAll() fans tickers out over a WorkerPool. Each job reads the
//   shared PriceHistory and writes its own output slot, so results do not
//   depend on the pool size or scheduling.
//
// Thread model:
//   Stateless apart from the configured worker count. All static members
//   are pure.
// -----------------------------------------------------------------------------
class RiskMetricsEngine {
 public:
  static constexpr std::size_t kShortDrawdownWindow = 20;
  static constexpr std::size_t kLongDrawdownWindow = 60;
  static constexpr std::size_t kTailWindow = 252;
  static constexpr std::size_t kShortVolWindow = 60;
  static constexpr std::size_t kLongVolWindow = 252;
  static constexpr std::size_t kShortSmaWindow = 100;
  static constexpr std::size_t kLongSmaWindow = 200;
  static constexpr std::size_t kBetaWindow = 60;
  static constexpr double kTailQuantile = 0.05;
  static constexpr double kTradingDaysPerYear = 252.0;

  // @param worker_count  Pool size for computeAll(); 0 selects the hardware
  //                      concurrency.
  explicit RiskMetricsEngine(std::size_t worker_count = 0)
      : worker_count_(worker_count) {}

  // -------------------------------------------------------------------------
  // computeAll(prices, tickers, dates, benchmark_ticker)
  // -------------------------------------------------------------------------
  // @brief  Materialises the metrics of every ticker on @p dates.
  //
  // @param  prices            Close prices; missing quotes become nulls.
  // @param  tickers           Tickers to compute (each gets a series, even
  //                           when it has no quotes).
  // @param  dates             Sorted metric calendar. Rolling windows count
  //                           rows of this calendar.
  // @param  benchmark_ticker  Benchmark series for beta / benchmark vol.
  //                           Empty or unknown leaves those fields null.
  //
  // @throws Whatever a worker job throws (rethrown on the calling thread).
  // -------------------------------------------------------------------------
  MetricsMatrix computeAll(const domain::PriceHistory& prices,
                           const std::vector<std::string>& tickers,
                           const std::vector<Date>& dates,
                           const std::string& benchmark_ticker) const;

  // -------------------------------------------------------------------------
  // computeTickerSeries(closes, benchmark_returns)
  // -------------------------------------------------------------------------
  // @brief  Single-ticker kernel behind computeAll().
  //
  // @param  closes             Calendar-aligned closes.
  // @param  benchmark_returns  Calendar-aligned benchmark daily returns, same
  //                            length as @p closes, or empty when there is no
  //                            benchmark.
  // -------------------------------------------------------------------------
  static std::vector<TickerMetrics> computeTickerSeries(
      const rolling::Series& closes, const rolling::Series& benchmark_returns);

  // -------------------------------------------------------------------------
  // computePortfolioMetrics(equity, asof)
  // -------------------------------------------------------------------------
  // @brief  Drawdowns and VaR of the equity curve as of @p asof.
  //
  // @details
  // Uses the history entries dated on or before @p asof. All fields are
  // null when @p asof has no entry. drawdown_20d / _60d need at least 20 /
  // 60 values; VaR needs 253 values (252 returns). A zero window maximum
  // yields a drawdown of 0.
  // -------------------------------------------------------------------------
  static PortfolioMetrics computePortfolioMetrics(const EquityHistory& equity,
                                                  Date asof);

 private:
  std::size_t worker_count_;
};

}  // namespace stoplab
