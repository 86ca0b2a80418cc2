#include "stoplab/risk/risk_metrics_engine.hpp"
#include "stoplab/concurrent/worker_pool.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace stoplab {

// -----------------------------------------------------------------------------
// MetricsMatrix
// -----------------------------------------------------------------------------
MetricsMatrix::MetricsMatrix(std::vector<Date> dates)
    : dates_(std::move(dates)) {}

void MetricsMatrix::setSeries(const std::string& ticker,
                              std::vector<TickerMetrics> series) {
  if (series.size() != dates_.size()) {
    throw std::invalid_argument("Metric series for " + ticker + " has " +
                                std::to_string(series.size()) +
                                " rows, expected " +
                                std::to_string(dates_.size()));
  }
  series_[ticker] = std::move(series);
}

TickerMetrics MetricsMatrix::at(const std::string& ticker, Date date) const {
  auto it = series_.find(ticker);
  if (it == series_.end()) {
    return TickerMetrics{};
  }
  auto pos = std::lower_bound(dates_.begin(), dates_.end(), date);
  if (pos == dates_.end() || *pos != date) {
    return TickerMetrics{};
  }
  return it->second[static_cast<std::size_t>(pos - dates_.begin())];
}

// -----------------------------------------------------------------------------
// computeAll: fan tickers out over the worker pool
// -----------------------------------------------------------------------------
MetricsMatrix RiskMetricsEngine::computeAll(
    const domain::PriceHistory& prices, const std::vector<std::string>& tickers,
    const std::vector<Date>& dates, const std::string& benchmark_ticker) const {
  rolling::Series benchmark_returns;
  if (!benchmark_ticker.empty() && prices.hasTicker(benchmark_ticker)) {
    benchmark_returns =
        rolling::dailyReturns(prices.alignedSeries(benchmark_ticker, dates));
  }

  std::vector<std::vector<TickerMetrics>> results(tickers.size());
  {
    WorkerPool pool(worker_count_);
    for (std::size_t i = 0; i < tickers.size(); ++i) {
      pool.submit([&, i] {
        results[i] = computeTickerSeries(
            prices.alignedSeries(tickers[i], dates), benchmark_returns);
      });
    }
    pool.wait();
  }

  MetricsMatrix matrix(dates);
  for (std::size_t i = 0; i < tickers.size(); ++i) {
    matrix.setSeries(tickers[i], std::move(results[i]));
  }

  std::cout << "[RiskMetricsEngine] Computed metrics for " << tickers.size()
            << " ticker(s) over " << dates.size() << " date(s).\n";
  return matrix;
}

// -----------------------------------------------------------------------------
// computeTickerSeries: every rolling indicator for one ticker
// -----------------------------------------------------------------------------
std::vector<TickerMetrics> RiskMetricsEngine::computeTickerSeries(
    const rolling::Series& closes, const rolling::Series& benchmark_returns) {
  const std::size_t n = closes.size();
  const double annualise = std::sqrt(kTradingDaysPerYear);

  const rolling::Series returns = rolling::dailyReturns(closes);
  const rolling::Series max_short =
      rolling::rollingMax(closes, kShortDrawdownWindow);
  const rolling::Series max_long =
      rolling::rollingMax(closes, kLongDrawdownWindow);
  const rolling::Series var_q =
      rolling::rollingQuantile(returns, kTailWindow, kTailQuantile);
  const rolling::Series tail_mean =
      rolling::rollingTailMean(returns, kTailWindow, kTailQuantile);
  const rolling::Series vol_short =
      rolling::rollingStdDev(returns, kShortVolWindow);
  const rolling::Series vol_long =
      rolling::rollingStdDev(returns, kLongVolWindow);
  const rolling::Series sma_short = rolling::rollingMean(closes, kShortSmaWindow);
  const rolling::Series sma_long = rolling::rollingMean(closes, kLongSmaWindow);

  const bool has_benchmark = benchmark_returns.size() == n;
  rolling::Series covariance;
  rolling::Series bench_variance;
  rolling::Series bench_vol;
  if (has_benchmark) {
    covariance =
        rolling::rollingCovariance(returns, benchmark_returns, kBetaWindow);
    bench_variance = rolling::rollingVariance(benchmark_returns, kBetaWindow);
    bench_vol = rolling::rollingStdDev(benchmark_returns, kBetaWindow);
  }

  std::vector<TickerMetrics> out(n);
  for (std::size_t t = 0; t < n; ++t) {
    TickerMetrics& m = out[t];

    if (closes[t] && max_short[t] && *max_short[t] != 0.0) {
      m.drawdown_20d = 1.0 - *closes[t] / *max_short[t];
    }
    if (closes[t] && max_long[t] && *max_long[t] != 0.0) {
      m.drawdown_60d = 1.0 - *closes[t] / *max_long[t];
    }
    if (var_q[t]) {
      m.var_95_1d_252d = -*var_q[t];
    }
    if (tail_mean[t]) {
      m.cvar_95_1d_252d = -*tail_mean[t];
    }
    if (vol_short[t] && vol_long[t] && *vol_long[t] != 0.0) {
      m.vol_60d_over_252d =
          (*vol_short[t] * annualise) / (*vol_long[t] * annualise);
    }
    if (closes[t] && sma_short[t]) {
      m.close_below_sma_100 = *closes[t] < *sma_short[t];
    }
    if (closes[t] && sma_long[t]) {
      m.close_below_sma_200 = *closes[t] < *sma_long[t];
    }
    if (has_benchmark) {
      if (covariance[t] && bench_variance[t] && *bench_variance[t] != 0.0) {
        m.beta_to_benchmark_60d = *covariance[t] / *bench_variance[t];
      }
      if (bench_vol[t]) {
        m.benchmark_vol_60d = *bench_vol[t] * annualise;
      }
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// computePortfolioMetrics: trailing windows over the equity curve
// -----------------------------------------------------------------------------
PortfolioMetrics RiskMetricsEngine::computePortfolioMetrics(
    const EquityHistory& equity, Date asof) {
  PortfolioMetrics metrics;
  if (equity.count(asof) == 0) {
    return metrics;
  }

  std::vector<double> values;
  for (auto it = equity.begin(); it != equity.end() && it->first <= asof;
       ++it) {
    values.push_back(it->second);
  }
  const double current = values.back();

  auto drawdown = [&](std::size_t window) -> std::optional<double> {
    if (values.size() < window) {
      return std::nullopt;
    }
    const double peak =
        *std::max_element(values.end() - static_cast<std::ptrdiff_t>(window),
                          values.end());
    return peak != 0.0 ? 1.0 - current / peak : 0.0;
  };
  metrics.drawdown_20d = drawdown(kShortDrawdownWindow);
  metrics.drawdown_60d = drawdown(kLongDrawdownWindow);

  if (values.size() >= kTailWindow + 1) {
    std::vector<double> returns;
    returns.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
      if (values[i - 1] != 0.0) {
        returns.push_back(values[i] / values[i - 1] - 1.0);
      }
    }
    if (returns.size() > kTailWindow) {
      returns.erase(returns.begin(),
                    returns.end() - static_cast<std::ptrdiff_t>(kTailWindow));
    }
    if (!returns.empty()) {
      metrics.var_95_1d_252d = -rolling::quantile(returns, kTailQuantile);
    }
  }
  return metrics;
}

}  // namespace stoplab
