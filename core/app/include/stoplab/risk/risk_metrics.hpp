#pragma once

#include <optional>
#include <string>

namespace stoplab {

// -----------------------------------------------------------------------------
// MetricField: closed set of metrics a rule condition may reference
// -----------------------------------------------------------------------------
//
// @details
// Rule documents name metrics by string; RuleSetLoader resolves each name to
// a MetricField once, at load time, so evaluation never does string lookups.
//
// Ticker-level fields live in TickerMetrics. The three drawdown/VaR fields
// also exist at portfolio level under portfolio_* names; a portfolio-scoped
// rule reads them from PortfolioMetrics instead.
// -----------------------------------------------------------------------------
enum class MetricField {
  Drawdown20d,
  Drawdown60d,
  Var95_1d_252d,
  Cvar95_1d_252d,
  Vol60dOver252d,
  CloseBelowSma100,
  CloseBelowSma200,
  BetaToBenchmark60d,
  BenchmarkVol60d,
};

// Which metrics record a metric name belongs to.
enum class MetricScope { Ticker, Portfolio };

struct MetricName {
  MetricField field;
  MetricScope scope;
};

// -------------------------------------------------------------------------
// parseMetricName(name)
// -------------------------------------------------------------------------
// @brief  Resolves a document metric name to its field and scope.
//
// @details
// Ticker names: drawdown_20d, drawdown_60d, var_95_1d_252d,
// cvar_95_1d_252d, vol_60d_over_252d, close_below_sma_100,
// close_below_sma_200, beta_to_benchmark_60d, benchmark_vol_60d, plus the
// aliases vol_60d_over_vol_252d, beta_to_ibov_60d and ibov_vol_60d.
//
// Portfolio names: portfolio_drawdown_20d, portfolio_drawdown_60d,
// portfolio_var_95_1d_252d.
//
// The two sets are disjoint: "drawdown_20d" never names the portfolio
// drawdown, and "portfolio_drawdown_20d" never names a ticker's.
//
// @return std::nullopt for an unknown name.
// -------------------------------------------------------------------------
std::optional<MetricName> parseMetricName(const std::string& name);

// Canonical ticker-scope name.
const char* toString(MetricField field);

// -----------------------------------------------------------------------------
// TickerMetrics: one ticker on one asof date
// -----------------------------------------------------------------------------
// Each field is std::nullopt while its trailing window is incomplete or the
// inputs are missing. Boolean indicators read as 1.0 / 0.0 through value().
// -----------------------------------------------------------------------------
struct TickerMetrics {
  std::optional<double> drawdown_20d;
  std::optional<double> drawdown_60d;
  std::optional<double> var_95_1d_252d;
  std::optional<double> cvar_95_1d_252d;
  std::optional<double> vol_60d_over_252d;
  std::optional<bool> close_below_sma_100;
  std::optional<bool> close_below_sma_200;
  std::optional<double> beta_to_benchmark_60d;
  std::optional<double> benchmark_vol_60d;

  std::optional<double> value(MetricField field) const;
};

// -----------------------------------------------------------------------------
// PortfolioMetrics: the equity curve on one asof date
// -----------------------------------------------------------------------------
struct PortfolioMetrics {
  std::optional<double> drawdown_20d;
  std::optional<double> drawdown_60d;
  std::optional<double> var_95_1d_252d;

  // std::nullopt for fields that are ticker-only.
  std::optional<double> value(MetricField field) const;
};

}  // namespace stoplab
