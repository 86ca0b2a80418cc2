#include "stoplab/risk/risk_metrics.hpp"

#include <unordered_map>

namespace stoplab {

namespace {

std::optional<double> fromBool(const std::optional<bool>& flag) {
  if (!flag) {
    return std::nullopt;
  }
  return *flag ? 1.0 : 0.0;
}

}  // namespace

std::optional<MetricName> parseMetricName(const std::string& name) {
  static const std::unordered_map<std::string, MetricName> kNames{
      {"drawdown_20d", {MetricField::Drawdown20d, MetricScope::Ticker}},
      {"drawdown_60d", {MetricField::Drawdown60d, MetricScope::Ticker}},
      {"var_95_1d_252d", {MetricField::Var95_1d_252d, MetricScope::Ticker}},
      {"cvar_95_1d_252d", {MetricField::Cvar95_1d_252d, MetricScope::Ticker}},
      {"vol_60d_over_252d", {MetricField::Vol60dOver252d, MetricScope::Ticker}},
      {"vol_60d_over_vol_252d",
       {MetricField::Vol60dOver252d, MetricScope::Ticker}},
      {"close_below_sma_100",
       {MetricField::CloseBelowSma100, MetricScope::Ticker}},
      {"close_below_sma_200",
       {MetricField::CloseBelowSma200, MetricScope::Ticker}},
      {"beta_to_benchmark_60d",
       {MetricField::BetaToBenchmark60d, MetricScope::Ticker}},
      {"beta_to_ibov_60d",
       {MetricField::BetaToBenchmark60d, MetricScope::Ticker}},
      {"benchmark_vol_60d", {MetricField::BenchmarkVol60d, MetricScope::Ticker}},
      {"ibov_vol_60d", {MetricField::BenchmarkVol60d, MetricScope::Ticker}},
      {"portfolio_drawdown_20d",
       {MetricField::Drawdown20d, MetricScope::Portfolio}},
      {"portfolio_drawdown_60d",
       {MetricField::Drawdown60d, MetricScope::Portfolio}},
      {"portfolio_var_95_1d_252d",
       {MetricField::Var95_1d_252d, MetricScope::Portfolio}},
  };
  auto it = kNames.find(name);
  if (it == kNames.end()) {
    return std::nullopt;
  }
  return it->second;
}

const char* toString(MetricField field) {
  switch (field) {
    case MetricField::Drawdown20d:
      return "drawdown_20d";
    case MetricField::Drawdown60d:
      return "drawdown_60d";
    case MetricField::Var95_1d_252d:
      return "var_95_1d_252d";
    case MetricField::Cvar95_1d_252d:
      return "cvar_95_1d_252d";
    case MetricField::Vol60dOver252d:
      return "vol_60d_over_252d";
    case MetricField::CloseBelowSma100:
      return "close_below_sma_100";
    case MetricField::CloseBelowSma200:
      return "close_below_sma_200";
    case MetricField::BetaToBenchmark60d:
      return "beta_to_benchmark_60d";
    case MetricField::BenchmarkVol60d:
      return "benchmark_vol_60d";
  }
  return "unknown";
}

std::optional<double> TickerMetrics::value(MetricField field) const {
  switch (field) {
    case MetricField::Drawdown20d:
      return drawdown_20d;
    case MetricField::Drawdown60d:
      return drawdown_60d;
    case MetricField::Var95_1d_252d:
      return var_95_1d_252d;
    case MetricField::Cvar95_1d_252d:
      return cvar_95_1d_252d;
    case MetricField::Vol60dOver252d:
      return vol_60d_over_252d;
    case MetricField::CloseBelowSma100:
      return fromBool(close_below_sma_100);
    case MetricField::CloseBelowSma200:
      return fromBool(close_below_sma_200);
    case MetricField::BetaToBenchmark60d:
      return beta_to_benchmark_60d;
    case MetricField::BenchmarkVol60d:
      return benchmark_vol_60d;
  }
  return std::nullopt;
}

std::optional<double> PortfolioMetrics::value(MetricField field) const {
  switch (field) {
    case MetricField::Drawdown20d:
      return drawdown_20d;
    case MetricField::Drawdown60d:
      return drawdown_60d;
    case MetricField::Var95_1d_252d:
      return var_95_1d_252d;
    default:
      return std::nullopt;
  }
}

}  // namespace stoplab
