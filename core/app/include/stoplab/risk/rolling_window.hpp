#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace stoplab {
namespace rolling {

// A time series aligned on the trading calendar. std::nullopt marks a
// missing observation or an undefined statistic.
using Series = std::vector<std::optional<double>>;

// -----------------------------------------------------------------------------
// Rolling-window statistics
// -----------------------------------------------------------------------------
//
// @brief  Trailing-window algorithms over calendar-aligned series.
//
// @details
// Every rolling function returns a series of the same length as its input.
// Slot t is computed from the `window` values ending at t (inclusive) and is
// std::nullopt unless all `window` values are present. The first window-1
// slots are therefore always null. A window of 0 yields an all-null series.
//
// Sample statistics (stdDev, variance, covariance) use the n-1 divisor.
// Quantiles use linear interpolation between order statistics at position
// q * (n - 1).
//
// All functions are pure and thread-safe.
// -----------------------------------------------------------------------------

// r[t] = x[t] / x[t-1] - 1; null when either side is missing or x[t-1] is 0.
Series dailyReturns(const Series& prices);

Series rollingMax(const Series& values, std::size_t window);
Series rollingMean(const Series& values, std::size_t window);
Series rollingStdDev(const Series& values, std::size_t window);
Series rollingVariance(const Series& values, std::size_t window);

// Empirical q-quantile of each window.
Series rollingQuantile(const Series& values, std::size_t window, double q);

// Mean of the values at or below each window's q-quantile (the loss tail
// used by CVaR).
Series rollingTailMean(const Series& values, std::size_t window, double q);

// Sample covariance of the pairs (a[t], b[t]) in each window; null unless
// both series are present across the whole window.
Series rollingCovariance(const Series& a, const Series& b, std::size_t window);

// Quantile of an unsorted sample (copied and sorted internally).
// @throws std::invalid_argument if @p values is empty or q is outside [0, 1].
double quantile(std::vector<double> values, double q);

}  // namespace rolling
}  // namespace stoplab
