#include "stoplab/risk/rolling_window.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <stdexcept>

namespace stoplab {
namespace rolling {

namespace {

// -----------------------------------------------------------------------------
// FullWindowScan
// -----------------------------------------------------------------------------
// Tracks how many of the last `window` slots are present, so each statistic
// can skip incomplete windows in O(1) before doing its own work.
// -----------------------------------------------------------------------------
class FullWindowScan {
 public:
  FullWindowScan(const Series& values, std::size_t window)
      : values_(values), window_(window) {}

  // Advances to slot t and reports whether [t-window+1, t] is complete.
  bool advance(std::size_t t) {
    if (values_[t]) {
      ++present_;
    }
    if (t >= window_ && values_[t - window_]) {
      --present_;
    }
    return window_ > 0 && t + 1 >= window_ && present_ == window_;
  }

 private:
  const Series& values_;
  std::size_t window_;
  std::size_t present_{0};
};

// Copies the window ending at t into out (values known to be present).
void collectWindow(const Series& values, std::size_t t, std::size_t window,
                   std::vector<double>& out) {
  out.clear();
  for (std::size_t i = t + 1 - window; i <= t; ++i) {
    out.push_back(*values[i]);
  }
}

double mean(const std::vector<double>& sample) {
  double sum = 0.0;
  for (double v : sample) {
    sum += v;
  }
  return sum / static_cast<double>(sample.size());
}

double sampleVariance(const std::vector<double>& sample) {
  if (sample.size() < 2) {
    return std::nan("");
  }
  const double m = mean(sample);
  double sum_sq = 0.0;
  for (double v : sample) {
    sum_sq += (v - m) * (v - m);
  }
  return sum_sq / static_cast<double>(sample.size() - 1);
}

std::optional<double> finiteOrNull(double value) {
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

double sortedQuantile(const std::vector<double>& sorted, double q) {
  const double pos = q * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = static_cast<std::size_t>(std::ceil(pos));
  const double frac = pos - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

}  // namespace

Series dailyReturns(const Series& prices) {
  Series out(prices.size());
  for (std::size_t t = 1; t < prices.size(); ++t) {
    if (prices[t] && prices[t - 1] && *prices[t - 1] != 0.0) {
      out[t] = *prices[t] / *prices[t - 1] - 1.0;
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// rollingMax: monotonic deque, reset whenever a gap breaks the window
// -----------------------------------------------------------------------------
Series rollingMax(const Series& values, std::size_t window) {
  Series out(values.size());
  FullWindowScan scan(values, window);
  std::deque<std::size_t> candidates;  // indices, values decreasing

  for (std::size_t t = 0; t < values.size(); ++t) {
    const bool full = scan.advance(t);
    if (!values[t]) {
      candidates.clear();
      continue;
    }
    while (!candidates.empty() && window > 0 &&
           candidates.front() + window <= t) {
      candidates.pop_front();
    }
    while (!candidates.empty() && *values[candidates.back()] <= *values[t]) {
      candidates.pop_back();
    }
    candidates.push_back(t);
    if (full) {
      out[t] = *values[candidates.front()];
    }
  }
  return out;
}

Series rollingMean(const Series& values, std::size_t window) {
  Series out(values.size());
  FullWindowScan scan(values, window);
  std::vector<double> sample;
  sample.reserve(window);
  for (std::size_t t = 0; t < values.size(); ++t) {
    if (!scan.advance(t)) {
      continue;
    }
    collectWindow(values, t, window, sample);
    out[t] = mean(sample);
  }
  return out;
}

Series rollingVariance(const Series& values, std::size_t window) {
  Series out(values.size());
  FullWindowScan scan(values, window);
  std::vector<double> sample;
  sample.reserve(window);
  for (std::size_t t = 0; t < values.size(); ++t) {
    if (!scan.advance(t)) {
      continue;
    }
    collectWindow(values, t, window, sample);
    out[t] = finiteOrNull(sampleVariance(sample));
  }
  return out;
}

Series rollingStdDev(const Series& values, std::size_t window) {
  Series out = rollingVariance(values, window);
  for (auto& v : out) {
    if (v) {
      v = std::sqrt(*v);
    }
  }
  return out;
}

Series rollingQuantile(const Series& values, std::size_t window, double q) {
  Series out(values.size());
  FullWindowScan scan(values, window);
  std::vector<double> sample;
  sample.reserve(window);
  for (std::size_t t = 0; t < values.size(); ++t) {
    if (!scan.advance(t)) {
      continue;
    }
    collectWindow(values, t, window, sample);
    std::sort(sample.begin(), sample.end());
    out[t] = sortedQuantile(sample, q);
  }
  return out;
}

// -----------------------------------------------------------------------------
// rollingTailMean: mean of window values <= the window's q-quantile
// -----------------------------------------------------------------------------
Series rollingTailMean(const Series& values, std::size_t window, double q) {
  Series out(values.size());
  FullWindowScan scan(values, window);
  std::vector<double> sample;
  sample.reserve(window);
  for (std::size_t t = 0; t < values.size(); ++t) {
    if (!scan.advance(t)) {
      continue;
    }
    collectWindow(values, t, window, sample);
    std::sort(sample.begin(), sample.end());
    const double threshold = sortedQuantile(sample, q);

    // The minimum is always <= the quantile, so the tail is never empty.
    double sum = 0.0;
    std::size_t count = 0;
    for (double v : sample) {
      if (v > threshold) {
        break;
      }
      sum += v;
      ++count;
    }
    out[t] = sum / static_cast<double>(count);
  }
  return out;
}

Series rollingCovariance(const Series& a, const Series& b, std::size_t window) {
  const std::size_t n = std::min(a.size(), b.size());
  Series joint(n);
  for (std::size_t t = 0; t < n; ++t) {
    if (a[t] && b[t]) {
      joint[t] = 0.0;  // presence marker only
    }
  }

  Series out(a.size());
  FullWindowScan scan(joint, window);
  for (std::size_t t = 0; t < n; ++t) {
    if (!scan.advance(t) || window < 2) {
      continue;
    }
    double mean_a = 0.0;
    double mean_b = 0.0;
    for (std::size_t i = t + 1 - window; i <= t; ++i) {
      mean_a += *a[i];
      mean_b += *b[i];
    }
    mean_a /= static_cast<double>(window);
    mean_b /= static_cast<double>(window);

    double sum = 0.0;
    for (std::size_t i = t + 1 - window; i <= t; ++i) {
      sum += (*a[i] - mean_a) * (*b[i] - mean_b);
    }
    out[t] = sum / static_cast<double>(window - 1);
  }
  return out;
}

double quantile(std::vector<double> values, double q) {
  if (values.empty()) {
    throw std::invalid_argument("quantile of an empty sample");
  }
  if (!(q >= 0.0 && q <= 1.0)) {
    throw std::invalid_argument("quantile level outside [0, 1]: " +
                                std::to_string(q));
  }
  std::sort(values.begin(), values.end());
  return sortedQuantile(values, q);
}

}  // namespace rolling
}  // namespace stoplab
