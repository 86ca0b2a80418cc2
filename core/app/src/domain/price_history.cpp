#include "stoplab/domain/price_history.hpp"

#include <cmath>
#include <set>
#include <stdexcept>

namespace stoplab {
namespace domain {

void PriceHistory::addQuote(const std::string& ticker, Date date,
                            double close) {
  if (ticker.empty()) {
    throw std::invalid_argument("Ticker cannot be empty");
  }
  if (!std::isfinite(close) || close <= 0.0) {
    throw std::invalid_argument("Invalid close for " + ticker + " on " +
                                date.toString() + ": " +
                                std::to_string(close));
  }
  series_[ticker][date] = close;
}

std::optional<double> PriceHistory::close(const std::string& ticker,
                                          Date date) const {
  auto series_it = series_.find(ticker);
  if (series_it == series_.end()) {
    return std::nullopt;
  }
  auto it = series_it->second.find(date);
  if (it == series_it->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PriceHistory::hasTicker(const std::string& ticker) const {
  return series_.count(ticker) > 0;
}

std::vector<std::string> PriceHistory::tickers() const {
  std::vector<std::string> result;
  result.reserve(series_.size());
  for (const auto& [ticker, series] : series_) {
    result.push_back(ticker);
  }
  return result;
}

std::vector<Date> PriceHistory::datesFor(
    const std::vector<std::string>& tickers) const {
  std::set<Date> dates;
  for (const auto& ticker : tickers) {
    auto it = series_.find(ticker);
    if (it == series_.end()) {
      continue;
    }
    for (const auto& [date, close] : it->second) {
      dates.insert(date);
    }
  }
  return std::vector<Date>(dates.begin(), dates.end());
}

std::vector<std::optional<double>> PriceHistory::alignedSeries(
    const std::string& ticker, const std::vector<Date>& dates) const {
  std::vector<std::optional<double>> result(dates.size());
  auto series_it = series_.find(ticker);
  if (series_it == series_.end()) {
    return result;
  }

  // Both sides are sorted: walk them together instead of one find() per
  // slot.
  const auto& series = series_it->second;
  auto it = series.begin();
  for (std::size_t i = 0; i < dates.size(); ++i) {
    while (it != series.end() && it->first < dates[i]) {
      ++it;
    }
    if (it != series.end() && it->first == dates[i]) {
      result[i] = it->second;
    }
  }
  return result;
}

}  // namespace domain
}  // namespace stoplab
