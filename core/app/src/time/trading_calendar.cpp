#include "stoplab/time/trading_calendar.hpp"

#include <algorithm>
#include <stdexcept>

namespace stoplab {

// -----------------------------------------------------------------------------
// Constructor: normalise to a sorted, unique list
// -----------------------------------------------------------------------------
TradingCalendar::TradingCalendar(std::vector<Date> dates)
    : dates_(std::move(dates)) {
  std::sort(dates_.begin(), dates_.end());
  dates_.erase(std::unique(dates_.begin(), dates_.end()), dates_.end());
}

// -----------------------------------------------------------------------------
// weekdays(): Monday..Friday fallback calendar
// -----------------------------------------------------------------------------
TradingCalendar TradingCalendar::weekdays(Date first, Date last) {
  std::vector<Date> dates;
  for (Date d = first; d <= last; d = d.addDays(1)) {
    if (!d.isWeekend()) {
      dates.push_back(d);
    }
  }
  return TradingCalendar(std::move(dates));
}

Date TradingCalendar::front() const {
  if (dates_.empty()) {
    throw std::out_of_range("TradingCalendar is empty");
  }
  return dates_.front();
}

Date TradingCalendar::back() const {
  if (dates_.empty()) {
    throw std::out_of_range("TradingCalendar is empty");
  }
  return dates_.back();
}

bool TradingCalendar::contains(Date date) const {
  return std::binary_search(dates_.begin(), dates_.end(), date);
}

std::size_t TradingCalendar::indexOf(Date date) const {
  auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
  if (it == dates_.end() || *it != date) {
    throw std::out_of_range("Not a trading session: " + date.toString());
  }
  return static_cast<std::size_t>(it - dates_.begin());
}

std::optional<Date> TradingCalendar::previous(Date date) const {
  const std::size_t idx = indexOf(date);
  if (idx == 0) {
    return std::nullopt;
  }
  return dates_[idx - 1];
}

// -----------------------------------------------------------------------------
// offset(): session arithmetic with clamping at both ends
// -----------------------------------------------------------------------------
Date TradingCalendar::offset(Date date, int sessions) const {
  const auto idx = static_cast<long long>(indexOf(date));
  const long long target = idx + sessions;
  if (target < 0) {
    return dates_.front();
  }
  if (target >= static_cast<long long>(dates_.size())) {
    return dates_.back();
  }
  return dates_[static_cast<std::size_t>(target)];
}

std::optional<Date> TradingCalendar::firstOnOrAfter(Date date) const {
  auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
  if (it == dates_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<Date> TradingCalendar::between(Date first, Date last) const {
  auto lo = std::lower_bound(dates_.begin(), dates_.end(), first);
  auto hi = std::upper_bound(dates_.begin(), dates_.end(), last);
  if (lo >= hi) {
    return {};
  }
  return std::vector<Date>(lo, hi);
}

void TradingCalendar::insert(Date date) {
  auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
  if (it != dates_.end() && *it == date) {
    return;
  }
  dates_.insert(it, date);
}

void TradingCalendar::truncateAfter(Date last) {
  auto it = std::upper_bound(dates_.begin(), dates_.end(), last);
  dates_.erase(it, dates_.end());
}

}  // namespace stoplab
