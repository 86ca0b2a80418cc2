#include "stoplab/time/date.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace stoplab {

namespace {

// Day-count conversions for the proleptic Gregorian calendar. The era
// arithmetic splits time into 400-year cycles (146097 days) whose years
// start on March 1st, so February's length only matters at the tail.
constexpr std::int32_t kDaysPerEra = 146097;

std::int32_t daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * kDaysPerEra + static_cast<std::int32_t>(doe) - 719468;
}

struct Civil {
  int year;
  unsigned month;
  unsigned day;
};

Civil civilFromDays(std::int32_t z) {
  z += 719468;
  const int era = (z >= 0 ? z : z - (kDaysPerEra - 1)) / kDaysPerEra;
  const unsigned doe = static_cast<unsigned>(z - era * kDaysPerEra);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return Civil{y + (m <= 2 ? 1 : 0), m, d};
}

bool isLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned lastDayOfMonth(int y, unsigned m) {
  constexpr std::array<unsigned, 12> kDays{31, 28, 31, 30, 31, 30,
                                           31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeap(y)) ? 29u : kDays[m - 1];
}

constexpr std::array<const char*, 7> kWeekdayNames{"MON", "TUE", "WED", "THU",
                                                   "FRI", "SAT", "SUN"};

}  // namespace

Date Date::fromYmd(int year, unsigned month, unsigned day) {
  if (month < 1 || month > 12) {
    throw std::invalid_argument("Invalid month: " + std::to_string(month));
  }
  if (day < 1 || day > lastDayOfMonth(year, month)) {
    throw std::invalid_argument("Invalid day: " + std::to_string(day));
  }
  return Date(daysFromCivil(year, month, day));
}

std::optional<Date> Date::parse(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return std::nullopt;
    }
  }

  const int year = std::stoi(text.substr(0, 4));
  const unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
  const unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
  if (month < 1 || month > 12 || day < 1 ||
      day > lastDayOfMonth(year, month)) {
    return std::nullopt;
  }
  return Date(daysFromCivil(year, month, day));
}

int Date::year() const { return civilFromDays(days_).year; }

unsigned Date::month() const { return civilFromDays(days_).month; }

unsigned Date::day() const { return civilFromDays(days_).day; }

Weekday Date::weekday() const {
  // 1970-01-01 was a Thursday (ISO index 3).
  const std::int32_t shifted = (days_ + 3) % 7;
  return static_cast<Weekday>(shifted < 0 ? shifted + 7 : shifted);
}

bool Date::isWeekend() const {
  const Weekday w = weekday();
  return w == Weekday::Saturday || w == Weekday::Sunday;
}

std::string Date::toString() const {
  const Civil c = civilFromDays(days_);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month,
                c.day);
  return buffer;
}

std::optional<Weekday> parseWeekday(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  for (std::size_t i = 0; i < kWeekdayNames.size(); ++i) {
    if (upper == kWeekdayNames[i]) {
      return static_cast<Weekday>(i);
    }
  }
  return std::nullopt;
}

const char* toString(Weekday weekday) {
  return kWeekdayNames[static_cast<std::size_t>(weekday)];
}

}  // namespace stoplab
