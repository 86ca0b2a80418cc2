#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace stoplab {

// -----------------------------------------------------------------------------
// Weekday
// -----------------------------------------------------------------------------
// ISO ordering: Monday is 0, Sunday is 6. Matches the numbering used by the
// weekly-buy configuration ("MON".."FRI").
// -----------------------------------------------------------------------------
enum class Weekday {
  Monday = 0,
  Tuesday = 1,
  Wednesday = 2,
  Thursday = 3,
  Friday = 4,
  Saturday = 5,
  Sunday = 6,
};

// -----------------------------------------------------------------------------
// Date: civil calendar day (proleptic Gregorian, no time zone)
// -----------------------------------------------------------------------------
//
// @brief  Value type for a trading day. Stored as a signed day count since
//         1970-01-01 so comparison, hashing and offsets are integer ops.
//
// @details
// Every date in the engine (price rows, order dates, settlement dates,
// equity rows) is a Date. Conversions to and from "YYYY-MM-DD" happen only
// at the file boundary (loaders and ReportWriter).
//
// Thread model:
//   Plain value type. Thread-safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
class Date {
 public:
  // 1970-01-01.
  Date() = default;

  // -------------------------------------------------------------------------
  // fromYmd(year, month, day)
  // -------------------------------------------------------------------------
  // @brief  Builds a Date from calendar fields.
  //
  // @throws std::invalid_argument if month is outside 1..12 or day is
  //         outside the month's length.
  // -------------------------------------------------------------------------
  static Date fromYmd(int year, unsigned month, unsigned day);

  // Inverse of days(). Any integer is a valid day count.
  static Date fromDays(std::int32_t days) { return Date(days); }

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses an ISO-8601 calendar date ("2023-01-02").
  //
  // @return std::nullopt when the text is not exactly YYYY-MM-DD or names a
  //         day that does not exist.
  // -------------------------------------------------------------------------
  static std::optional<Date> parse(const std::string& text);

  std::int32_t days() const { return days_; }
  int year() const;
  unsigned month() const;
  unsigned day() const;
  Weekday weekday() const;
  bool isWeekend() const;

  Date addDays(std::int32_t n) const { return Date(days_ + n); }

  // "YYYY-MM-DD".
  std::string toString() const;

  friend bool operator==(Date a, Date b) { return a.days_ == b.days_; }
  friend bool operator!=(Date a, Date b) { return a.days_ != b.days_; }
  friend bool operator<(Date a, Date b) { return a.days_ < b.days_; }
  friend bool operator<=(Date a, Date b) { return a.days_ <= b.days_; }
  friend bool operator>(Date a, Date b) { return a.days_ > b.days_; }
  friend bool operator>=(Date a, Date b) { return a.days_ >= b.days_; }

 private:
  explicit Date(std::int32_t days) : days_(days) {}

  std::int32_t days_{0};
};

// Parses "MON".."SUN" (case-insensitive). std::nullopt for anything else.
std::optional<Weekday> parseWeekday(const std::string& text);

const char* toString(Weekday weekday);

}  // namespace stoplab
