#pragma once

#include "stoplab/time/date.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace stoplab {

// -----------------------------------------------------------------------------
// TradingCalendar: ordered set of sessions driving the replay clock
// -----------------------------------------------------------------------------
//
// @brief  The simulation's notion of "which days exist". Every step of the
//         replay (asof lookup, settlement offsets, weekly-buy scheduling)
//         moves along this list and never along wall-clock days.
//
// @details
// Dates are kept sorted and unique. The calendar is built once during
// setup by SimulationEngine (from the dates that carry at least one quote)
// and is read-only while the daily loop runs. PortfolioLedger holds a const
// reference to it to compute settlement dates.
//
// Session arithmetic:
//   previous(D)     the session immediately before D (the "asof" date).
//   offset(D, n)    the session n steps after D, clamped to the last
//                   session when the calendar runs out.
//
// Thread model:
//   Immutable after setup. Safe to read from any thread.
// -----------------------------------------------------------------------------
class TradingCalendar {
 public:
  TradingCalendar() = default;

  // Sorts and de-duplicates the given dates.
  explicit TradingCalendar(std::vector<Date> dates);

  // -------------------------------------------------------------------------
  // weekdays(first, last)
  // -------------------------------------------------------------------------
  // @brief  Fallback calendar: every Monday..Friday in [first, last].
  //
  // @details
  // Used when no quote dates exist at all, so the replay still produces an
  // equity row per business day. Returns an empty calendar when last <
  // first.
  // -------------------------------------------------------------------------
  static TradingCalendar weekdays(Date first, Date last);

  bool empty() const { return dates_.empty(); }
  std::size_t size() const { return dates_.size(); }
  const std::vector<Date>& dates() const { return dates_; }

  // @throws std::out_of_range if the calendar is empty.
  Date front() const;
  Date back() const;

  bool contains(Date date) const;

  // -------------------------------------------------------------------------
  // indexOf(date)
  // -------------------------------------------------------------------------
  // @brief  Position of a session inside the calendar.
  //
  // @throws std::out_of_range if @p date is not a session. Callers only ask
  //         for dates they obtained from this calendar.
  // -------------------------------------------------------------------------
  std::size_t indexOf(Date date) const;

  // The session before @p date, or std::nullopt for the first session.
  // @throws std::out_of_range if @p date is not a session.
  std::optional<Date> previous(Date date) const;

  // -------------------------------------------------------------------------
  // offset(date, sessions)
  // -------------------------------------------------------------------------
  // @brief  The session @p sessions steps after @p date.
  //
  // @details
  // Clamped to back() when the target index runs past the end of the
  // calendar: a sale near the end of the data settles on the last session.
  // A negative offset is clamped to front().
  //
  // @throws std::out_of_range if @p date is not a session.
  // -------------------------------------------------------------------------
  Date offset(Date date, int sessions) const;

  // First session on or after @p date, if any.
  std::optional<Date> firstOnOrAfter(Date date) const;

  // Sessions in the closed range [first, last], in order.
  std::vector<Date> between(Date first, Date last) const;

  // Adds a session, keeping the order. No-op if already present.
  void insert(Date date);

  // Removes every session after @p last.
  void truncateAfter(Date last);

 private:
  std::vector<Date> dates_;
};

}  // namespace stoplab
