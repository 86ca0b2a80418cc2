#pragma once

#include "stoplab/time/date.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stoplab {
namespace domain {

// -----------------------------------------------------------------------------
// PriceHistory: read-only close-price store
// -----------------------------------------------------------------------------
//
// @brief  Per-ticker ordered (date, close) series, queryable by
//         (ticker, date).
//
// @details
// Populated once by PriceCsvLoader (or by tests through addQuote()) and then
// only read. An absent (ticker, date) pair is "no price available"; callers
// treat that as a lookup miss, never as an error.
//
// Ordered containers keep every iteration deterministic: tickers() and
// datesFor() always return the same sequence for the same content.
//
// Thread model:
//   Not synchronised. Safe for concurrent readers once loading is done
//   (RiskMetricsEngine workers read it in parallel).
// -----------------------------------------------------------------------------
class PriceHistory {
 public:
  // -------------------------------------------------------------------------
  // addQuote(ticker, date, close)
  // -------------------------------------------------------------------------
  // @brief  Inserts or overwrites one closing price.
  //
  // @throws std::invalid_argument if @p ticker is empty or @p close is not
  //         a finite positive number.
  // -------------------------------------------------------------------------
  void addQuote(const std::string& ticker, Date date, double close);

  // Closing price or std::nullopt when the ticker has no quote that day.
  std::optional<double> close(const std::string& ticker, Date date) const;

  bool hasTicker(const std::string& ticker) const;
  bool empty() const { return series_.empty(); }

  // All tickers, sorted.
  std::vector<std::string> tickers() const;

  // Sorted union of the quote dates of the given tickers. Unknown tickers
  // contribute nothing.
  std::vector<Date> datesFor(const std::vector<std::string>& tickers) const;

  // -------------------------------------------------------------------------
  // alignedSeries(ticker, dates)
  // -------------------------------------------------------------------------
  // @brief  The ticker's closes re-indexed onto @p dates, one slot per date,
  //         std::nullopt where no quote exists.
  // -------------------------------------------------------------------------
  std::vector<std::optional<double>> alignedSeries(
      const std::string& ticker, const std::vector<Date>& dates) const;

 private:
  std::map<std::string, std::map<Date, double>> series_;
};

}  // namespace domain
}  // namespace stoplab
