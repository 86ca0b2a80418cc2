#pragma once

#include "stoplab/domain/price_history.hpp"
#include "stoplab/domain/run_diagnostics.hpp"

#include <cstddef>
#include <istream>
#include <string>

namespace stoplab {
namespace io {

// -----------------------------------------------------------------------------
// PriceCsvLoader: long-format close prices
// -----------------------------------------------------------------------------
//
// @brief  Fills a PriceHistory from a `date,ticker,close` CSV.
//
// @details
// The first line must be a header naming the three columns (any order,
// extra columns ignored). Each following line is one observation; a later
// row for the same (ticker, date) overwrites an earlier one.
//
// A row with a bad date, an empty ticker or a close that is empty,
// non-numeric, non-finite or <= 0 is skipped and recorded as the warning
// price_row_invalid:<line>. Blank lines are ignored.
//
// An unreadable file records the error price_file_not_found:<path>; a
// missing header column records price_header_invalid.
// -----------------------------------------------------------------------------
class PriceCsvLoader {
 public:
  explicit PriceCsvLoader(RunDiagnostics& diagnostics)
      : diagnostics_(diagnostics) {}

  domain::PriceHistory loadFile(const std::string& path);

  // Parses from an already open stream. Returns the number of accepted rows.
  std::size_t read(std::istream& in, domain::PriceHistory& out);

 private:
  RunDiagnostics& diagnostics_;
};

}  // namespace io
}  // namespace stoplab
