#include "stoplab/io/price_csv_loader.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace stoplab {
namespace io {

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, last - first + 1);
}

std::vector<std::string> splitCsv(const std::string& line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = line.find(',', start);
    if (comma == std::string::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return fields;
}

std::optional<double> parseClose(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  if (!std::isfinite(value) || value <= 0.0) {
    return std::nullopt;
  }
  return value;
}

int columnIndex(const std::vector<std::string>& header,
                const std::string& name) {
  auto it = std::find(header.begin(), header.end(), name);
  return it == header.end() ? -1 : static_cast<int>(it - header.begin());
}

}  // namespace

domain::PriceHistory PriceCsvLoader::loadFile(const std::string& path) {
  domain::PriceHistory prices;
  std::ifstream in(path);
  if (!in) {
    diagnostics_.error("price_file_not_found:" + path);
    std::cerr << "[PriceCsvLoader] ERROR: cannot open " << path << "\n";
    return prices;
  }
  const std::size_t rows = read(in, prices);
  std::cout << "[PriceCsvLoader] Loaded " << rows << " quote(s) for "
            << prices.tickers().size() << " ticker(s) from " << path << "\n";
  return prices;
}

// -----------------------------------------------------------------------------
// read: header, then one quote per line
// -----------------------------------------------------------------------------
std::size_t PriceCsvLoader::read(std::istream& in, domain::PriceHistory& out) {
  std::string line;
  if (!std::getline(in, line)) {
    diagnostics_.error("price_header_invalid");
    return 0;
  }

  const std::vector<std::string> header = splitCsv(line);
  const int date_col = columnIndex(header, "date");
  const int ticker_col = columnIndex(header, "ticker");
  const int close_col = columnIndex(header, "close");
  if (date_col < 0 || ticker_col < 0 || close_col < 0) {
    diagnostics_.error("price_header_invalid");
    std::cerr << "[PriceCsvLoader] ERROR: header must contain "
                 "date,ticker,close\n";
    return 0;
  }
  const std::size_t needed = static_cast<std::size_t>(
      std::max({date_col, ticker_col, close_col}) + 1);

  std::size_t accepted = 0;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }
    const std::vector<std::string> fields = splitCsv(line);
    if (fields.size() < needed) {
      diagnostics_.warn("price_row_invalid:" + std::to_string(line_no));
      continue;
    }

    const std::optional<Date> date = Date::parse(fields[date_col]);
    const std::string& ticker = fields[ticker_col];
    const std::optional<double> close = parseClose(fields[close_col]);
    if (!date || ticker.empty() || !close) {
      diagnostics_.warn("price_row_invalid:" + std::to_string(line_no));
      continue;
    }
    out.addQuote(ticker, *date, *close);
    ++accepted;
  }
  return accepted;
}

}  // namespace io
}  // namespace stoplab
