#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace stoplab {
namespace domain {

// -----------------------------------------------------------------------------
// SupervisedUniverse: admissible tickers
// -----------------------------------------------------------------------------
//
// @brief  The set of tickers the strategy may hold, plus a fixed iteration
//         order used by the weekly buy ("first N eligible").
//
// @details
// Holding a ticker outside the universe forces a ZERO exit
// (EXIT_IF_NOT_IN_SUPERVISED) before any other rule is consulted.
//
// Iteration order is the order given at construction, duplicates dropped
// (first occurrence wins). UniverseLoader sorts before constructing, which
// reproduces the alphabetical order of the supervised file.
// -----------------------------------------------------------------------------
class SupervisedUniverse {
 public:
  SupervisedUniverse() = default;
  explicit SupervisedUniverse(const std::vector<std::string>& tickers);

  bool contains(const std::string& ticker) const {
    return members_.count(ticker) > 0;
  }

  const std::vector<std::string>& tickers() const { return ordered_; }
  std::size_t size() const { return ordered_.size(); }
  bool empty() const { return ordered_.empty(); }

 private:
  std::vector<std::string> ordered_;
  std::unordered_set<std::string> members_;
};

}  // namespace domain
}  // namespace stoplab
