#include "stoplab/domain/supervised_universe.hpp"

namespace stoplab {
namespace domain {

SupervisedUniverse::SupervisedUniverse(const std::vector<std::string>& tickers) {
  ordered_.reserve(tickers.size());
  for (const auto& ticker : tickers) {
    if (ticker.empty()) {
      continue;
    }
    if (members_.insert(ticker).second) {
      ordered_.push_back(ticker);
    }
  }
}

}  // namespace domain
}  // namespace stoplab
