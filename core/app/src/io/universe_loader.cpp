#include "stoplab/io/universe_loader.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <vector>

namespace stoplab {
namespace io {

domain::SupervisedUniverse UniverseLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    diagnostics_.error("universe_not_found:" + path);
    std::cerr << "[UniverseLoader] ERROR: cannot open " << path << "\n";
    return domain::SupervisedUniverse{};
  }
  domain::SupervisedUniverse universe = read(in);
  std::cout << "[UniverseLoader] " << universe.size()
            << " supervised ticker(s) from " << path << "\n";
  return universe;
}

domain::SupervisedUniverse UniverseLoader::read(std::istream& in) {
  std::vector<std::string> tickers;
  std::string line;
  while (std::getline(in, line)) {
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    tickers.push_back(line.substr(first, last - first + 1));
  }

  std::sort(tickers.begin(), tickers.end());
  tickers.erase(std::unique(tickers.begin(), tickers.end()), tickers.end());
  if (tickers.empty()) {
    diagnostics_.warn("universe_empty");
  }
  return domain::SupervisedUniverse(tickers);
}

}  // namespace io
}  // namespace stoplab
