#pragma once

#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/domain/supervised_universe.hpp"

#include <istream>
#include <string>

namespace stoplab {
namespace io {

// -----------------------------------------------------------------------------
// UniverseLoader: supervised ticker list
// -----------------------------------------------------------------------------
// One ticker per line. Text after '#' is a comment; blank lines are
// skipped. The result is sorted and de-duplicated, which fixes the weekly
// buy's iteration order. An unreadable file records universe_not_found:<path>
// and an empty file the warning universe_empty.
// -----------------------------------------------------------------------------
class UniverseLoader {
 public:
  explicit UniverseLoader(RunDiagnostics& diagnostics)
      : diagnostics_(diagnostics) {}

  domain::SupervisedUniverse loadFile(const std::string& path);
  domain::SupervisedUniverse read(std::istream& in);

 private:
  RunDiagnostics& diagnostics_;
};

}  // namespace io
}  // namespace stoplab
