#pragma once

#include <string>
#include <utility>
#include <vector>

namespace stoplab {

// -----------------------------------------------------------------------------
// RunDiagnostics: accumulated setup problems
// -----------------------------------------------------------------------------
//
// @brief  Error and warning codes gathered while loading inputs and
//         preparing a run, returned alongside the results.
//
// @details
// Codes are short machine-readable strings, optionally suffixed with the
// offending item ("ruleset_not_found:rules/a.json"). Errors make the run
// fail (overallPass() == false) but never stop it; warnings are
// informational.
//
// Loaders and SimulationEngine append to the same instance; the engine
// hands it back inside SimulationResult.
// -----------------------------------------------------------------------------
struct RunDiagnostics {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void error(std::string code) { errors.push_back(std::move(code)); }
  void warn(std::string code) { warnings.push_back(std::move(code)); }

  bool overallPass() const { return errors.empty(); }

  void merge(const RunDiagnostics& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(),
                    other.warnings.end());
  }
};

}  // namespace stoplab
