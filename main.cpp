// -----------------------------------------------------------------------------
// stoplab: single executable entry point.
//
// Offline replay of a sell-only stop ruleset:
//   1) Load the run configuration, ruleset, close prices and supervised
//      universe. Loading problems are collected into one RunDiagnostics
//      instead of aborting.
//   2) Run the SimulationEngine over the configured horizon. Rolling
//      metrics are materialised on a worker pool first; the daily loop is
//      sequential on the main thread.
//   3) Write the order log, equity curve, decision trace, summary and run
//      report under the output directory.
//
// Usage:
//   stoplab <config.json> <ruleset.json> <prices.csv> <universe.txt> <out_dir>
//
// Exit codes:
//   0  run passed (no errors recorded)
//   1  usage error, or the output could not be written
//   2  run completed with errors (see lab_run_report.json)
// -----------------------------------------------------------------------------

#include "stoplab/domain/run_diagnostics.hpp"
#include "stoplab/engine/report_writer.hpp"
#include "stoplab/engine/simulation_engine.hpp"
#include "stoplab/io/config_loader.hpp"
#include "stoplab/io/price_csv_loader.hpp"
#include "stoplab/io/universe_loader.hpp"
#include "stoplab/rules/rule_set_loader.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " <config.json> <ruleset.json> <prices.csv> <universe.txt>"
               " <out_dir>\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 6) {
    printUsage(argv[0]);
    return 1;
  }
  const std::string config_path = argv[1];
  const std::string ruleset_path = argv[2];
  const std::string prices_path = argv[3];
  const std::string universe_path = argv[4];
  const std::filesystem::path out_dir = argv[5];

  // -------------------------------------------------------------------------
  // 1) Inputs. Every loader appends to the same diagnostics.
  // -------------------------------------------------------------------------
  stoplab::RunDiagnostics diagnostics;

  const stoplab::domain::SimulationConfig config =
      stoplab::io::ConfigLoader(diagnostics).loadFile(config_path);

  // A missing ruleset leaves an empty one: every holding is then held
  // (DEFAULT_HOLD) and the error fails the run.
  stoplab::rules::RuleSet rule_set;
  if (auto loaded =
          stoplab::rules::RuleSetLoader(diagnostics).loadFile(ruleset_path)) {
    rule_set = std::move(*loaded);
  }

  const stoplab::domain::PriceHistory prices =
      stoplab::io::PriceCsvLoader(diagnostics).loadFile(prices_path);
  const stoplab::domain::SupervisedUniverse universe =
      stoplab::io::UniverseLoader(diagnostics).loadFile(universe_path);

  // -------------------------------------------------------------------------
  // 2) Replay.
  // -------------------------------------------------------------------------
  const stoplab::SimulationResult result = stoplab::runSimulation(
      config, rule_set, prices, universe, std::move(diagnostics));

  // -------------------------------------------------------------------------
  // 3) Artefacts.
  // -------------------------------------------------------------------------
  stoplab::ReportContext context;
  // "runs/a/" has an empty filename.
  context.run_id = out_dir.has_filename()
                       ? out_dir.filename().string()
                       : out_dir.parent_path().filename().string();
  context.ruleset_id = rule_set.ruleset_id;
  context.ruleset_path = ruleset_path;
  context.config_path = config_path;
  context.prices_path = prices_path;
  context.universe_path = universe_path;

  try {
    stoplab::ReportWriter(out_dir).writeAll(result, context);
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  for (const auto& error : result.diagnostics.errors) {
    std::cerr << "[main] error: " << error << "\n";
  }
  std::cout << "[main] overall_pass="
            << (result.overallPass() ? "true" : "false")
            << " final_value=" << result.summary.final_value << "\n";
  return result.overallPass() ? 0 : 2;
}
