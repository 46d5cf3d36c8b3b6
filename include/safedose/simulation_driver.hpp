#pragma once

// Simulation driver: steps the closed loop, records the time series,
// summarizes it and persists it.
//
// Loop (single-threaded, synchronous):
//   reset → [ decide → step → record ]* → summarize → write table → report
//
// The loop ends the first time the environment signals termination or when
// the step budget is spent. Any exception from the environment or the
// controller aborts the run before anything is written or reported.

#include "safedose/controller.hpp"
#include "safedose/environment.hpp"
#include "safedose/event_log.hpp"
#include "safedose/results_table.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace safedose {

struct SimulationSummary final {
  double mean_cgm = 0.0;
  double min_cgm = 0.0;
  double max_cgm = 0.0;
};

struct SimulationResult final {
  std::vector<StepRecord> records;
  SimulationSummary summary{};
  bool terminated_by_environment = false; // false: step budget spent
  std::string output_path;
};

struct DriverConfig final {
  std::string subject_name = "adolescent#003";
  std::string output_path = "sim_results_summary.csv";
  LogLevel log_level = LogLevel::INFO;
};

// Mean/min/max of the CGM column. Throws EmptyResult on an empty sequence.
SimulationSummary summarize(const std::vector<StepRecord>& records);

class SimulationDriver final {
public:
  // Logs to stdout at cfg.log_level.
  explicit SimulationDriver(DriverConfig cfg = DriverConfig{});

  // Logs through a caller-supplied sink; its threshold is left as is.
  SimulationDriver(DriverConfig cfg, std::unique_ptr<EventLog> log);

  // Run one episode. The environment is used exclusively by this call.
  //
  // Throws:
  //   EnvironmentError (or whatever the environment throws) - propagated as is
  //   ValidationError  - controller rejected its inputs
  //   EmptyResult      - no step completed
  //   OutputError      - results table could not be written
  SimulationResult run(Environment& env, const Controller& controller,
                       std::size_t max_steps);

private:
  void reportDecision(const StepRecord& rec, const Decision& d, bool was_suspended);
  void reportSummary(const SimulationSummary& s, std::size_t steps);

  DriverConfig cfg_;
  std::unique_ptr<EventLog> log_;
};

} // namespace safedose
