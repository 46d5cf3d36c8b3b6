// Headless 24-hour closed-loop run for one simulated subject.
//
// The environment replays a synthetic CGM trace (slow oscillation with one
// low excursion per cycle) and three meals. It is a stand-in for a full
// patient/sensor/pump simulator: the policy never influences the trace.

#include "safedose/errors.hpp"
#include "safedose/safety_gated_policy.hpp"
#include "safedose/simulation_driver.hpp"
#include "safedose/trace_environment.hpp"

#include <cmath>
#include <ctime>
#include <iostream>
#include <vector>

using namespace safedose;

namespace {

constexpr double kPi = 3.14159265358979323846;

// 24 hours at one-minute resolution: 1440 steps need 1441 samples.
constexpr std::size_t kSimSteps = 1440;

// 2024-01-01 00:00:00 UTC
constexpr std::time_t kStartTime = 1704067200;

std::vector<TraceSample> make_day_trace() {
  std::vector<TraceSample> trace(kSimSteps + 1);

  for (std::size_t m = 0; m < trace.size(); ++m) {
    const double t = static_cast<double>(m);
    trace[m].cgm_mg_dl = 115.0 + 50.0 * std::sin(2.0 * kPi * t / 480.0)
                               + 5.0 * std::sin(2.0 * kPi * t / 37.0);
    trace[m].meal_g = 0.0;
  }

  trace[7 * 60].meal_g = 45.0;   // breakfast
  trace[12 * 60].meal_g = 70.0;  // lunch
  trace[18 * 60].meal_g = 80.0;  // dinner
  return trace;
}

} // namespace

int main() {
  std::cout << "SafeDose Headless Simulation\n";
  std::cout << "============================\n\n";

  TraceConfig trace_cfg;
  trace_cfg.start_time = kStartTime;
  trace_cfg.sample_minutes = 1;
  TraceEnvironment env(make_day_trace(), trace_cfg);

  SafetyGatedPolicyConfig policy_cfg;
  policy_cfg.basal_u_per_min = 0.05;
  policy_cfg.correction_bolus_u = 1.0;
  policy_cfg.low_threshold_mg_dl = 70.0;

  DriverConfig driver_cfg;
  driver_cfg.subject_name = "adolescent#003";
  driver_cfg.output_path = "sim_results_summary.csv";
  driver_cfg.log_level = LogLevel::INFO;

  try {
    SafetyGatedPolicy controller(policy_cfg);
    SimulationDriver driver(driver_cfg);

    std::cout << "Scenario start: " << format_utc(kStartTime) << " UTC\n";
    driver.run(env, controller, kSimSteps);
  } catch (const SimulationError& e) {
    std::cerr << "Simulation failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
