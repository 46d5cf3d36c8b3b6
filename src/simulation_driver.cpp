#include "safedose/simulation_driver.hpp"

#include "safedose/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <sstream>
#include <utility>

namespace safedose {

namespace {

const std::string kSeparator(30, '-');

// Absent meal metadata reads as "no disturbance". Present values are passed
// through untouched so the controller can reject out-of-domain ones.
double disturbance_from(const StepInfo& info) {
  return std::isnan(info.meal_g) ? 0.0 : info.meal_g;
}

} // namespace

// ============================================================================
// Statistics
// ============================================================================
SimulationSummary summarize(const std::vector<StepRecord>& records) {
  if (records.empty()) {
    throw EmptyResult("no simulation steps were recorded; statistics are undefined");
  }

  const auto by_cgm = [](const StepRecord& a, const StepRecord& b) {
    return a.cgm_mg_dl < b.cgm_mg_dl;
  };
  const auto sum = std::accumulate(records.begin(), records.end(), 0.0,
                                   [](double acc, const StepRecord& r) {
                                     return acc + r.cgm_mg_dl;
                                   });
  const auto mm = std::minmax_element(records.begin(), records.end(), by_cgm);

  SimulationSummary s;
  s.mean_cgm = sum / static_cast<double>(records.size());
  s.min_cgm = mm.first->cgm_mg_dl;
  s.max_cgm = mm.second->cgm_mg_dl;
  return s;
}

// ============================================================================
// Driver
// ============================================================================
SimulationDriver::SimulationDriver(DriverConfig cfg)
    : cfg_(std::move(cfg))
    , log_(std::make_unique<StreamEventLog>(std::cout, cfg_.log_level))
{}

SimulationDriver::SimulationDriver(DriverConfig cfg, std::unique_ptr<EventLog> log)
    : cfg_(std::move(cfg))
    , log_(std::move(log))
{
  if (!log_) {
    log_ = std::make_unique<NullEventLog>();
  }
}

SimulationResult SimulationDriver::run(Environment& env, const Controller& controller,
                                       std::size_t max_steps) {
  {
    std::ostringstream banner;
    banner << "Starting simulation for " << cfg_.subject_name
           << " (" << controller.name() << ", max " << max_steps << " steps)...";
    log_->log(LogLevel::INFO, banner.str());
  }

  // ------------------------------------------------------------------------
  // Step 1: Reset environment and controller state
  // ------------------------------------------------------------------------
  StepResult current = env.reset();
  ControllerState state = controller.initial_state();

  SimulationResult result;
  result.terminated_by_environment = current.done;
  result.records.reserve(std::min<std::size_t>(max_steps, 4096));

  bool suspended = false;

  // ------------------------------------------------------------------------
  // Step 2: Closed loop
  // ------------------------------------------------------------------------
  for (std::size_t i = 0; i < max_steps && !result.terminated_by_environment; ++i) {
    const double disturbance = disturbance_from(current.info);

    Decision d = controller.decide(current.observation, disturbance, state);
    StepResult next = env.step(d.action);

    // Record the observation the controller acted on, not the one the
    // action produced.
    StepRecord rec;
    rec.time = current.info.time.empty() ? std::to_string(i) : current.info.time;
    rec.cgm_mg_dl = current.observation.cgm_mg_dl;
    rec.meal_g = disturbance;
    rec.basal_u_per_min = d.action.basal_u_per_min;
    rec.bolus_u = d.action.bolus_u;
    result.records.push_back(rec);

    reportDecision(rec, d, suspended);
    suspended = (d.mode == DosingMode::SUSPENDED);

    state = d.state;
    result.terminated_by_environment = next.done;
    current = std::move(next);
  }

  // ------------------------------------------------------------------------
  // Step 3: Summarize, persist, report
  // ------------------------------------------------------------------------
  result.summary = summarize(result.records);

  write_results_csv(cfg_.output_path, result.records);
  result.output_path = cfg_.output_path;

  reportSummary(result.summary, result.records.size());
  log_->log(LogLevel::INFO, "Results saved to '" + result.output_path + "'");

  return result;
}

void SimulationDriver::reportDecision(const StepRecord& rec, const Decision& d,
                                      bool was_suspended) {
  if (log_->enabled(LogLevel::DEBUG)) {
    std::ostringstream line;
    line << "   [t=" << rec.time << "] CGM=" << rec.cgm_mg_dl
         << " Meal=" << rec.meal_g << "g"
         << " Basal=" << rec.basal_u_per_min << "U/min"
         << " Bolus=" << rec.bolus_u << "U"
         << " Mode=" << to_string(d.mode);
    log_->log(LogLevel::DEBUG, line.str());
  }

  if (d.flags & FLAG_BOLUS_DELIVERED) {
    std::ostringstream line;
    line << "   [EVENT] Meal Detected: " << rec.meal_g << "g. Bolusing "
         << rec.bolus_u << "U";
    log_->log(LogLevel::INFO, line.str());
  }

  const bool now_suspended = (d.mode == DosingMode::SUSPENDED);
  if (now_suspended && !was_suspended) {
    std::ostringstream line;
    line << "   [ALERT] Low Glucose (" << rec.cgm_mg_dl << " mg/dL). Suspending Basal.";
    log_->log(LogLevel::WARN, line.str());
  } else if (!now_suspended && was_suspended) {
    std::ostringstream line;
    line << "   [INFO] Glucose recovered (" << rec.cgm_mg_dl << " mg/dL). Resuming Basal.";
    log_->log(LogLevel::DEBUG, line.str());
  }
}

void SimulationDriver::reportSummary(const SimulationSummary& s, std::size_t steps) {
  if (!log_->enabled(LogLevel::INFO)) {
    return;
  }

  auto mg_dl = [](double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v << " mg/dL";
    return oss.str();
  };

  log_->log(LogLevel::INFO, kSeparator);
  log_->log(LogLevel::INFO, "SIMULATION REPORT (" + std::to_string(steps) + " steps)");
  log_->log(LogLevel::INFO, "Mean Glucose: " + mg_dl(s.mean_cgm));
  log_->log(LogLevel::INFO, "Min Glucose:  " + mg_dl(s.min_cgm));
  log_->log(LogLevel::INFO, "Max Glucose:  " + mg_dl(s.max_cgm));
  log_->log(LogLevel::INFO, kSeparator);
}

} // namespace safedose
