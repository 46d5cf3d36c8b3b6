#pragma once

// Deterministic replay environment.
//
// Plays back a fixed sequence of CGM readings and meal events regardless of
// the actions applied to it. Used to drive the loop in tests and in the
// headless example without a physiological model.

#include "safedose/environment.hpp"

#include <cstddef>
#include <ctime>
#include <string>
#include <vector>

namespace safedose {

struct TraceSample final {
  double cgm_mg_dl = 0.0;
  double meal_g = 0.0; // NaN means "no meal metadata for this sample"
};

struct TraceConfig final {
  // Wrap around at the end of the trace instead of signaling termination.
  bool repeat = false;

  // Optional clock. With start_time >= 0 every sample carries a UTC label
  // "YYYY-MM-DD HH:MM:SS" at start_time + index * sample_minutes.
  std::time_t start_time = -1;
  int sample_minutes = 1;
};

class TraceEnvironment final : public Environment {
public:
  explicit TraceEnvironment(std::vector<TraceSample> samples,
                            TraceConfig cfg = TraceConfig{});

  // Throws EnvironmentError if the trace is empty.
  StepResult reset() override;

  // Throws EnvironmentError if called before reset() or after termination.
  StepResult step(const Action& action) override;

  // Actions received since the last reset(), in order.
  const std::vector<Action>& applied_actions() const { return applied_; }

private:
  StepResult emit() const;
  std::string time_label(std::size_t tick) const;

  std::vector<TraceSample> samples_;
  TraceConfig cfg_;

  bool started_ = false;
  bool finished_ = false;
  std::size_t index_ = 0; // index of the sample last emitted
  std::size_t tick_ = 0;  // emitted samples since reset, drives the clock
  std::vector<Action> applied_;
};

// UTC timestamp formatting shared with the example program.
std::string format_utc(std::time_t t);

} // namespace safedose
