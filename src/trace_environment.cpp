#include "safedose/trace_environment.hpp"

#include "safedose/errors.hpp"

#include <ctime>
#include <utility>

namespace safedose {

std::string format_utc(std::time_t t) {
  std::tm tm_utc{};
  if (gmtime_r(&t, &tm_utc) == nullptr) {
    throw EnvironmentError("cannot convert timestamp " + std::to_string(t));
  }
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_utc);
  return std::string(buf);
}

TraceEnvironment::TraceEnvironment(std::vector<TraceSample> samples, TraceConfig cfg)
    : samples_(std::move(samples)), cfg_(cfg) {}

StepResult TraceEnvironment::reset() {
  if (samples_.empty()) {
    throw EnvironmentError("TraceEnvironment: cannot reset an empty trace");
  }

  started_ = true;
  index_ = 0;
  tick_ = 0;
  applied_.clear();

  // A single-sample trace has nothing to step into.
  finished_ = !cfg_.repeat && samples_.size() == 1;

  StepResult r = emit();
  r.done = finished_;
  return r;
}

StepResult TraceEnvironment::step(const Action& action) {
  if (!started_) {
    throw EnvironmentError("TraceEnvironment: step() called before reset()");
  }
  if (finished_) {
    throw EnvironmentError("TraceEnvironment: step() called after termination");
  }

  applied_.push_back(action);

  ++tick_;
  if (cfg_.repeat) {
    index_ = (index_ + 1) % samples_.size();
  } else {
    ++index_;
    finished_ = (index_ + 1 == samples_.size());
  }

  StepResult r = emit();
  r.done = finished_;
  return r;
}

StepResult TraceEnvironment::emit() const {
  const TraceSample& s = samples_[index_];

  StepResult r;
  r.observation.cgm_mg_dl = s.cgm_mg_dl;
  r.reward = 0.0;
  r.info.meal_g = s.meal_g;
  r.info.time = time_label(tick_);
  return r;
}

std::string TraceEnvironment::time_label(std::size_t tick) const {
  if (cfg_.start_time < 0) {
    return std::string();
  }
  const std::time_t offset =
      static_cast<std::time_t>(tick) * static_cast<std::time_t>(cfg_.sample_minutes) * 60;
  return format_utc(cfg_.start_time + offset);
}

} // namespace safedose
