#pragma once

// Contract for the stepped process simulation (patient, sensor, pump,
// scenario). The core treats it as an opaque collaborator.

#include "safedose/control_types.hpp"

namespace safedose {

struct StepResult final {
  Observation observation{};
  double reward = 0.0; // ignored by the driver
  bool done = false;
  StepInfo info{};
};

// Implementations report failures by throwing EnvironmentError.
// One instance serves one run at a time.
class Environment {
public:
  virtual ~Environment() = default;

  virtual StepResult reset() = 0;
  virtual StepResult step(const Action& action) = 0;
};

} // namespace safedose
