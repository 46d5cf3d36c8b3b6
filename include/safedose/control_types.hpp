#pragma once

// Value types exchanged between the environment, the controller and the
// simulation driver on every control step.
//
// UNITS:
// - glucose: mg/dL (CGM reading)
// - carbohydrate disturbance: grams
// - basal rate: insulin units per minute
// - bolus: insulin units, delivered within the step

#include <cstdint>
#include <limits>
#include <string>

namespace safedose {

// Sensed measurement produced once per step by the environment.
struct Observation final {
  double cgm_mg_dl = std::numeric_limits<double>::quiet_NaN();
};

// Actuator command for one step. Both fields are >= 0.
struct Action final {
  double basal_u_per_min = 0.0;
  double bolus_u = 0.0;
};

// Opaque payload a controller threads from one step to the next.
// Stateless policies hand it back untouched.
struct ControllerState final {
  double init_state = 0.0;
};

// Operating mode of a gated policy, recomputed every step.
enum class DosingMode : uint8_t {
  DOSING = 0,     // Baseline delivery active
  SUSPENDED = 1   // Low-glucose interlock: baseline forced to zero
};

// Bit flags for explainability (OR together).
// The driver turns these into log lines; they never feed back into control.
enum DoseFlags : uint32_t {
  FLAG_NONE             = 0,
  FLAG_BOLUS_DELIVERED  = 1u << 0,  // Correction bolus issued this step
  FLAG_BASAL_SUSPENDED  = 1u << 1   // Low-glucose interlock engaged
};

// One controller output: the command, the state to pass into the next call,
// and the reasons behind it.
struct Decision final {
  Action action{};
  ControllerState state{};
  DosingMode mode = DosingMode::DOSING;
  uint32_t flags = FLAG_NONE;
};

// Per-step metadata reported by the environment.
struct StepInfo final {
  double meal_g = std::numeric_limits<double>::quiet_NaN(); // NaN when absent
  std::string time;                                         // empty when absent
};

inline const char* to_string(DosingMode m) {
  switch (m) {
    case DosingMode::DOSING: return "DOSING";
    case DosingMode::SUSPENDED: return "SUSPENDED";
    default: return "UNKNOWN";
  }
}

} // namespace safedose
