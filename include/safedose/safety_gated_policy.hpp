#pragma once

// Safety-gated dosing policy: fixed basal, event-triggered correction bolus,
// hard low-glucose interlock.
//
// SAFETY PRINCIPLES:
// 1. Determinism: identical inputs → identical outputs
// 2. Inspectability: every decision carries explicit reason flags
// 3. Fail-safe: low glucose → basal delivery suspended
// 4. Memoryless: no latch, no hysteresis, no history
//
// IMPORTANT NON-GOALS:
// - Does NOT claim clinical efficacy
// - Does NOT replace medical judgment
// - Does NOT model insulin-on-board, carb absorption or sensor lag

#include "safedose/controller.hpp"

namespace safedose {

// Configuration is explicit and auditable.
// All parameters are policy decisions set per deployment, not learned values.
struct SafetyGatedPolicyConfig final {
  // Baseline delivery while DOSING (0.05 U/min ≈ 3 U/h)
  double basal_u_per_min = 0.05;

  // Fixed correction bolus on any step with a carbohydrate disturbance
  double correction_bolus_u = 1.0;

  // Interlock: below this reading the policy enters SUSPENDED
  double low_threshold_mg_dl = 70.0;

  // Whether SUSPENDED also withholds the correction bolus.
  // Off by default: the reference behavior only suspends basal.
  bool suspend_bolus_when_low = false;
};

// Throws ValidationError on negative or non-finite constants.
void validate_config(const SafetyGatedPolicyConfig& cfg);

// State machine with two modes, re-evaluated from scratch every step:
//
//   DOSING     (cgm >= threshold): basal = cfg.basal_u_per_min
//   SUSPENDED  (cgm <  threshold): basal = 0
//
//   bolus = cfg.correction_bolus_u if disturbance > 0, else 0
//
// The controller state argument is passed through untouched.
class SafetyGatedPolicy final : public Controller {
public:
  explicit SafetyGatedPolicy(SafetyGatedPolicyConfig cfg = SafetyGatedPolicyConfig{},
                             ControllerState init_state = ControllerState{});

  std::string name() const override { return "SafetyGatedPolicy"; }

  const SafetyGatedPolicyConfig& config() const { return cfg_; }

  // Mode for a given reading, as used by policy().
  DosingMode mode_for(double cgm_mg_dl) const {
    return cgm_mg_dl < cfg_.low_threshold_mg_dl ? DosingMode::SUSPENDED
                                                : DosingMode::DOSING;
  }

protected:
  Decision policy(const Observation& obs, double disturbance_g,
                  const ControllerState& state) const override;

private:
  SafetyGatedPolicyConfig cfg_;
};

} // namespace safedose
