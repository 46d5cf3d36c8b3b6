// Deterministic evaluation logic for the safety-gated dosing policy.

#include "safedose/safety_gated_policy.hpp"

#include "safedose/errors.hpp"

#include <cmath>
#include <string>

namespace safedose {

// ============================================================================
// Configuration validation
// ============================================================================
void validate_config(const SafetyGatedPolicyConfig& cfg) {
  auto require_non_negative = [](double v, const char* field) {
    if (!std::isfinite(v) || v < 0.0) {
      throw ValidationError(std::string("SafetyGatedPolicyConfig.") + field +
                            " must be finite and >= 0");
    }
  };

  require_non_negative(cfg.basal_u_per_min, "basal_u_per_min");
  require_non_negative(cfg.correction_bolus_u, "correction_bolus_u");

  // The threshold may sit anywhere on the real line, but must be a number.
  if (!std::isfinite(cfg.low_threshold_mg_dl)) {
    throw ValidationError("SafetyGatedPolicyConfig.low_threshold_mg_dl must be finite");
  }
}

SafetyGatedPolicy::SafetyGatedPolicy(SafetyGatedPolicyConfig cfg, ControllerState init_state)
    : Controller(init_state), cfg_(cfg) {
  validate_config(cfg_);
}

// ============================================================================
// Core evaluation
// ============================================================================
Decision SafetyGatedPolicy::policy(const Observation& obs, double disturbance_g,
                                   const ControllerState& state) const {
  Decision out{};
  out.flags = FLAG_NONE;
  out.state = state; // stateless: hand the payload back unchanged

  // ------------------------------------------------------------------------
  // Step 1: DOSING-mode command
  // ------------------------------------------------------------------------
  out.action.basal_u_per_min = cfg_.basal_u_per_min;
  out.action.bolus_u = 0.0;

  if (disturbance_g > 0.0) {
    out.action.bolus_u = cfg_.correction_bolus_u;
  }

  // ------------------------------------------------------------------------
  // Step 2: Low-glucose interlock
  // ------------------------------------------------------------------------
  // Recomputed from the current reading only. No latch: the policy returns
  // to DOSING on the first step back at or above the threshold.
  out.mode = mode_for(obs.cgm_mg_dl);

  if (out.mode == DosingMode::SUSPENDED) {
    out.action.basal_u_per_min = 0.0;
    out.flags |= FLAG_BASAL_SUSPENDED;

    if (cfg_.suspend_bolus_when_low) {
      out.action.bolus_u = 0.0;
    }
  }

  if (out.action.bolus_u > 0.0) {
    out.flags |= FLAG_BOLUS_DELIVERED;
  }

  return out;
}

} // namespace safedose
