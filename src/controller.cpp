#include "safedose/controller.hpp"

#include "safedose/errors.hpp"

#include <cmath>
#include <sstream>

namespace safedose {

namespace {

bool valid_command(double x) {
  return std::isfinite(x) && x >= 0.0;
}

} // namespace

Decision Controller::decide(const Observation& obs, double disturbance_g,
                            const ControllerState& state) const {
  if (!std::isfinite(obs.cgm_mg_dl)) {
    std::ostringstream msg;
    msg << name() << ": observation must be finite (got " << obs.cgm_mg_dl << ")";
    throw ValidationError(msg.str());
  }

  if (!std::isfinite(disturbance_g) || disturbance_g < 0.0) {
    std::ostringstream msg;
    msg << name() << ": disturbance must be >= 0 (got " << disturbance_g << ")";
    throw ValidationError(msg.str());
  }

  Decision d = policy(obs, disturbance_g, state);

  if (!valid_command(d.action.basal_u_per_min) || !valid_command(d.action.bolus_u)) {
    std::ostringstream msg;
    msg << name() << ": policy produced an invalid action (basal="
        << d.action.basal_u_per_min << ", bolus=" << d.action.bolus_u << ")";
    throw ValidationError(msg.str());
  }

  return d;
}

} // namespace safedose
