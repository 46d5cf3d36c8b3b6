#pragma once

// Controller contract for the closed dosing loop.
//
// A controller maps (observation, disturbance, state) to (action, new state).
// It performs no I/O: the reasons behind each decision travel back in
// Decision::flags and Decision::mode, and the driver decides what to log.
//
// System Architecture:
//   [ Environment: patient + CGM + pump ]
//            ↓ observation, disturbance
//   [ Controller ]  ← (this interface)
//            ↓ action
//   [ Environment ]

#include "safedose/control_types.hpp"

#include <string>

namespace safedose {

class Controller {
public:
  explicit Controller(ControllerState init_state = ControllerState{})
      : init_state_(init_state) {}
  virtual ~Controller() = default;

  // Compute one action.
  //
  // Throws ValidationError if the observation is not finite, if the
  // disturbance is negative or not finite, or if the concrete policy returns
  // a negative or non-finite command. Otherwise returns exactly one action
  // with both fields >= 0.
  Decision decide(const Observation& obs, double disturbance_g,
                  const ControllerState& state) const;

  // State to pass into the first decide() call of a run.
  ControllerState initial_state() const { return init_state_; }

  virtual std::string name() const = 0;

protected:
  // Inputs are already validated when this is called.
  virtual Decision policy(const Observation& obs, double disturbance_g,
                          const ControllerState& state) const = 0;

private:
  ControllerState init_state_;
};

} // namespace safedose
