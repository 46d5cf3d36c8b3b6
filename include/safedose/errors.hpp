#pragma once

// Error taxonomy for a simulation run.
//
// Nothing inside the core swallows or retries these: any of them aborts the
// run and surfaces to whoever invoked the driver.

#include <stdexcept>
#include <string>

namespace safedose {

class SimulationError : public std::runtime_error {
public:
  explicit SimulationError(const std::string& what) : std::runtime_error(what) {}
};

// Out-of-domain controller input, invalid configuration, or a controller
// returning a command that breaks the action contract.
class ValidationError : public SimulationError {
public:
  explicit ValidationError(const std::string& what) : SimulationError(what) {}
};

// The environment collaborator failed during reset or step.
class EnvironmentError : public SimulationError {
public:
  explicit EnvironmentError(const std::string& what) : SimulationError(what) {}
};

// No step was recorded, so summary statistics are undefined.
class EmptyResult : public SimulationError {
public:
  explicit EmptyResult(const std::string& what) : SimulationError(what) {}
};

// The results table could not be written or read back.
class OutputError : public SimulationError {
public:
  explicit OutputError(const std::string& what) : SimulationError(what) {}
};

} // namespace safedose
