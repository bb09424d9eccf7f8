// src/plant/sim_errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace plant {

enum class FailureReason {
    None,
    Connectivity,
    OperatingPointOutOfRange,
    Depletion,
    Controller
};

inline const char* to_string(FailureReason r) {
    switch (r) {
        case FailureReason::None:                     return "none";
        case FailureReason::Connectivity:             return "ConnectivityError";
        case FailureReason::OperatingPointOutOfRange: return "OperatingPointOutOfRange";
        case FailureReason::Depletion:                return "DepletionError";
        case FailureReason::Controller:               return "ControllerError";
    }
    return "unknown";
}

/**
 * Base of every modeled failure. The simulator turns these into a Failed
 * run outcome; anything else escaping a step is a programming error.
 */
class SimulationError : public std::runtime_error {
public:
    SimulationError(FailureReason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}

    FailureReason reason() const { return reason_; }

private:
    FailureReason reason_;
};

/// Malformed component graph, raised while assembling a vehicle.
class ConnectivityError : public SimulationError {
public:
    explicit ConnectivityError(const std::string& what)
        : SimulationError(FailureReason::Connectivity, "[Connectivity] " + what) {}
};

/// Converter command or state outside its physical domain.
class OperatingPointOutOfRange : public SimulationError {
public:
    OperatingPointOutOfRange(const std::string& component, const std::string& what)
        : SimulationError(FailureReason::OperatingPointOutOfRange,
                          "[" + component + "] operating point out of range: " + what),
          component_(component) {}

    const std::string& component() const { return component_; }

private:
    std::string component_;
};

/// Energy source cannot cover the demand of a step.
class DepletionError : public SimulationError {
public:
    DepletionError(const std::string& source, double demanded, double available)
        : SimulationError(FailureReason::Depletion,
                          "[" + source + "] depleted: demanded " + std::to_string(demanded) +
                          ", available " + std::to_string(available)),
          source_(source), demanded_(demanded), available_(available) {}

    const std::string& source() const { return source_; }
    double demanded() const { return demanded_; }
    double available() const { return available_; }

private:
    std::string source_;
    double demanded_;
    double available_;
};

/// Controller could not produce a command set (e.g. a script error).
class ControllerError : public SimulationError {
public:
    explicit ControllerError(const std::string& what)
        : SimulationError(FailureReason::Controller, "[ECU] " + what) {}
};

} // namespace plant
