// src/plant/quantity.hpp
#pragma once

namespace plant {

/// Energy domain carried by a port or link.
enum class Domain {
    Mechanical,   // torque [N·m] x angular velocity [rad/s]
    Electrical,   // voltage [V] x current [A]
    Chemical      // specific energy [J/kg] x mass flow [kg/s]
};

inline const char* to_string(Domain d) {
    switch (d) {
        case Domain::Mechanical: return "mechanical";
        case Domain::Electrical: return "electrical";
        case Domain::Chemical:   return "chemical";
    }
    return "unknown";
}

/// Resolved direction of power through a link for one step.
enum class FlowDirection {
    Idle,         // no power transferred
    Discharge,    // source -> load
    Regenerate    // load -> source
};

inline const char* to_string(FlowDirection f) {
    switch (f) {
        case FlowDirection::Idle:       return "idle";
        case FlowDirection::Discharge:  return "discharge";
        case FlowDirection::Regenerate: return "regenerate";
    }
    return "unknown";
}

/**
 * Quantity - typed effort/flow pair exchanged over a link
 *
 * Power is effort * flow in every domain. Sign convention: positive power
 * flows downstream (from the energy sources toward the body).
 */
struct Quantity {
    Domain domain = Domain::Mechanical;
    double effort = 0.0;
    double flow = 0.0;

    double power() const { return effort * flow; }

    // Mechanical accessors
    double torque() const { return effort; }
    double speed() const { return flow; }

    // Electrical accessors
    double voltage() const { return effort; }
    double current() const { return flow; }

    static Quantity mechanical(double torque_nm, double speed_radps) {
        return Quantity{Domain::Mechanical, torque_nm, speed_radps};
    }

    static Quantity electrical(double voltage_v, double current_a) {
        return Quantity{Domain::Electrical, voltage_v, current_a};
    }

    static Quantity chemical(double specific_energy_jpkg, double mass_flow_kgps) {
        return Quantity{Domain::Chemical, specific_energy_jpkg, mass_flow_kgps};
    }

    /// Build a non-mechanical quantity from a power and the effort of the port.
    static Quantity from_power(Domain domain, double effort, double power_w) {
        return Quantity{domain, effort, (effort != 0.0) ? power_w / effort : 0.0};
    }
};

} // namespace plant
