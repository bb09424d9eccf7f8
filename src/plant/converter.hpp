// src/plant/converter.hpp
#pragma once

#include "plant/quantity.hpp"
#include <string>

namespace plant {

/**
 * ConverterCommand - per-step inputs of a converter
 *
 * The ECU fills the command part (gear, limit_scale). The causality
 * resolver fills the operating context imposed by the rest of the graph
 * (shaft speed from the load, effort of the non-mechanical input port).
 */
struct ConverterCommand {
    // Command
    int gear = -1;              // gear index for selectable stages; -1 keeps the current gear
    double limit_scale = 1.0;   // derating of the torque/power envelope [0..1]

    // Operating context
    double shaft_speed_radps = 0.0;   // speed on the mechanical output side
    double input_effort = 0.0;        // voltage [V] or specific energy [J/kg] at the input port
};

/**
 * OperatingPoint - what a converter saw when it produced an efficiency
 *
 * Powers are magnitudes in the direction power actually travelled, so
 * loss_w() is never negative.
 */
struct OperatingPoint {
    FlowDirection direction = FlowDirection::Idle;
    double speed_radps = 0.0;   // mechanical-side speed
    double torque_nm = 0.0;     // mechanical-side torque
    double power_in_w = 0.0;
    double power_out_w = 0.0;
    double efficiency = 1.0;
    int gear = -1;

    double loss_w() const { return power_in_w - power_out_w; }
};

/**
 * Converter - transforms a Quantity between or within energy domains
 *
 * forward():  power flows input -> output (toward the load).
 * backward(): power flows output -> input (regeneration); only valid when
 *             reversible() is true.
 *
 * The resolver walks from the load, so every converter also provides
 * required_input() (the inverse of forward). Stages that sit between a
 * prime mover and the wheel additionally provide required_output() (the
 * inverse of backward) so curtailed regeneration can be pushed back down.
 *
 * Each call records the OperatingPoint it used; see last_operating_point().
 */
class Converter {
public:
    Converter(std::string name, Domain input_domain, Domain output_domain, bool reversible);
    virtual ~Converter() = default;

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    // ========================================================================
    // Transforms
    // ========================================================================

    virtual Quantity forward(const Quantity& input, const ConverterCommand& cmd) = 0;
    virtual Quantity backward(const Quantity& input, const ConverterCommand& cmd);
    virtual Quantity required_input(const Quantity& output, const ConverterCommand& cmd) = 0;
    virtual Quantity required_output(const Quantity& input, const ConverterCommand& cmd);

    // ========================================================================
    // Envelope and geometry
    // ========================================================================

    /// Latch the command part of `cmd` (e.g. a gear change).
    virtual void apply_command(const ConverterCommand& cmd) { (void)cmd; }

    /// Throws OperatingPointOutOfRange if the output shaft speed is outside the domain.
    virtual void check_speed(double output_speed_radps, const ConverterCommand& cmd) const {
        (void)output_speed_radps;
        (void)cmd;
    }

    /// input speed / output speed; 1 for converters without a mechanical input
    virtual double speed_ratio() const { return 1.0; }

    /// Rotating inertia referred to the input shaft (output shaft for prime movers)
    virtual double inertia_kgm2() const { return 0.0; }

    /// Largest torque magnitude a prime mover can deliver at this speed
    virtual double max_drive_torque(double speed_radps, const ConverterCommand& cmd) const;

    /// Largest torque magnitude a prime mover can absorb at this speed
    virtual double max_regen_torque(double speed_radps, const ConverterCommand& cmd) const;

    /// Effort presented at the output port when it is electrical (volts)
    virtual double output_effort() const { return 0.0; }

    /// Largest output power reachable while the input carries at most input_limit_w
    virtual double output_power_limit(double input_limit_w) const { return input_limit_w; }

    /// Largest power the output can take back while the input accepts at most input_limit_w
    virtual double absorbed_power_limit(double input_limit_w) const {
        return reversible_ ? input_limit_w : 0.0;
    }

    // ========================================================================
    // Metadata
    // ========================================================================

    const std::string& name() const { return name_; }
    Domain input_domain() const { return input_domain_; }
    Domain output_domain() const { return output_domain_; }
    bool reversible() const { return reversible_; }

    /// Mechanical output driven from a non-mechanical input (motor, engine)
    bool is_prime_mover() const {
        return output_domain_ == Domain::Mechanical && input_domain_ != Domain::Mechanical;
    }

    const OperatingPoint& last_operating_point() const { return last_op_; }

protected:
    /// Throws std::logic_error unless the converter is reversible.
    void require_reversible(const char* operation) const;

    /**
     * Solve P_out = eta(P_out) * P_in for efficiency curves that depend on
     * the output power. Converges in a few iterations for smooth maps.
     */
    template<typename EtaFn>
    static double solve_output_power(double power_in_w, EtaFn eta_of_output) {
        double p_out = power_in_w * eta_of_output(power_in_w);
        for (int i = 0; i < 32; ++i) {
            const double next = power_in_w * eta_of_output(p_out);
            if (next == p_out) break;
            p_out = next;
        }
        return p_out;
    }

    OperatingPoint last_op_;

private:
    std::string name_;
    Domain input_domain_;
    Domain output_domain_;
    bool reversible_;
};

} // namespace plant
