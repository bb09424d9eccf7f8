// src/plant/causality_resolver.hpp
#pragma once

#include "plant/converter.hpp"
#include "plant/drive_train.hpp"
#include "plant/ecu.hpp"
#include "plant/quantity.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace plant {

class Vehicle;

/// Resolved flow over one link for the current step.
struct LinkFlow {
    FlowDirection direction = FlowDirection::Idle;
    Quantity quantity;
};

/**
 * ReversibilityViolation - regeneration reached a converter that cannot run
 * backward. Not an error: the power is handed to the brakes.
 */
struct ReversibilityViolation {
    std::string component;
    double diverted_power_w = 0.0;
};

/// Everything the resolver decided for one step.
struct Resolution {
    double wheel_speed_radps = 0.0;
    double requested_torque_nm = 0.0;      // ECU wheel torque request
    double drivetrain_torque_nm = 0.0;     // what the drivetrain actually delivers
    double diverted_brake_torque_nm = 0.0; // curtailed regeneration handed to the brakes
    double reflected_inertia_kgm2 = 0.0;   // converter inertia seen at the wheel

    std::vector<LinkFlow> links;           // by LinkId
    std::vector<OperatingPoint> converters;// by converter index
    std::vector<double> source_demand_w;   // by source index, positive = discharge
    std::vector<ReversibilityViolation> violations;

    double wheel_power_w() const { return drivetrain_torque_nm * wheel_speed_radps; }
};

/**
 * CausalityResolver - decides who drives whom for one step
 *
 * Walks from the body toward the sources in five passes:
 *
 *   1. speed:    wheel speed propagated up each mechanical branch through
 *                the (commanded) ratios; converter speed domains checked;
 *                inertia reflected to the wheel.
 *   2. demand:   wheel torque request split over the axle branches by
 *                weight and mapped up to each prime mover (required_input
 *                for traction, backward for regeneration).
 *   3. arbitrate: traction saturated to the prime mover's capability;
 *                regeneration limited to its rating and scaled by the share
 *                of its supply tree that can absorb power. Either is then
 *                held to the discharge/charge power limits of the sources
 *                feeding the prime mover.
 *   4. deliver:  actual torque pushed from each prime mover down to the
 *                wheel; curtailed regeneration becomes brake torque.
 *   5. supply:   prime mover input power walked up through fuel cells and
 *                junctions to a signed demand per source.
 *
 * Flow direction is the sign of power at the wheel boundary. At zero
 * speed a non-zero torque counts as discharge.
 *
 * The branch plan is computed once from the frozen topology.
 */
class CausalityResolver {
public:
    /// @throws ConnectivityError if a wheel branch does not end in a prime mover
    explicit CausalityResolver(Vehicle& vehicle);

    /**
     * Resolve one step.
     *
     * @param cmd               ECU commands; cmd.converters may be empty
     * @param wheel_speed_radps wheel speed at the start of the step
     *
     * @throws OperatingPointOutOfRange from any converter outside its domain
     * @throws ControllerError if the command set does not match the drivetrain
     */
    Resolution resolve(const CommandSet& cmd, double wheel_speed_radps);

private:
    /// One axle branch: body link plus the mechanical chain up to its prime mover.
    struct Branch {
        LinkId wheel_link = kNoLink;
        std::vector<NodeId> chain;   // converter nodes, wheel side first, prime mover last
    };

    struct BranchState {
        FlowDirection direction = FlowDirection::Idle;
        double requested_torque_nm = 0.0;
        double prime_speed_radps = 0.0;
        Quantity prime_demand;   // at the prime mover shaft
        Quantity prime_actual;
        double absorbable = 1.0;
    };

    void speed_pass(const Branch& b, double wheel_speed_radps, Resolution& out);
    void demand_pass(const Branch& b, BranchState& st, double branch_torque_nm, double wheel_speed_radps);
    void arbitrate(const Branch& b, BranchState& st, Resolution& out);
    void deliver(const Branch& b, BranchState& st, Resolution& out);
    void supply_prime(const Branch& b, const BranchState& st, Resolution& out);
    void supply(NodeId node, const Quantity& at_output, Resolution& out);

    double absorbable_fraction(NodeId node) const;
    double discharge_limit_w(NodeId node) const;
    double charge_limit_w(NodeId node) const;
    double fit_to_supply(Converter& pm, ConverterCommand& cc, NodeId supply_node, double torque_nm,
                         double speed_radps, bool regenerating);
    void record_blocked(NodeId node, double share, double power_w, Resolution& out) const;
    double supply_effort(NodeId node) const;
    void set_link(LinkId id, const Quantity& q, Resolution& out) const;

    Converter& converter_at(NodeId node);
    ConverterCommand& command_at(NodeId node);

    Vehicle& vehicle_;
    DriveTrain& dt_;
    std::vector<Branch> branches_;
    std::vector<ConverterCommand> commands_;
};

/// Direction of a resolved quantity; non-zero torque at standstill counts as discharge.
FlowDirection direction_of(const Quantity& q);

} // namespace plant
