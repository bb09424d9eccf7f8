// src/sim/step_record.hpp
#pragma once

#include "plant/causality_resolver.hpp"
#include "plant/quantity.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sim {

// Per-step results. Units are embedded in field names.
// Values are rounded to the simulator's precision when recorded.

struct LinkRecord {
    plant::FlowDirection direction = plant::FlowDirection::Idle;
    double effort = 0.0;    // N·m, V or J/kg
    double flow = 0.0;      // rad/s, A or kg/s
    double power_w = 0.0;
};

struct ConverterRecord {
    plant::FlowDirection direction = plant::FlowDirection::Idle;
    double speed_radps = 0.0;
    double torque_nm = 0.0;
    double power_in_w = 0.0;
    double power_out_w = 0.0;
    double efficiency = 1.0;
    double loss_w = 0.0;
    int gear = -1;
};

struct SourceRecord {
    double level = 0.0;              // J for batteries, kg for tanks
    double fraction = 0.0;           // level / capacity
    double terminal_power_w = 0.0;   // + discharge
    double stored_power_w = 0.0;
    double loss_w = 0.0;
};

/// Component names matching the per-item vectors of a StepRecord.
struct RecordLayout {
    std::vector<std::string> links;        // "from->to"
    std::vector<std::string> converters;
    std::vector<std::string> sources;
};

struct StepRecord {
    std::size_t step = 0;
    double t_s = 0.0;                       // end of the step
    double control_signal = 0.0;

    // --- Motion (end of step)
    double v_mps = 0.0;
    double a_mps2 = 0.0;
    double x_m = 0.0;
    double wheel_speed_radps = 0.0;         // start of step, as resolved

    // --- Wheel torques
    double requested_torque_nm = 0.0;
    double drivetrain_torque_nm = 0.0;
    double brake_torque_nm = 0.0;           // applied by the brakes
    double diverted_torque_nm = 0.0;        // regeneration handed to the brakes
    double load_torque_nm = 0.0;
    double aero_torque_nm = 0.0;
    double rolling_torque_nm = 0.0;
    double grade_torque_nm = 0.0;
    double slope_rad = 0.0;
    double inertia_kgm2 = 0.0;

    // --- Power balance
    double wheel_power_w = 0.0;             // drivetrain torque x wheel speed
    double brake_power_w = 0.0;
    double source_power_w = 0.0;            // rate of change of stored energy, + discharge
    double converter_loss_w = 0.0;
    double source_loss_w = 0.0;
    double balance_error_w = 0.0;           // source - wheel - converter loss - source loss

    // --- Cumulative since the start of the run
    double source_energy_J = 0.0;
    double converter_loss_J = 0.0;
    double source_loss_J = 0.0;
    double brake_loss_J = 0.0;

    std::vector<LinkRecord> links;
    std::vector<ConverterRecord> converters;
    std::vector<SourceRecord> sources;
    std::vector<plant::ReversibilityViolation> violations;

    // ========================================================================
    // VISITOR PATTERN - Field Enumeration for Automation
    // ========================================================================

    /**
     * Accept a visitor that enumerates every scalar field.
     *
     * Per-item fields are prefixed with the component name from `layout`,
     * e.g. "battery.level", "motor.efficiency", "motor->diff.power_w".
     */
    template<typename Visitor>
    void accept_fields(Visitor& visitor, const RecordLayout& layout) const {
        visitor.visit("step", step);
        visitor.visit("t_s", t_s);
        visitor.visit("control_signal", control_signal);

        // === MOTION ===
        visitor.visit("v_mps", v_mps);
        visitor.visit("a_mps2", a_mps2);
        visitor.visit("x_m", x_m);
        visitor.visit("wheel_speed_radps", wheel_speed_radps);

        // === WHEEL TORQUES ===
        visitor.visit("requested_torque_nm", requested_torque_nm);
        visitor.visit("drivetrain_torque_nm", drivetrain_torque_nm);
        visitor.visit("brake_torque_nm", brake_torque_nm);
        visitor.visit("diverted_torque_nm", diverted_torque_nm);
        visitor.visit("load_torque_nm", load_torque_nm);
        visitor.visit("aero_torque_nm", aero_torque_nm);
        visitor.visit("rolling_torque_nm", rolling_torque_nm);
        visitor.visit("grade_torque_nm", grade_torque_nm);
        visitor.visit("slope_rad", slope_rad);
        visitor.visit("inertia_kgm2", inertia_kgm2);

        // === POWER BALANCE ===
        visitor.visit("wheel_power_w", wheel_power_w);
        visitor.visit("brake_power_w", brake_power_w);
        visitor.visit("source_power_w", source_power_w);
        visitor.visit("converter_loss_w", converter_loss_w);
        visitor.visit("source_loss_w", source_loss_w);
        visitor.visit("balance_error_w", balance_error_w);
        visitor.visit("source_energy_J", source_energy_J);
        visitor.visit("converter_loss_J", converter_loss_J);
        visitor.visit("source_loss_J", source_loss_J);
        visitor.visit("brake_loss_J", brake_loss_J);
        visitor.visit("violations", violations.size());

        // === LINKS ===
        for (std::size_t i = 0; i < links.size() && i < layout.links.size(); ++i) {
            const std::string& p = layout.links[i];
            visitor.visit(p + ".direction", static_cast<int>(links[i].direction));
            visitor.visit(p + ".effort", links[i].effort);
            visitor.visit(p + ".flow", links[i].flow);
            visitor.visit(p + ".power_w", links[i].power_w);
        }

        // === CONVERTERS ===
        for (std::size_t i = 0; i < converters.size() && i < layout.converters.size(); ++i) {
            const std::string& p = layout.converters[i];
            const ConverterRecord& c = converters[i];
            visitor.visit(p + ".direction", static_cast<int>(c.direction));
            visitor.visit(p + ".speed_radps", c.speed_radps);
            visitor.visit(p + ".torque_nm", c.torque_nm);
            visitor.visit(p + ".power_in_w", c.power_in_w);
            visitor.visit(p + ".power_out_w", c.power_out_w);
            visitor.visit(p + ".efficiency", c.efficiency);
            visitor.visit(p + ".loss_w", c.loss_w);
            visitor.visit(p + ".gear", c.gear);
        }

        // === SOURCES ===
        for (std::size_t i = 0; i < sources.size() && i < layout.sources.size(); ++i) {
            const std::string& p = layout.sources[i];
            visitor.visit(p + ".level", sources[i].level);
            visitor.visit(p + ".fraction", sources[i].fraction);
            visitor.visit(p + ".terminal_power_w", sources[i].terminal_power_w);
            visitor.visit(p + ".stored_power_w", sources[i].stored_power_w);
            visitor.visit(p + ".loss_w", sources[i].loss_w);
        }
    }
};

} // namespace sim
