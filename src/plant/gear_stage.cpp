// src/plant/gear_stage.cpp
#include "plant/gear_stage.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace plant {

GearStage::GearStage(std::string name, GearStageParams p)
    : Converter(std::move(name), Domain::Mechanical, Domain::Mechanical, true),
      p_(std::move(p)) {
    if (p_.ratios.empty()) {
        throw std::invalid_argument(this->name() + ": at least one ratio is required");
    }
    for (double r : p_.ratios) {
        if (!(r > 0.0) || !std::isfinite(r)) {
            throw std::invalid_argument(this->name() + ": ratios must be > 0");
        }
    }
    if (p_.initial_gear < 0 || static_cast<std::size_t>(p_.initial_gear) >= p_.ratios.size()) {
        throw std::invalid_argument(this->name() + ": initial gear out of range");
    }
    if (!(p_.efficiency_forward > 0.0 && p_.efficiency_forward <= 1.0) ||
        !(p_.efficiency_backward > 0.0 && p_.efficiency_backward <= 1.0)) {
        throw std::invalid_argument(this->name() + ": efficiencies must be in (0, 1]");
    }
    if (p_.inertia_kgm2 < 0.0) {
        throw std::invalid_argument(this->name() + ": inertia must be >= 0");
    }
    gear_ = p_.initial_gear;
}

void GearStage::apply_command(const ConverterCommand& cmd) {
    if (cmd.gear < 0 || cmd.gear == gear_) return;

    if (static_cast<std::size_t>(cmd.gear) >= p_.ratios.size()) {
        throw OperatingPointOutOfRange(name(), "gear " + std::to_string(cmd.gear) +
                                       " not in [0, " + std::to_string(p_.ratios.size() - 1) + "]");
    }
    LOG_DEBUG("[%s] Gear %d -> %d (ratio %.3f)", name().c_str(), gear_, cmd.gear,
              p_.ratios[static_cast<std::size_t>(cmd.gear)]);
    gear_ = cmd.gear;
}

void GearStage::check_speed(double output_speed_radps, const ConverterCommand& cmd) const {
    (void)cmd;
    if (p_.max_input_speed_rpm <= 0.0) return;

    const double rpm_in = std::abs(utils::radps_to_rpm(output_speed_radps * speed_ratio()));
    if (rpm_in > p_.max_input_speed_rpm) {
        throw OperatingPointOutOfRange(name(), "input speed " + std::to_string(rpm_in) +
                                       " rpm exceeds " + std::to_string(p_.max_input_speed_rpm) + " rpm");
    }
}

void GearStage::check_torque(double input_torque_nm) const {
    if (p_.max_input_torque_nm > 0.0 && std::abs(input_torque_nm) > p_.max_input_torque_nm) {
        throw OperatingPointOutOfRange(name(), "input torque " + std::to_string(input_torque_nm) +
                                       " Nm exceeds " + std::to_string(p_.max_input_torque_nm) + " Nm");
    }
}

void GearStage::record(FlowDirection dir, const Quantity& from, const Quantity& to) {
    // `from` is the side power enters, `to` the side it leaves
    const Quantity& in_shaft = (dir == FlowDirection::Regenerate) ? to : from;
    last_op_.direction = dir;
    last_op_.speed_radps = in_shaft.speed();
    last_op_.torque_nm = in_shaft.torque();
    last_op_.power_in_w = std::abs(from.power());
    last_op_.power_out_w = std::abs(to.power());
    last_op_.efficiency = (dir == FlowDirection::Regenerate) ? p_.efficiency_backward
                                                             : p_.efficiency_forward;
    last_op_.gear = gear_;
    if (from.power() == 0.0) last_op_.direction = FlowDirection::Idle;
}

// ============================================================================
// Transforms
// ============================================================================

Quantity GearStage::forward(const Quantity& input, const ConverterCommand& cmd) {
    (void)cmd;
    check_torque(input.torque());

    const double n = speed_ratio();
    const Quantity out = Quantity::mechanical(input.torque() * n * p_.efficiency_forward,
                                              input.speed() / n);
    record(FlowDirection::Discharge, input, out);
    return out;
}

Quantity GearStage::required_input(const Quantity& output, const ConverterCommand& cmd) {
    (void)cmd;
    const double n = speed_ratio();
    const Quantity in = Quantity::mechanical(output.torque() / (n * p_.efficiency_forward),
                                             output.speed() * n);
    record(FlowDirection::Discharge, in, output);
    return in;
}

Quantity GearStage::backward(const Quantity& input, const ConverterCommand& cmd) {
    (void)cmd;
    const double n = speed_ratio();
    const Quantity out = Quantity::mechanical(input.torque() * p_.efficiency_backward / n,
                                              input.speed() * n);
    record(FlowDirection::Regenerate, input, out);
    return out;
}

Quantity GearStage::required_output(const Quantity& input, const ConverterCommand& cmd) {
    (void)cmd;
    check_torque(input.torque());

    const double n = speed_ratio();
    const Quantity out = Quantity::mechanical(input.torque() * n / p_.efficiency_backward,
                                              input.speed() / n);
    record(FlowDirection::Regenerate, out, input);
    return out;
}

} // namespace plant
