// src/plant/electric_motor.cpp
#include "plant/electric_motor.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace plant {

namespace {
// Slack on envelope checks so a torque saturated by the resolver is never rejected
constexpr double kEnvelopeSlack = 1e-9;
}

ElectricMotor::ElectricMotor(std::string name,
                             ElectricMotorParams p,
                             EfficiencyMap drive_efficiency,
                             EfficiencyMap regen_efficiency)
    : Converter(std::move(name), Domain::Electrical, Domain::Mechanical, p.reversible),
      p_(p),
      drive_eff_(drive_efficiency),
      regen_eff_(regen_efficiency) {
    if (p_.max_power_w <= 0.0 || p_.max_torque_nm <= 0.0) {
        throw std::invalid_argument(this->name() + ": max power and torque must be > 0");
    }
    if (p_.max_regen_torque_nm < 0.0 || p_.max_regen_power_w < 0.0) {
        throw std::invalid_argument(this->name() + ": regen limits must be >= 0");
    }
    if (p_.rotor_inertia_kgm2 < 0.0) {
        throw std::invalid_argument(this->name() + ": rotor inertia must be >= 0");
    }
    power_curve_ = MaxPowerCurve::electric(p_.base_speed_rpm, p_.max_speed_rpm, p_.max_power_w);

    LOG_DEBUG("[%s] Motor: %.1f kW, %.1f Nm, base %.0f rpm, max %.0f rpm, %s",
              this->name().c_str(), p_.max_power_w / 1000.0, p_.max_torque_nm,
              p_.base_speed_rpm, p_.max_speed_rpm, p_.reversible ? "reversible" : "motoring only");
}

double ElectricMotor::drive_eta(double speed_radps, double shaft_power_w) const {
    return drive_eff_.evaluate(utils::radps_to_rpm(speed_radps), shaft_power_w);
}

double ElectricMotor::regen_eta(double speed_radps, double shaft_power_w) const {
    return regen_eff_.evaluate(utils::radps_to_rpm(speed_radps), shaft_power_w);
}

void ElectricMotor::check_speed(double output_speed_radps, const ConverterCommand& cmd) const {
    (void)cmd;
    const double rpm = std::abs(utils::radps_to_rpm(output_speed_radps));
    if (rpm > p_.max_speed_rpm) {
        throw OperatingPointOutOfRange(name(), "shaft speed " + std::to_string(rpm) +
                                       " rpm exceeds " + std::to_string(p_.max_speed_rpm) + " rpm");
    }
}

double ElectricMotor::max_drive_torque(double speed_radps, const ConverterCommand& cmd) const {
    const double scale = std::clamp(cmd.limit_scale, 0.0, 1.0);
    const double curve = power_curve_.max_torque(utils::radps_to_rpm(speed_radps));
    return std::min(p_.max_torque_nm, curve) * scale;
}

double ElectricMotor::max_regen_torque(double speed_radps, const ConverterCommand& cmd) const {
    (void)cmd;
    if (!reversible()) return 0.0;

    double torque = p_.max_regen_torque_nm;
    const double w = std::abs(speed_radps);
    if (w > 0.0) {
        torque = std::min(torque, p_.max_regen_power_w / w);
    }
    return torque;
}

// ============================================================================
// Transforms
// ============================================================================

Quantity ElectricMotor::forward(const Quantity& input, const ConverterCommand& cmd) {
    const double w = cmd.shaft_speed_radps;
    const double p_elec = input.power();
    if (p_elec < 0.0) {
        throw std::logic_error(name() + ": forward() with negative electrical power, use backward()");
    }

    const double p_mech = solve_output_power(p_elec, [&](double p_out) { return drive_eta(w, p_out); });
    const double torque = (w != 0.0) ? p_mech / w : 0.0;

    if (std::abs(torque) > max_drive_torque(w, cmd) * (1.0 + kEnvelopeSlack)) {
        throw OperatingPointOutOfRange(name(), "torque " + std::to_string(torque) +
                                       " Nm outside drive envelope at " +
                                       std::to_string(utils::radps_to_rpm(w)) + " rpm");
    }

    const Quantity out = Quantity::mechanical(torque, w);
    last_op_.direction = (p_elec > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle;
    last_op_.speed_radps = w;
    last_op_.torque_nm = torque;
    last_op_.power_in_w = p_elec;
    last_op_.power_out_w = out.power();
    last_op_.efficiency = drive_eta(w, p_mech);
    last_op_.gear = -1;
    return out;
}

Quantity ElectricMotor::required_input(const Quantity& output, const ConverterCommand& cmd) {
    const double w = output.speed();
    const double torque = output.torque();
    const double p_mech = output.power();
    if (p_mech < 0.0) {
        throw std::logic_error(name() + ": required_input() with negative shaft power, use backward()");
    }
    if (std::abs(torque) > max_drive_torque(w, cmd) * (1.0 + kEnvelopeSlack)) {
        throw OperatingPointOutOfRange(name(), "torque " + std::to_string(torque) +
                                       " Nm outside drive envelope at " +
                                       std::to_string(utils::radps_to_rpm(w)) + " rpm");
    }

    const double eta = drive_eta(w, p_mech);
    const double p_elec = p_mech / eta;

    last_op_.direction = (p_mech > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle;
    last_op_.speed_radps = w;
    last_op_.torque_nm = torque;
    last_op_.power_in_w = p_elec;
    last_op_.power_out_w = p_mech;
    last_op_.efficiency = eta;
    last_op_.gear = -1;

    return Quantity::from_power(Domain::Electrical, cmd.input_effort, p_elec);
}

Quantity ElectricMotor::backward(const Quantity& input, const ConverterCommand& cmd) {
    require_reversible("backward");

    const double w = input.speed();
    const double torque = input.torque();
    if (std::abs(torque) > max_regen_torque(w, cmd) * (1.0 + kEnvelopeSlack)) {
        throw OperatingPointOutOfRange(name(), "regen torque " + std::to_string(torque) +
                                       " Nm outside generator envelope at " +
                                       std::to_string(utils::radps_to_rpm(w)) + " rpm");
    }

    const double p_mech = input.power();
    const double eta = regen_eta(w, std::abs(p_mech));
    const double p_elec = p_mech * eta;

    last_op_.direction = (p_mech != 0.0) ? FlowDirection::Regenerate : FlowDirection::Idle;
    last_op_.speed_radps = w;
    last_op_.torque_nm = torque;
    last_op_.power_in_w = std::abs(p_mech);
    last_op_.power_out_w = std::abs(p_elec);
    last_op_.efficiency = eta;
    last_op_.gear = -1;

    return Quantity::from_power(Domain::Electrical, cmd.input_effort, p_elec);
}

} // namespace plant
