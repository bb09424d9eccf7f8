// src/plant/combustion_engine.cpp
#include "plant/combustion_engine.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace plant {

CombustionEngine::CombustionEngine(std::string name, CombustionEngineParams p, EfficiencyMap efficiency)
    : Converter(std::move(name), Domain::Chemical, Domain::Mechanical, false),
      p_(p),
      eff_(efficiency) {
    if (p_.inertia_kgm2 < 0.0) {
        throw std::invalid_argument(this->name() + ": inertia must be >= 0");
    }
    power_curve_ = MaxPowerCurve::combustion(PowerPoint{p_.idle_speed_rpm, p_.idle_power_w},
                                             PowerPoint{p_.peak_speed_rpm, p_.peak_power_w},
                                             PowerPoint{p_.max_speed_rpm, p_.max_speed_power_w});

    LOG_DEBUG("[%s] Engine: peak %.1f kW @ %.0f rpm, idle %.0f rpm",
              this->name().c_str(), p_.peak_power_w / 1000.0, p_.peak_speed_rpm, p_.idle_speed_rpm);
}

double CombustionEngine::engine_speed(double shaft_speed_radps) const {
    return std::max(shaft_speed_radps, utils::rpm_to_radps(p_.idle_speed_rpm));
}

double CombustionEngine::eta(double engine_speed_radps, double engine_power_w) const {
    return eff_.evaluate(utils::radps_to_rpm(engine_speed_radps), engine_power_w);
}

void CombustionEngine::check_speed(double output_speed_radps, const ConverterCommand& cmd) const {
    (void)cmd;
    if (output_speed_radps < 0.0) {
        throw OperatingPointOutOfRange(name(), "negative shaft speed " +
                                       std::to_string(output_speed_radps) + " rad/s");
    }
    const double rpm = utils::radps_to_rpm(output_speed_radps);
    if (rpm > p_.max_speed_rpm) {
        throw OperatingPointOutOfRange(name(), "shaft speed " + std::to_string(rpm) +
                                       " rpm exceeds " + std::to_string(p_.max_speed_rpm) + " rpm");
    }
}

double CombustionEngine::max_drive_torque(double speed_radps, const ConverterCommand& cmd) const {
    const double scale = std::clamp(cmd.limit_scale, 0.0, 1.0);
    const double w_e = engine_speed(speed_radps);
    return power_curve_.evaluate(utils::radps_to_rpm(w_e)) / w_e * scale;
}

Quantity CombustionEngine::forward(const Quantity& input, const ConverterCommand& cmd) {
    const double w = cmd.shaft_speed_radps;
    check_speed(w, cmd);

    const double p_chem = input.power();
    if (p_chem < 0.0) {
        throw OperatingPointOutOfRange(name(), "negative fuel power");
    }

    const double w_e = engine_speed(w);
    const double p_engine = solve_output_power(p_chem, [&](double p_out) { return eta(w_e, p_out); });
    const double torque = p_engine / w_e;
    if (torque > max_drive_torque(w, cmd) * (1.0 + 1e-9)) {
        throw OperatingPointOutOfRange(name(), "torque " + std::to_string(torque) +
                                       " Nm above full-load curve");
    }

    const Quantity out = Quantity::mechanical(torque, w);
    last_op_.direction = (p_chem > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle;
    last_op_.speed_radps = w;
    last_op_.torque_nm = torque;
    last_op_.power_in_w = p_chem;
    last_op_.power_out_w = out.power();
    last_op_.efficiency = eta(w_e, p_engine);
    last_op_.gear = -1;
    return out;
}

Quantity CombustionEngine::required_input(const Quantity& output, const ConverterCommand& cmd) {
    const double w = output.speed();
    const double torque = output.torque();
    check_speed(w, cmd);

    if (torque < 0.0) {
        throw OperatingPointOutOfRange(name(), "negative torque " + std::to_string(torque) +
                                       " Nm requested from a non-reversible engine");
    }
    if (torque > max_drive_torque(w, cmd) * (1.0 + 1e-9)) {
        throw OperatingPointOutOfRange(name(), "torque " + std::to_string(torque) +
                                       " Nm above full-load curve");
    }

    const double w_e = engine_speed(w);
    const double p_engine = torque * w_e;
    const double e = eta(w_e, p_engine);
    const double p_chem = p_engine / e;

    last_op_.direction = (torque > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle;
    last_op_.speed_radps = w;
    last_op_.torque_nm = torque;
    last_op_.power_in_w = p_chem;
    last_op_.power_out_w = torque * w;
    last_op_.efficiency = e;
    last_op_.gear = -1;

    return Quantity::from_power(Domain::Chemical, cmd.input_effort, p_chem);
}

} // namespace plant
