// src/plant/power_electronics.cpp
#include "plant/power_electronics.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace plant {

PowerElectronics::PowerElectronics(std::string name,
                                   PowerElectronicsParams p,
                                   EfficiencyMap drive_efficiency,
                                   EfficiencyMap regen_efficiency)
    : Converter(std::move(name), Domain::Electrical, Domain::Electrical, p.reversible),
      p_(p),
      drive_eff_(drive_efficiency),
      regen_eff_(regen_efficiency) {
    if (p_.max_power_w <= 0.0 || p_.output_voltage_v <= 0.0) {
        throw std::invalid_argument(this->name() + ": max power and output voltage must be > 0");
    }

    LOG_DEBUG("[%s] Power electronics: %.1f kW, %.0f V out, %s", this->name().c_str(),
              p_.max_power_w / 1000.0, p_.output_voltage_v,
              p_.reversible ? "bidirectional" : "unidirectional");
}

void PowerElectronics::check_power(double power_w) const {
    if (power_w > p_.max_power_w * (1.0 + 1e-9)) {
        throw OperatingPointOutOfRange(name(), "power " + std::to_string(power_w) +
                                       " W exceeds " + std::to_string(p_.max_power_w) + " W");
    }
}

void PowerElectronics::record(FlowDirection dir, double p_in_w, double p_out_w, double eta) {
    last_op_.direction = dir;
    last_op_.speed_radps = 0.0;
    last_op_.torque_nm = 0.0;
    last_op_.power_in_w = p_in_w;
    last_op_.power_out_w = p_out_w;
    last_op_.efficiency = eta;
    last_op_.gear = -1;
}

Quantity PowerElectronics::forward(const Quantity& input, const ConverterCommand& cmd) {
    (void)cmd;
    const double p_in = input.power();
    if (p_in < 0.0) {
        throw std::logic_error(name() + ": forward() with negative power, use backward()");
    }
    check_power(p_in);

    const double p_out = solve_output_power(p_in, [&](double p) { return drive_eff_.evaluate(0.0, p); });
    record((p_in > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle, p_in, p_out,
           drive_eff_.evaluate(0.0, p_out));
    return Quantity::from_power(Domain::Electrical, p_.output_voltage_v, p_out);
}

Quantity PowerElectronics::required_input(const Quantity& output, const ConverterCommand& cmd) {
    const double p_out = output.power();
    if (p_out < 0.0) {
        throw std::logic_error(name() + ": required_input() with negative power, use backward()");
    }

    const double eta = drive_eff_.evaluate(0.0, p_out);
    const double p_in = p_out / eta;
    check_power(p_in);

    record((p_out > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle, p_in, p_out, eta);
    return Quantity::from_power(Domain::Electrical, cmd.input_effort, p_in);
}

Quantity PowerElectronics::backward(const Quantity& input, const ConverterCommand& cmd) {
    require_reversible("backward");

    // `input` is what arrives at the output port; power is negative while charging
    const double p_back = input.power();
    check_power(std::abs(p_back));

    const double eta = regen_eff_.evaluate(0.0, std::abs(p_back));
    const double p_in = p_back * eta;

    record((p_back != 0.0) ? FlowDirection::Regenerate : FlowDirection::Idle,
           std::abs(p_back), std::abs(p_in), eta);
    return Quantity::from_power(Domain::Electrical, cmd.input_effort, p_in);
}

double PowerElectronics::output_power_limit(double input_limit_w) const {
    if (!std::isfinite(input_limit_w)) return input_limit_w;
    return solve_output_power(input_limit_w, [&](double p) { return drive_eff_.evaluate(0.0, p); });
}

double PowerElectronics::absorbed_power_limit(double input_limit_w) const {
    if (!reversible()) return 0.0;
    if (!std::isfinite(input_limit_w)) return input_limit_w;

    // Largest |P_out| with |P_out| * eta(|P_out|) <= input limit
    double p = input_limit_w / regen_eff_.evaluate(0.0, input_limit_w);
    for (int i = 0; i < 32; ++i) {
        const double next = input_limit_w / regen_eff_.evaluate(0.0, p);
        if (next == p) break;
        p = next;
    }
    return p;
}

} // namespace plant
