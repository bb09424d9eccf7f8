// src/plant/fuel_cell.cpp
#include "plant/fuel_cell.hpp"
#include "plant/sim_errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace plant {

FuelCell::FuelCell(std::string name, FuelCellParams p, EfficiencyMap efficiency)
    : Converter(std::move(name), Domain::Chemical, Domain::Electrical, false),
      p_(p),
      eff_(efficiency) {
    if (p_.max_power_w <= 0.0 || p_.nominal_voltage_v <= 0.0) {
        throw std::invalid_argument(this->name() + ": max power and voltage must be > 0");
    }
    if (p_.min_power_w < 0.0 || p_.min_power_w >= p_.max_power_w) {
        throw std::invalid_argument(this->name() + ": min power must be in [0, max power)");
    }
}

void FuelCell::check_power(double output_power_w) const {
    if (output_power_w < 0.0) {
        throw OperatingPointOutOfRange(name(), "negative output power " + std::to_string(output_power_w) + " W");
    }
    if (output_power_w > 0.0 && output_power_w < p_.min_power_w * (1.0 - 1e-9)) {
        throw OperatingPointOutOfRange(name(), "output power " + std::to_string(output_power_w) +
                                       " W below the " + std::to_string(p_.min_power_w) + " W minimum");
    }
    if (output_power_w > p_.max_power_w * (1.0 + 1e-9)) {
        throw OperatingPointOutOfRange(name(), "output power " + std::to_string(output_power_w) +
                                       " W exceeds " + std::to_string(p_.max_power_w) + " W");
    }
}

double FuelCell::output_power_limit(double input_limit_w) const {
    if (!std::isfinite(input_limit_w)) return input_limit_w;
    return solve_output_power(input_limit_w, [&](double p) { return eff_.evaluate(0.0, p); });
}

Quantity FuelCell::forward(const Quantity& input, const ConverterCommand& cmd) {
    (void)cmd;
    const double p_in = input.power();
    const double p_out = solve_output_power(p_in, [&](double p) { return eff_.evaluate(0.0, p); });
    check_power(p_out);

    last_op_.direction = (p_in > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle;
    last_op_.speed_radps = 0.0;
    last_op_.torque_nm = 0.0;
    last_op_.power_in_w = p_in;
    last_op_.power_out_w = p_out;
    last_op_.efficiency = eff_.evaluate(0.0, p_out);
    last_op_.gear = -1;

    return Quantity::from_power(Domain::Electrical, p_.nominal_voltage_v, p_out);
}

Quantity FuelCell::required_input(const Quantity& output, const ConverterCommand& cmd) {
    const double p_out = output.power();
    check_power(p_out);

    const double eta = eff_.evaluate(0.0, p_out);
    const double p_in = p_out / eta;

    last_op_.direction = (p_out > 0.0) ? FlowDirection::Discharge : FlowDirection::Idle;
    last_op_.speed_radps = 0.0;
    last_op_.torque_nm = 0.0;
    last_op_.power_in_w = p_in;
    last_op_.power_out_w = p_out;
    last_op_.efficiency = eta;
    last_op_.gear = -1;

    return Quantity::from_power(Domain::Chemical, cmd.input_effort, p_in);
}

} // namespace plant
