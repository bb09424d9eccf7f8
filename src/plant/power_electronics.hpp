// src/plant/power_electronics.hpp
#pragma once

#include "plant/converter.hpp"
#include "plant/efficiency_map.hpp"

namespace plant {

struct PowerElectronicsParams {
    double max_power_w = 150000.0;      // rating, checked on the high-power port
    double output_voltage_v = 400.0;    // regulated output bus
    bool reversible = true;
};

/**
 * PowerElectronics - electrical -> electrical stage (DC-DC converter, inverter)
 *
 * Sits between a battery or fuel cell and the bus feeding the motors.
 * Presents a regulated voltage on its output and loses power according
 * to separate maps for each direction, evaluated on the output power.
 * Demands above the rating are OperatingPointOutOfRange.
 */
class PowerElectronics : public Converter {
public:
    PowerElectronics(std::string name,
                     PowerElectronicsParams p,
                     EfficiencyMap drive_efficiency,
                     EfficiencyMap regen_efficiency);

    Quantity forward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity backward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity required_input(const Quantity& output, const ConverterCommand& cmd) override;

    double output_effort() const override { return p_.output_voltage_v; }
    double output_power_limit(double input_limit_w) const override;
    double absorbed_power_limit(double input_limit_w) const override;

    const PowerElectronicsParams& params() const { return p_; }

private:
    void check_power(double power_w) const;
    void record(FlowDirection dir, double p_in_w, double p_out_w, double eta);

    PowerElectronicsParams p_;
    EfficiencyMap drive_eff_;
    EfficiencyMap regen_eff_;
};

} // namespace plant
