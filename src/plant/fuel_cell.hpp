// src/plant/fuel_cell.hpp
#pragma once

#include "plant/converter.hpp"
#include "plant/efficiency_map.hpp"

namespace plant {

struct FuelCellParams {
    double max_power_w = 80000.0;      // electrical output
    double min_power_w = 0.0;          // lowest stable output while running
    double nominal_voltage_v = 350.0;
};

/**
 * FuelCell - chemical -> electrical, not reversible. Efficiency depends on output power.
 *
 * The stack is either off (zero output) or running between min_power_w
 * and max_power_w; any other demand is OperatingPointOutOfRange.
 */
class FuelCell : public Converter {
public:
    FuelCell(std::string name, FuelCellParams p, EfficiencyMap efficiency);

    Quantity forward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity required_input(const Quantity& output, const ConverterCommand& cmd) override;

    double output_effort() const override { return p_.nominal_voltage_v; }
    double output_power_limit(double input_limit_w) const override;

    const FuelCellParams& params() const { return p_; }

private:
    void check_power(double output_power_w) const;

    FuelCellParams p_;
    EfficiencyMap eff_;
};

} // namespace plant
