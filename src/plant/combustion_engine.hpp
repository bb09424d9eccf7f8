// src/plant/combustion_engine.hpp
#pragma once

#include "plant/converter.hpp"
#include "plant/efficiency_map.hpp"

namespace plant {

struct CombustionEngineParams {
    double idle_speed_rpm = 800.0;
    double peak_speed_rpm = 4500.0;
    double max_speed_rpm = 6500.0;
    double idle_power_w = 10000.0;
    double peak_power_w = 110000.0;
    double max_speed_power_w = 90000.0;
    double inertia_kgm2 = 0.15;
};

/**
 * CombustionEngine - chemical -> mechanical prime mover
 *
 * Not reversible. The engine never turns slower than idle: below idle the
 * shaft is driven through a slipping clutch and the slip power is counted
 * as converter loss. Negative shaft speed is outside the domain.
 */
class CombustionEngine : public Converter {
public:
    CombustionEngine(std::string name, CombustionEngineParams p, EfficiencyMap efficiency);

    Quantity forward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity required_input(const Quantity& output, const ConverterCommand& cmd) override;

    void check_speed(double output_speed_radps, const ConverterCommand& cmd) const override;
    double inertia_kgm2() const override { return p_.inertia_kgm2; }
    double max_drive_torque(double speed_radps, const ConverterCommand& cmd) const override;

    const CombustionEngineParams& params() const { return p_; }

private:
    double engine_speed(double shaft_speed_radps) const;
    double eta(double engine_speed_radps, double engine_power_w) const;

    CombustionEngineParams p_;
    EfficiencyMap eff_;
    MaxPowerCurve power_curve_;
};

} // namespace plant
