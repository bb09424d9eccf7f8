// src/plant/electric_motor.hpp
#pragma once

#include "plant/converter.hpp"
#include "plant/efficiency_map.hpp"

namespace plant {

/**
 * Electric motor parameters
 *
 * Power envelope rises linearly to base speed and is flat above it
 * (constant-torque / constant-power regions).
 */
struct ElectricMotorParams {
    double max_power_w = 150000.0;
    double max_torque_nm = 350.0;
    double base_speed_rpm = 4000.0;
    double max_speed_rpm = 12000.0;
    double max_regen_torque_nm = 250.0;
    double max_regen_power_w = 60000.0;
    double rotor_inertia_kgm2 = 0.05;
    bool reversible = true;
};

/**
 * ElectricMotor - electrical -> mechanical prime mover
 *
 * Efficiency is evaluated on the mechanical operating point (shaft speed,
 * shaft power) with separate maps for motoring and generating. When
 * reversible it acts as a generator in backward().
 */
class ElectricMotor : public Converter {
public:
    ElectricMotor(std::string name,
                  ElectricMotorParams p,
                  EfficiencyMap drive_efficiency,
                  EfficiencyMap regen_efficiency);

    Quantity forward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity backward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity required_input(const Quantity& output, const ConverterCommand& cmd) override;

    void check_speed(double output_speed_radps, const ConverterCommand& cmd) const override;
    double inertia_kgm2() const override { return p_.rotor_inertia_kgm2; }
    double max_drive_torque(double speed_radps, const ConverterCommand& cmd) const override;
    double max_regen_torque(double speed_radps, const ConverterCommand& cmd) const override;

    const ElectricMotorParams& params() const { return p_; }

private:
    double drive_eta(double speed_radps, double shaft_power_w) const;
    double regen_eta(double speed_radps, double shaft_power_w) const;

    ElectricMotorParams p_;
    EfficiencyMap drive_eff_;
    EfficiencyMap regen_eff_;
    MaxPowerCurve power_curve_;
};

} // namespace plant
