// src/plant/gear_stage.hpp
#pragma once

#include "plant/converter.hpp"
#include <vector>

namespace plant {

/**
 * Gear stage parameters
 *
 * Ratios are reductions N = w_in / w_out, so a stage maps
 * (torque, w) -> (torque * N * eta, w / N).
 */
struct GearStageParams {
    std::vector<double> ratios{9.0};    // one entry = fixed ratio (differential)
    int initial_gear = 0;
    double efficiency_forward = 0.97;   // input -> output
    double efficiency_backward = 0.95;  // output -> input (regeneration)
    double inertia_kgm2 = 0.02;         // referred to the input shaft
    double max_input_speed_rpm = 0.0;   // 0 = unlimited
    double max_input_torque_nm = 0.0;   // 0 = unlimited
};

/**
 * GearStage - mechanical -> mechanical reduction (gearbox or differential)
 *
 * Always reversible. Gearboxes take their gear from the ECU through
 * ConverterCommand::gear; a differential is a stage with a single ratio.
 */
class GearStage : public Converter {
public:
    GearStage(std::string name, GearStageParams p);

    Quantity forward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity backward(const Quantity& input, const ConverterCommand& cmd) override;
    Quantity required_input(const Quantity& output, const ConverterCommand& cmd) override;
    Quantity required_output(const Quantity& input, const ConverterCommand& cmd) override;

    void apply_command(const ConverterCommand& cmd) override;
    void check_speed(double output_speed_radps, const ConverterCommand& cmd) const override;

    double speed_ratio() const override { return p_.ratios[static_cast<std::size_t>(gear_)]; }
    double inertia_kgm2() const override { return p_.inertia_kgm2; }

    int gear() const { return gear_; }
    std::size_t gear_count() const { return p_.ratios.size(); }
    const GearStageParams& params() const { return p_; }

private:
    void check_torque(double input_torque_nm) const;
    void record(FlowDirection dir, const Quantity& from, const Quantity& to);

    GearStageParams p_;
    int gear_ = 0;
};

} // namespace plant
