// src/plant/brakes.hpp
#pragma once

#include <string>

namespace plant {

struct BrakesParams {
    double max_torque_nm = 4000.0;   // total friction torque at the wheels
};

/**
 * Brakes - friction brakes, a pure mechanical energy sink
 *
 * Each step takes a torque request (ECU command plus regeneration the
 * drivetrain could not absorb), limits it to the rating and tallies the
 * energy it dissipates. Nothing ever flows back to a source.
 */
class Brakes {
public:
    explicit Brakes(std::string name = "brakes", const BrakesParams& params = {});

    /**
     * Limit a torque request to the rating.
     * @return torque magnitude the brakes will apply [N·m]
     */
    double command(double requested_torque_nm);

    /**
     * Account the heat produced this step.
     * @return dissipated power [W]
     */
    double dissipate(double applied_torque_nm, double wheel_speed_radps, double dt_s);

    double last_requested_nm() const { return requested_nm_; }
    double last_applied_nm() const { return applied_nm_; }
    double unmet_torque_nm() const { return requested_nm_ - applied_nm_; }
    double dissipated_J() const { return dissipated_J_; }
    const std::string& name() const { return name_; }
    const BrakesParams& params() const { return params_; }

private:
    std::string name_;
    BrakesParams params_;
    double requested_nm_ = 0.0;
    double applied_nm_ = 0.0;
    double dissipated_J_ = 0.0;
};

} // namespace plant
