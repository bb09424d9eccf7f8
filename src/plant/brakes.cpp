// src/plant/brakes.cpp
#include "plant/brakes.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace plant {

Brakes::Brakes(std::string name, const BrakesParams& params)
    : name_(std::move(name)), params_(params) {
    if (params_.max_torque_nm < 0.0) {
        throw std::invalid_argument(name_ + ": max torque must be >= 0");
    }
}

double Brakes::command(double requested_torque_nm) {
    requested_nm_ = std::max(0.0, requested_torque_nm);
    applied_nm_ = std::min(requested_nm_, params_.max_torque_nm);
    if (applied_nm_ < requested_nm_) {
        LOG_DEBUG("[%s] Request %.1f Nm limited to %.1f Nm",
                  name_.c_str(), requested_nm_, applied_nm_);
    }
    return applied_nm_;
}

double Brakes::dissipate(double applied_torque_nm, double wheel_speed_radps, double dt_s) {
    const double power_w = std::abs(applied_torque_nm * wheel_speed_radps);
    dissipated_J_ += power_w * dt_s;
    return power_w;
}

} // namespace plant
