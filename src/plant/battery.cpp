// src/plant/battery.cpp
#include "plant/battery.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace plant {

Battery::Battery(std::string name, const BatteryParams& params)
    : EnergySource(std::move(name), Domain::Electrical),
      params_(params) {
    if (params_.capacity_kWh <= 0.0) {
        throw std::invalid_argument(this->name() + ": capacity must be > 0");
    }
    if (!(params_.state_of_health > 0.0 && params_.state_of_health <= 1.0)) {
        throw std::invalid_argument(this->name() + ": state of health must be in (0, 1]");
    }
    if (params_.initial_soc < 0.0 || params_.initial_soc > 1.0 ||
        params_.reserve_soc < 0.0 || params_.reserve_soc >= 1.0) {
        throw std::invalid_argument(this->name() + ": soc values must be in [0, 1]");
    }
    if (!(params_.efficiency_charge > 0.0 && params_.efficiency_charge <= 1.0) ||
        !(params_.efficiency_discharge > 0.0 && params_.efficiency_discharge <= 1.0)) {
        throw std::invalid_argument(this->name() + ": efficiencies must be in (0, 1]");
    }
    if (params_.voltage_min_v <= 0.0 || params_.voltage_max_v < params_.voltage_min_v) {
        throw std::invalid_argument(this->name() + ": voltage range invalid");
    }
    if (params_.max_discharge_power_w < 0.0 || params_.max_charge_power_w < 0.0) {
        throw std::invalid_argument(this->name() + ": power limits must be >= 0");
    }

    capacity_J_ = utils::kwh_to_joules(params_.capacity_kWh) * params_.state_of_health;
    energy_J_ = capacity_J_ * params_.initial_soc;
}

double Battery::get_voltage() const {
    // Linear open-circuit voltage over SOC
    return params_.voltage_min_v + (params_.voltage_max_v - params_.voltage_min_v) * get_soc();
}

double Battery::max_discharge_power_w() const {
    return (params_.max_discharge_power_w > 0.0) ? params_.max_discharge_power_w
                                                 : EnergySource::max_discharge_power_w();
}

double Battery::max_charge_power_w() const {
    return (params_.max_charge_power_w > 0.0) ? params_.max_charge_power_w
                                              : EnergySource::max_charge_power_w();
}

void Battery::check(double terminal_power_w, double dt_s) const {
    if (!(dt_s > 0.0)) {
        throw std::invalid_argument(name() + ": dt must be > 0");
    }
    if (terminal_power_w > 0.0) {
        const double needed_J = terminal_power_w * dt_s / params_.efficiency_discharge;
        const double available_J = energy_J_ - params_.reserve_soc * capacity_J_;
        if (needed_J > available_J) {
            throw DepletionError(name(), needed_J, std::max(available_J, 0.0));
        }
    }
}

SourceUpdate Battery::apply(double terminal_power_w, double dt_s) {
    check(terminal_power_w, dt_s);

    SourceUpdate u;
    u.terminal_power_w = terminal_power_w;

    if (terminal_power_w > 0.0) {
        const double needed_J = terminal_power_w * dt_s / params_.efficiency_discharge;
        energy_J_ -= needed_J;
        u.stored_power_w = needed_J / dt_s;
    } else if (terminal_power_w < 0.0) {
        const double offered_J = -terminal_power_w * dt_s * params_.efficiency_charge;
        const double absorbed_J = std::min(offered_J, capacity_J_ - energy_J_);
        if (absorbed_J < offered_J) {
            LOG_WARN("[%s] Full: %.1f J of regenerated energy rejected",
                     name().c_str(), offered_J - absorbed_J);
        }
        energy_J_ += absorbed_J;
        u.stored_power_w = -absorbed_J / dt_s;
    }

    u.loss_w = u.stored_power_w - u.terminal_power_w;
    last_ = u;

    LOG_TRACE("[%s] P=%.1f W, SOC=%.4f, V=%.1f V, I=%.2f A",
              name().c_str(), terminal_power_w, get_soc(), get_voltage(),
              terminal_power_w / get_voltage());
    return u;
}

} // namespace plant
