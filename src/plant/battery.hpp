// src/plant/battery.hpp
#pragma once

#include "plant/energy_source.hpp"

namespace plant {

struct BatteryParams {
    double capacity_kWh = 60.0;         // nominal
    double state_of_health = 1.0;       // usable = nominal * soh
    double initial_soc = 1.0;
    double reserve_soc = 0.0;           // discharge below this raises DepletionError
    double efficiency_charge = 0.95;
    double efficiency_discharge = 0.95;
    double voltage_min_v = 300.0;       // at soc = 0
    double voltage_max_v = 420.0;       // at soc = 1
    double max_discharge_power_w = 0.0; // terminal limit, 0 = unlimited
    double max_charge_power_w = 0.0;    // terminal limit, 0 = unlimited
};

/**
 * Battery - rechargeable electrical store
 *
 * Discharge removes P*dt/eta_d from the store, charge adds |P|*dt*eta_c.
 * Charge arriving at a full battery is logged and counted as loss.
 * Terminal power limits are honoured by the causality resolver, which
 * never asks for more than max_discharge_power_w()/max_charge_power_w().
 */
class Battery : public EnergySource {
public:
    explicit Battery(std::string name, const BatteryParams& params = {});

    SourceUpdate apply(double terminal_power_w, double dt_s) override;
    void check(double terminal_power_w, double dt_s) const override;

    double max_discharge_power_w() const override;
    double max_charge_power_w() const override;

    bool rechargeable() const override { return true; }
    bool can_absorb() const override { return energy_J_ < capacity_J_; }
    double level() const override { return energy_J_; }
    double capacity() const override { return capacity_J_; }
    double stored_energy_J() const override { return energy_J_; }
    double output_effort() const override { return get_voltage(); }

    double get_soc() const { return energy_J_ / capacity_J_; }
    double get_voltage() const;

    const BatteryParams& params() const { return params_; }

private:
    BatteryParams params_;
    double capacity_J_;
    double energy_J_;
};

} // namespace plant
