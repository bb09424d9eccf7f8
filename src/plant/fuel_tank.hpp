// src/plant/fuel_tank.hpp
#pragma once

#include "plant/energy_source.hpp"

namespace plant {

enum class FuelType {
    Gasoline,
    Diesel,
    Biodiesel,
    Ethanol,
    Methanol,
    Hydrogen,        // compressed gas, stored by mass
    LiquidHydrogen,
    Methane          // compressed gas, stored by mass
};

const char* to_string(FuelType f);

struct FuelProperties {
    double specific_energy_jpkg;
    double density_kgpl;    // 0 for fuels stored by mass (compressed gas)
};

FuelProperties fuel_properties(FuelType f);

struct FuelTankParams {
    FuelType fuel = FuelType::Gasoline;
    double capacity_l = 50.0;       // liquid fuels
    double capacity_kg = 5.0;       // gaseous fuels
    double initial_fraction = 1.0;
};

/// FuelTank - non-rechargeable chemical store, level in kg of fuel
class FuelTank : public EnergySource {
public:
    explicit FuelTank(std::string name, const FuelTankParams& params = {});

    SourceUpdate apply(double terminal_power_w, double dt_s) override;
    void check(double terminal_power_w, double dt_s) const override;

    bool rechargeable() const override { return false; }
    bool can_absorb() const override { return false; }
    double level() const override { return mass_kg_; }
    double capacity() const override { return capacity_kg_; }
    double stored_energy_J() const override { return mass_kg_ * props_.specific_energy_jpkg; }
    double output_effort() const override { return props_.specific_energy_jpkg; }

    FuelType fuel() const { return params_.fuel; }

private:
    FuelTankParams params_;
    FuelProperties props_;
    double capacity_kg_;
    double mass_kg_;
};

} // namespace plant
