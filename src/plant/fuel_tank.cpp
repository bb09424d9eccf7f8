// src/plant/fuel_tank.cpp
#include "plant/fuel_tank.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace plant {

const char* to_string(FuelType f) {
    switch (f) {
        case FuelType::Gasoline:       return "gasoline";
        case FuelType::Diesel:         return "diesel";
        case FuelType::Biodiesel:      return "biodiesel";
        case FuelType::Ethanol:        return "ethanol";
        case FuelType::Methanol:       return "methanol";
        case FuelType::Hydrogen:       return "hydrogen";
        case FuelType::LiquidHydrogen: return "liquid_hydrogen";
        case FuelType::Methane:        return "methane";
    }
    return "unknown";
}

// Lower heating values [J/kg] and liquid densities [kg/L]
FuelProperties fuel_properties(FuelType f) {
    switch (f) {
        case FuelType::Gasoline:       return FuelProperties{44.4e6, 0.7429};
        case FuelType::Diesel:         return FuelProperties{45.4e6, 0.830};
        case FuelType::Biodiesel:      return FuelProperties{37.8e6, 0.8747};
        case FuelType::Ethanol:        return FuelProperties{26.8e6, 0.789};
        case FuelType::Methanol:       return FuelProperties{22.6e6, 0.7913};
        case FuelType::Hydrogen:       return FuelProperties{130.0e6, 0.0};
        case FuelType::LiquidHydrogen: return FuelProperties{130.0e6, 0.07085};
        case FuelType::Methane:        return FuelProperties{53.0e6, 0.0};
    }
    return FuelProperties{0.0, 0.0};
}

FuelTank::FuelTank(std::string name, const FuelTankParams& params)
    : EnergySource(std::move(name), Domain::Chemical),
      params_(params),
      props_(fuel_properties(params.fuel)) {
    capacity_kg_ = (props_.density_kgpl > 0.0) ? params_.capacity_l * props_.density_kgpl
                                               : params_.capacity_kg;
    if (capacity_kg_ <= 0.0) {
        throw std::invalid_argument(this->name() + ": tank capacity must be > 0");
    }
    if (params_.initial_fraction < 0.0 || params_.initial_fraction > 1.0) {
        throw std::invalid_argument(this->name() + ": initial fraction must be in [0, 1]");
    }
    mass_kg_ = capacity_kg_ * params_.initial_fraction;

    LOG_DEBUG("[%s] Tank: %.2f kg %s (%.1f MJ)", this->name().c_str(), mass_kg_,
              to_string(params_.fuel), stored_energy_J() / 1e6);
}

void FuelTank::check(double terminal_power_w, double dt_s) const {
    if (!(dt_s > 0.0)) {
        throw std::invalid_argument(name() + ": dt must be > 0");
    }
    if (terminal_power_w < 0.0) {
        throw std::logic_error(name() + ": fuel tank cannot absorb power");
    }
    const double burn_kg = terminal_power_w * dt_s / props_.specific_energy_jpkg;
    if (burn_kg > mass_kg_) {
        throw DepletionError(name(), burn_kg, mass_kg_);
    }
}

SourceUpdate FuelTank::apply(double terminal_power_w, double dt_s) {
    check(terminal_power_w, dt_s);

    mass_kg_ -= terminal_power_w * dt_s / props_.specific_energy_jpkg;

    SourceUpdate u;
    u.terminal_power_w = terminal_power_w;
    u.stored_power_w = terminal_power_w;
    u.loss_w = 0.0;
    last_ = u;
    return u;
}

} // namespace plant
