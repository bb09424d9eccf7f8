// src/config/vehicle_config.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "plant/battery.hpp"
#include "plant/body.hpp"
#include "plant/brakes.hpp"
#include "plant/combustion_engine.hpp"
#include "plant/ecu.hpp"
#include "plant/efficiency_map.hpp"
#include "plant/electric_motor.hpp"
#include "plant/fuel_cell.hpp"
#include "plant/fuel_tank.hpp"
#include "plant/gear_stage.hpp"
#include "plant/power_electronics.hpp"
#include "plant/quantity.hpp"
#include "plant/vehicle.hpp"

namespace config {

/// Efficiency map description: `constant` or `gaussian`.
struct EfficiencySpec {
    std::string kind = "constant";
    double value = 0.95;                 // constant
    plant::EfficiencyPeak peak;          // gaussian
    double min_efficiency = 0.70;
    double falloff_speed = 5e-8;         // per rpm^2
    double falloff_power = 1e-10;        // per W^2

    plant::EfficiencyMap make() const;
};

struct SourceSpec {
    std::string name;
    std::string type;                    // battery | fuel_tank
    plant::BatteryParams battery;
    plant::FuelTankParams tank;
};

struct ConverterSpec {
    std::string name;
    std::string type;                    // electric_motor | gearbox | differential | combustion_engine |
                                         // fuel_cell | dc_dc | inverter
    plant::ElectricMotorParams motor;
    plant::GearStageParams gears;
    plant::CombustionEngineParams engine;
    plant::FuelCellParams fuel_cell;
    plant::PowerElectronicsParams power_electronics;
    EfficiencySpec efficiency;
    EfficiencySpec regen_efficiency;
};

struct JunctionSpec {
    std::string name;
    plant::Domain domain = plant::Domain::Electrical;
    double bus_voltage_v = 0.0;
};

struct LinkSpec {
    std::string from;
    std::string to;                      // "body" for an axle branch
    double weight = 1.0;
};

struct EcuSpec {
    std::string type = "pedal";          // pedal | lua
    plant::PedalEcuParams pedal;
    std::string script_path;             // lua
};

/**
 * VehicleConfig - Loads a vehicle description from YAML files
 *
 * Usage:
 *   auto config = VehicleConfig::load("config/vehicles/ev.yaml");
 *   auto vehicle = config.build();
 *
 * Falls back to the default single-battery EV if the file is not found.
 */
class VehicleConfig {
public:
    std::string name;
    std::string description;

    plant::BodyParams body;
    plant::BrakesParams brakes;
    EcuSpec ecu;

    std::vector<SourceSpec> sources;
    std::vector<ConverterSpec> converters;
    std::vector<JunctionSpec> junctions;
    std::vector<LinkSpec> links;

    /**
     * Load vehicle config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/vehicles/ev.yaml")
     * @return VehicleConfig with loaded parameters
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static VehicleConfig load(const std::string& yaml_path);

    /**
     * Get default vehicle configuration: battery -> motor -> differential -> body
     */
    static VehicleConfig get_default();

    /**
     * Validate loaded parameters
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    /**
     * Print summary of configuration to the log
     */
    void print_summary() const;

    /**
     * Assemble the vehicle.
     *
     * @param ecu controller to install; null builds the configured PedalEcu
     * @throws std::runtime_error for an ECU type that needs an explicit controller
     * @throws plant::ConnectivityError if the links do not form a valid graph
     */
    std::unique_ptr<plant::Vehicle> build(std::unique_ptr<plant::Ecu> ecu = nullptr) const;

    VehicleConfig() = default;
};

} // namespace config
