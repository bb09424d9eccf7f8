// test/test_vehicle_config.cpp
/**
 * Unit Test: VehicleConfig
 *
 * Tests YAML loading, validation, and default configuration.
 *
 * Test Coverage:
 *   1. Default configuration builds a runnable EV
 *   2. Valid YAML loading (fuel cell hybrid with a bus junction and gearbox)
 *   3. Missing file fallback to defaults
 *   4. Parameter validation (mass, SOC, ratios, links, efficiency)
 *   5. ECU selection: lua type needs a script and an explicit controller
 *   6. DC-DC stage, battery power limits, fuel names, fuel cell window
 */

#include "test_helpers.hpp"

#include "config/vehicle_config.hpp"
#include "plant/sim_errors.hpp"

#include <cstdio>
#include <fstream>
#include <functional>
#include <stdexcept>

namespace {

void write_file(const char* path, const char* text) {
    std::ofstream f(path);
    f << text;
}

/// Load `text` from a temp file and expect a runtime_error mentioning `needle`
bool rejects(const char* text, const std::string& needle, std::string* msg = nullptr) {
    const char* path = "/tmp/test_vehicle_invalid.yaml";
    write_file(path, text);
    bool ok = false;
    try {
        config::VehicleConfig::load(path);
    } catch (const std::runtime_error& e) {
        const std::string what = e.what();
        if (msg) *msg = what;
        ok = what.find(needle) != std::string::npos;
    }
    std::remove(path);
    return ok;
}

const char* kHybridYaml = R"(
vehicle:
  name: "Test FCEV"
  description: "Fuel cell range extender"

  body:
    mass_kg: 2000.0
    wheel_radius_m: 0.33
    drag_coefficient: 0.28
    frontal_area_m2: 2.3

  brakes:
    max_torque_nm: 6000.0

  ecu:
    type: pedal
    max_wheel_torque_nm: 3000.0
    regen_fade_speed_mps: 1.5
    shift:
      gearbox: gearbox
      upshift_speed_mps: [12.0]
      hysteresis_mps: 1.0

  sources:
    - name: pack
      type: battery
      capacity_kwh: 2.0
      initial_soc: 0.7
    - name: h2
      type: fuel_tank
      fuel: hydrogen
      capacity_kg: 5.6

  converters:
    - name: stack
      type: fuel_cell
      max_power_w: 90000.0
      efficiency: 0.5
    - name: motor
      type: electric_motor
      max_power_w: 150000.0
      max_torque_nm: 300.0
      efficiency:
        kind: gaussian
        peak_speed_rpm: 4000.0
        peak_power_w: 60000.0
        peak_efficiency: 0.95
        min_efficiency: 0.75
    - name: gearbox
      type: gearbox
      ratios: [2.0, 1.0]
      efficiency_forward: 0.98
    - name: diff
      type: differential
      ratio: 4.5

  junctions:
    - name: bus
      domain: electrical
      bus_voltage_v: 400.0

  links:
    - {from: pack, to: bus, weight: 1.0}
    - {from: h2, to: stack}
    - {from: stack, to: bus, weight: 3.0}
    - {from: bus, to: motor}
    - {from: motor, to: gearbox}
    - {from: gearbox, to: diff}
    - {from: diff, to: body}
)";

} // namespace

// Test 1: Default configuration
void test_default_config(TestResult& result) {
    print_header("Test 1: Default Configuration");

    config::VehicleConfig cfg = config::VehicleConfig::get_default();
    bool valid = true;
    try {
        cfg.validate();
    } catch (const std::exception& e) {
        valid = false;
        std::cout << "  " << e.what() << "\n";
    }
    result.check(valid, "Default configuration validates");
    result.check(cfg.sources.size() == 1 && cfg.converters.size() == 2 && cfg.links.size() == 3,
                 "battery -> motor -> differential -> body");

    auto vehicle = cfg.build();
    const auto& dt = vehicle->drive_train();
    result.check(vehicle->name() == cfg.name, "Vehicle named after the config");
    result.check(dt.converter_count() == 2 && vehicle->source_count() == 1, "Components instantiated");
    result.check(dt.find_converter("motor") && dt.find_converter("differential"), "Converters found by name");
    result.check(dynamic_cast<const plant::PedalEcu*>(&vehicle->ecu()) != nullptr, "Pedal ECU installed");
}

// Test 2: Valid YAML loading
void test_valid_yaml(TestResult& result) {
    print_header("Test 2: Valid YAML Loading");

    const char* path = "/tmp/test_vehicle_valid.yaml";
    write_file(path, kHybridYaml);

    try {
        config::VehicleConfig cfg = config::VehicleConfig::load(path);

        result.check(cfg.name == "Test FCEV", "Vehicle name loaded: " + cfg.name);
        result.check(is_close(cfg.body.mass_kg, 2000.0) && is_close(cfg.body.wheel_radius_m, 0.33),
                     "Body parameters loaded");
        result.check(is_close(cfg.brakes.max_torque_nm, 6000.0), "Brake rating loaded");
        result.check(is_close(cfg.ecu.pedal.max_wheel_torque_nm, 3000.0) &&
                     is_close(cfg.ecu.pedal.regen_fade_speed_mps, 1.5), "ECU parameters loaded");
        result.check(cfg.ecu.pedal.shift.gearbox == "gearbox" &&
                     cfg.ecu.pedal.shift.upshift_speed_mps.size() == 1, "Shift schedule loaded");

        result.check(cfg.sources.size() == 2 && cfg.sources[1].tank.fuel == plant::FuelType::Hydrogen &&
                     is_close(cfg.sources[1].tank.capacity_kg, 5.6), "Hydrogen tank loaded");
        result.check(is_close(cfg.sources[0].battery.capacity_kWh, 2.0) &&
                     is_close(cfg.sources[0].battery.initial_soc, 0.7), "Battery loaded");
        result.check(cfg.converters[1].efficiency.kind == "gaussian" &&
                     is_close(cfg.converters[1].efficiency.peak.efficiency, 0.95), "Efficiency map loaded");
        result.check(cfg.converters[1].regen_efficiency.kind == "gaussian",
                     "Regeneration map defaults to the drive map");
        result.check(cfg.converters[2].gears.ratios.size() == 2 && cfg.converters[3].gears.ratios.size() == 1 &&
                     is_close(cfg.converters[3].gears.ratios[0], 4.5), "Ratio lists and single ratios loaded");
        result.check(cfg.junctions.size() == 1 && cfg.junctions[0].domain == plant::Domain::Electrical,
                     "Junction loaded");

        auto vehicle = cfg.build();
        const auto& dt = vehicle->drive_train();
        result.check(dt.converter_count() == 4 && dt.junction_count() == 1 && vehicle->source_count() == 2,
                     "Hybrid assembled");
        result.check(is_close(vehicle->body().params().mass_kg, 2000.0), "Body parameters applied");

        bool weights = false;
        for (const auto& l : dt.links()) {
            if (dt.node(l.from).name == "stack") weights = is_close(l.weight, 0.75);
        }
        result.check(weights, "Junction weights normalized (3:1)");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }

    std::remove(path);
}

// Test 3: Missing file fallback
void test_missing_file(TestResult& result) {
    print_header("Test 3: Missing File Fallback");

    try {
        config::VehicleConfig cfg = config::VehicleConfig::load("/tmp/nonexistent_vehicle_config.yaml");
        result.check(cfg.name == config::VehicleConfig::get_default().name,
                     "Missing file fell back to defaults");
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }
}

// Test 4: Validation
void test_validation(TestResult& result) {
    print_header("Test 4: Validation");

    std::string msg;
    result.check(rejects(R"(
vehicle:
  body: {mass_kg: -1000.0}
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "mass_kg", &msg), "Negative mass rejected: " + msg);

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery, initial_soc: 1.2}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "initial_soc"), "SOC outside [0, 1] rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor}, {name: g, type: gearbox, ratios: [3.0, 0.0]}]
  links: [{from: b, to: m}, {from: m, to: g}, {from: g, to: body}]
)", "ratio"), "Zero gear ratio rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor, efficiency: 1.3}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "efficiency"), "Efficiency above 1 rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: wheels}]
)", "unknown component"), "Link to an unknown component rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: m, type: battery}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: m, to: body}]
)", "Duplicate"), "Duplicate names rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: flywheel}]
  links: [{from: b, to: body}]
)", "Unknown source type"), "Unknown source type rejected");

    result.check(rejects(R"(
vehicle:
  body: {mass_kg: heavy}
  sources: [{name: b, type: battery, capacity_kwh: 40.0}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "YAML parse error", &msg), "Non-numeric value reported, not replaced by the default: " + msg);

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor, reversible: maybe}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "YAML parse error"), "Non-boolean flag reported");

    result.check(rejects("vehicle: [unterminated", "YAML parse error"), "Malformed YAML reported");
    result.check(rejects("car: {}\n", "vehicle"), "Missing vehicle section reported");

    // Valid description, invalid graph: found when building
    const char* path = "/tmp/test_vehicle_dangling.yaml";
    write_file(path, R"(
vehicle:
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor}, {name: d, type: differential, ratio: 9.0}]
  links: [{from: b, to: m}, {from: m, to: body}]
)");
    bool connectivity = false;
    try {
        config::VehicleConfig::load(path).build();
    } catch (const plant::ConnectivityError&) {
        connectivity = true;
    }
    result.check(connectivity, "Unconnected converter raises ConnectivityError at build");
    std::remove(path);
}

// Test 5: ECU selection
void test_ecu_selection(TestResult& result) {
    print_header("Test 5: ECU Selection");

    result.check(rejects(R"(
vehicle:
  ecu: {type: lua}
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "script"), "Lua ECU without a script rejected");

    result.check(rejects(R"(
vehicle:
  ecu: {type: neural}
  sources: [{name: b, type: battery}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "ecu type"), "Unknown ECU type rejected");

    config::VehicleConfig cfg = config::VehicleConfig::get_default();
    cfg.ecu.type = "lua";
    cfg.ecu.script_path = "ecu.lua";

    bool needs_override = false;
    try {
        cfg.build();
    } catch (const std::runtime_error& e) {
        needs_override = std::string(e.what()).find("caller") != std::string::npos;
    }
    result.check(needs_override, "Lua ECU must be supplied by the caller");

    auto vehicle = cfg.build(std::make_unique<FixedEcu>(plant::CommandSet{}));
    result.check(dynamic_cast<const FixedEcu*>(&vehicle->ecu()) != nullptr, "Supplied ECU installed");
}

// Test 6: Power electronics and limits
void test_power_electronics(TestResult& result) {
    print_header("Test 6: Power Electronics and Limits");

    const char* path = "/tmp/test_vehicle_dcdc.yaml";
    write_file(path, R"(
vehicle:
  sources:
    - {name: pack, type: battery, capacity_kwh: 40.0, initial_soc: 0.8,
       max_discharge_power_w: 90000.0, max_charge_power_w: 30000.0}
    - {name: lh2, type: fuel_tank, fuel: liquid_hydrogen, capacity_l: 120.0}
  converters:
    - {name: stack, type: fuel_cell, max_power_w: 60000.0, min_power_w: 3000.0}
    - {name: boost, type: dc_dc, max_power_w: 120000.0, output_voltage_v: 800.0,
       efficiency: 0.97, regen_efficiency: 0.96}
    - {name: motor, type: electric_motor}
    - {name: diff, type: differential, ratio: 9.0}
  junctions:
    - {name: bus, domain: electrical}
  links:
    - {from: pack, to: boost}
    - {from: boost, to: bus}
    - {from: lh2, to: stack}
    - {from: stack, to: bus}
    - {from: bus, to: motor}
    - {from: motor, to: diff}
    - {from: diff, to: body}
)");

    try {
        config::VehicleConfig cfg = config::VehicleConfig::load(path);
        const auto& pack = cfg.sources[0].battery;
        result.check(is_close(pack.max_discharge_power_w, 90000.0) && is_close(pack.max_charge_power_w, 30000.0),
                     "Battery power limits loaded");
        result.check(cfg.sources[1].tank.fuel == plant::FuelType::LiquidHydrogen, "Liquid hydrogen tank loaded");
        result.check(is_close(cfg.converters[0].fuel_cell.min_power_w, 3000.0), "Fuel cell minimum loaded");

        const auto& boost = cfg.converters[1];
        result.check(is_close(boost.power_electronics.output_voltage_v, 800.0) &&
                     is_close(boost.efficiency.value, 0.97) && is_close(boost.regen_efficiency.value, 0.96),
                     "DC-DC stage loaded");

        auto vehicle = cfg.build();
        const auto& dt = vehicle->drive_train();
        const auto idx = dt.find_converter("boost");
        result.check(idx && dynamic_cast<const plant::PowerElectronics*>(&dt.converter(*idx)) != nullptr,
                     "DC-DC stage instantiated");
        result.check(is_close(vehicle->source(0).max_discharge_power_w(), 90000.0),
                     "Limits reach the battery");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }
    std::remove(path);

    result.check(rejects(R"(
vehicle:
  sources: [{name: t, type: fuel_tank, fuel: kerosene}]
  converters: [{name: e, type: combustion_engine}]
  links: [{from: t, to: e}, {from: e, to: body}]
)", "Unknown fuel type"), "Unknown fuel rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery, max_charge_power_w: -1.0}]
  converters: [{name: m, type: electric_motor}]
  links: [{from: b, to: m}, {from: m, to: body}]
)", "power limits"), "Negative power limit rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery}]
  converters: [{name: i, type: inverter, output_voltage_v: 0.0}, {name: m, type: electric_motor}]
  links: [{from: b, to: i}, {from: i, to: m}, {from: m, to: body}]
)", "output_voltage_v"), "Zero output voltage rejected");

    result.check(rejects(R"(
vehicle:
  sources: [{name: b, type: battery}, {name: h, type: fuel_tank, fuel: hydrogen}]
  converters: [{name: fc, type: fuel_cell, max_power_w: 50000.0, min_power_w: 60000.0},
               {name: m, type: electric_motor}]
  junctions: [{name: bus}]
  links: [{from: h, to: fc}, {from: fc, to: bus}, {from: b, to: bus}, {from: bus, to: m}, {from: m, to: body}]
)", "min_power_w"), "Fuel cell minimum above its rating rejected");
}

int main() {
    std::cout << COLOR_YELLOW << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║        VehicleConfig Unit Tests       ║\n";
    std::cout << "╚════════════════════════════════════════╝" << COLOR_RESET << "\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;
    test_default_config(result);
    test_valid_yaml(result);
    test_missing_file(result);
    test_validation(result);
    test_ecu_selection(result);
    test_power_electronics(result);

    result.summary();
    return (result.failed == 0) ? 0 : 1;
}
