// src/config/vehicle_config.cpp
#include "config/vehicle_config.hpp"
#include "config/yaml_value.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <set>
#include <stdexcept>

namespace config {

namespace {

plant::FuelType parse_fuel(const std::string& s) {
    for (plant::FuelType f : {plant::FuelType::Gasoline, plant::FuelType::Diesel,
                              plant::FuelType::Biodiesel, plant::FuelType::Ethanol,
                              plant::FuelType::Methanol, plant::FuelType::Hydrogen,
                              plant::FuelType::LiquidHydrogen, plant::FuelType::Methane}) {
        if (s == plant::to_string(f)) return f;
    }
    throw std::runtime_error("Unknown fuel type: " + s);
}

plant::Domain parse_domain(const std::string& s) {
    if (s == "electrical") return plant::Domain::Electrical;
    if (s == "chemical") return plant::Domain::Chemical;
    if (s == "mechanical") return plant::Domain::Mechanical;
    throw std::runtime_error("Unknown domain: " + s);
}

// Either a plain number (constant) or a map with `kind`
EfficiencySpec parse_efficiency(const YAML::Node& n, const EfficiencySpec& def) {
    EfficiencySpec e = def;
    if (!n) return e;

    if (n.IsScalar()) {
        e.kind = "constant";
        e.value = n.as<double>();
        return e;
    }

    e.kind = yaml_value<std::string>(n, "kind", def.kind);
    e.value = yaml_value<double>(n, "value", def.value);
    e.peak.speed_rpm = yaml_value<double>(n, "peak_speed_rpm", def.peak.speed_rpm);
    e.peak.power_w = yaml_value<double>(n, "peak_power_w", def.peak.power_w);
    e.peak.efficiency = yaml_value<double>(n, "peak_efficiency", def.peak.efficiency);
    e.min_efficiency = yaml_value<double>(n, "min_efficiency", def.min_efficiency);
    e.falloff_speed = yaml_value<double>(n, "falloff_speed", def.falloff_speed);
    e.falloff_power = yaml_value<double>(n, "falloff_power", def.falloff_power);
    return e;
}

SourceSpec parse_source(const YAML::Node& n) {
    SourceSpec s;
    s.name = yaml_value<std::string>(n, "name", "");
    s.type = yaml_value<std::string>(n, "type", "battery");

    if (s.type == "battery") {
        auto& b = s.battery;
        b.capacity_kWh = yaml_value<double>(n, "capacity_kwh", b.capacity_kWh);
        b.state_of_health = yaml_value<double>(n, "state_of_health", b.state_of_health);
        b.initial_soc = yaml_value<double>(n, "initial_soc", b.initial_soc);
        b.reserve_soc = yaml_value<double>(n, "reserve_soc", b.reserve_soc);
        b.efficiency_charge = yaml_value<double>(n, "efficiency_charge", b.efficiency_charge);
        b.efficiency_discharge = yaml_value<double>(n, "efficiency_discharge", b.efficiency_discharge);
        b.voltage_min_v = yaml_value<double>(n, "voltage_min_v", b.voltage_min_v);
        b.voltage_max_v = yaml_value<double>(n, "voltage_max_v", b.voltage_max_v);
        b.max_discharge_power_w = yaml_value<double>(n, "max_discharge_power_w", b.max_discharge_power_w);
        b.max_charge_power_w = yaml_value<double>(n, "max_charge_power_w", b.max_charge_power_w);
    } else if (s.type == "fuel_tank") {
        auto& t = s.tank;
        t.fuel = parse_fuel(yaml_value<std::string>(n, "fuel", "gasoline"));
        t.capacity_l = yaml_value<double>(n, "capacity_l", t.capacity_l);
        t.capacity_kg = yaml_value<double>(n, "capacity_kg", t.capacity_kg);
        t.initial_fraction = yaml_value<double>(n, "initial_fraction", t.initial_fraction);
    }
    return s;
}

ConverterSpec parse_converter(const YAML::Node& n) {
    ConverterSpec c;
    c.name = yaml_value<std::string>(n, "name", "");
    c.type = yaml_value<std::string>(n, "type", "");

    if (c.type == "electric_motor") {
        auto& m = c.motor;
        m.max_power_w = yaml_value<double>(n, "max_power_w", m.max_power_w);
        m.max_torque_nm = yaml_value<double>(n, "max_torque_nm", m.max_torque_nm);
        m.base_speed_rpm = yaml_value<double>(n, "base_speed_rpm", m.base_speed_rpm);
        m.max_speed_rpm = yaml_value<double>(n, "max_speed_rpm", m.max_speed_rpm);
        m.max_regen_torque_nm = yaml_value<double>(n, "max_regen_torque_nm", m.max_regen_torque_nm);
        m.max_regen_power_w = yaml_value<double>(n, "max_regen_power_w", m.max_regen_power_w);
        m.rotor_inertia_kgm2 = yaml_value<double>(n, "rotor_inertia_kgm2", m.rotor_inertia_kgm2);
        m.reversible = yaml_value<bool>(n, "reversible", m.reversible);
        c.efficiency = parse_efficiency(n["efficiency"], c.efficiency);
        c.regen_efficiency = parse_efficiency(n["regen_efficiency"], c.efficiency);
    } else if (c.type == "gearbox" || c.type == "differential") {
        auto& g = c.gears;
        if (n["ratios"]) {
            g.ratios = n["ratios"].as<std::vector<double>>();
        } else if (n["ratio"]) {
            g.ratios = {n["ratio"].as<double>()};
        }
        g.initial_gear = yaml_value<int>(n, "initial_gear", g.initial_gear);
        g.efficiency_forward = yaml_value<double>(n, "efficiency_forward", g.efficiency_forward);
        g.efficiency_backward = yaml_value<double>(n, "efficiency_backward", g.efficiency_backward);
        g.inertia_kgm2 = yaml_value<double>(n, "inertia_kgm2", g.inertia_kgm2);
        g.max_input_speed_rpm = yaml_value<double>(n, "max_input_speed_rpm", g.max_input_speed_rpm);
        g.max_input_torque_nm = yaml_value<double>(n, "max_input_torque_nm", g.max_input_torque_nm);
    } else if (c.type == "combustion_engine") {
        auto& e = c.engine;
        e.idle_speed_rpm = yaml_value<double>(n, "idle_speed_rpm", e.idle_speed_rpm);
        e.peak_speed_rpm = yaml_value<double>(n, "peak_speed_rpm", e.peak_speed_rpm);
        e.max_speed_rpm = yaml_value<double>(n, "max_speed_rpm", e.max_speed_rpm);
        e.idle_power_w = yaml_value<double>(n, "idle_power_w", e.idle_power_w);
        e.peak_power_w = yaml_value<double>(n, "peak_power_w", e.peak_power_w);
        e.max_speed_power_w = yaml_value<double>(n, "max_speed_power_w", e.max_speed_power_w);
        e.inertia_kgm2 = yaml_value<double>(n, "inertia_kgm2", e.inertia_kgm2);
        c.efficiency.value = 0.30;
        c.efficiency = parse_efficiency(n["efficiency"], c.efficiency);
    } else if (c.type == "fuel_cell") {
        auto& f = c.fuel_cell;
        f.max_power_w = yaml_value<double>(n, "max_power_w", f.max_power_w);
        f.min_power_w = yaml_value<double>(n, "min_power_w", f.min_power_w);
        f.nominal_voltage_v = yaml_value<double>(n, "nominal_voltage_v", f.nominal_voltage_v);
        c.efficiency.value = 0.55;
        c.efficiency = parse_efficiency(n["efficiency"], c.efficiency);
    } else if (c.type == "dc_dc" || c.type == "inverter") {
        auto& pe = c.power_electronics;
        pe.max_power_w = yaml_value<double>(n, "max_power_w", pe.max_power_w);
        pe.output_voltage_v = yaml_value<double>(n, "output_voltage_v", pe.output_voltage_v);
        pe.reversible = yaml_value<bool>(n, "reversible", pe.reversible);
        c.efficiency.value = 0.97;
        c.efficiency = parse_efficiency(n["efficiency"], c.efficiency);
        c.regen_efficiency = parse_efficiency(n["regen_efficiency"], c.efficiency);
    }
    return c;
}

bool valid_eta(double eta) {
    return eta > 0.0 && eta <= 1.0;
}

} // namespace

plant::EfficiencyMap EfficiencySpec::make() const {
    if (kind == "gaussian") {
        return plant::EfficiencyMap::gaussian(peak, min_efficiency, falloff_speed, falloff_power);
    }
    return plant::EfficiencyMap::constant(value);
}

VehicleConfig VehicleConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[VehicleConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[VehicleConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[VehicleConfig] Loading vehicle config from: %s", yaml_path.c_str());

    try {
        YAML::Node config = YAML::LoadFile(yaml_path);
        if (!config["vehicle"]) {
            throw std::runtime_error("missing top-level 'vehicle' section");
        }
        auto v = config["vehicle"];

        VehicleConfig vehicle;

        // ====================================================================
        // Parse vehicle metadata
        // ====================================================================
        vehicle.name = yaml_value<std::string>(v, "name", "Unknown Vehicle");
        vehicle.description = yaml_value<std::string>(v, "description", "");

        // ====================================================================
        // Parse body
        // ====================================================================
        if (v["body"]) {
            auto b = v["body"];
            auto& p = vehicle.body;
            p.mass_kg = yaml_value<double>(b, "mass_kg", p.mass_kg);
            p.wheel_radius_m = yaml_value<double>(b, "wheel_radius_m", p.wheel_radius_m);
            p.drag_coefficient = yaml_value<double>(b, "drag_coefficient", p.drag_coefficient);
            p.frontal_area_m2 = yaml_value<double>(b, "frontal_area_m2", p.frontal_area_m2);
            p.rolling_resistance_coeff = yaml_value<double>(b, "rolling_resistance_coeff", p.rolling_resistance_coeff);
            p.wheel_inertia_kgm2 = yaml_value<double>(b, "wheel_inertia_kgm2", p.wheel_inertia_kgm2);
        }

        // ====================================================================
        // Parse brakes
        // ====================================================================
        if (v["brakes"]) {
            vehicle.brakes.max_torque_nm = yaml_value<double>(v["brakes"], "max_torque_nm", vehicle.brakes.max_torque_nm);
        }

        // ====================================================================
        // Parse ECU
        // ====================================================================
        if (v["ecu"]) {
            auto e = v["ecu"];
            auto& p = vehicle.ecu.pedal;
            vehicle.ecu.type = yaml_value<std::string>(e, "type", "pedal");
            vehicle.ecu.script_path = yaml_value<std::string>(e, "script", "");
            p.max_wheel_torque_nm = yaml_value<double>(e, "max_wheel_torque_nm", p.max_wheel_torque_nm);
            p.max_braking_torque_nm = yaml_value<double>(e, "max_braking_torque_nm", p.max_braking_torque_nm);
            p.standstill_speed_mps = yaml_value<double>(e, "standstill_speed_mps", p.standstill_speed_mps);
            p.blend_regen = yaml_value<bool>(e, "blend_regen", p.blend_regen);
            p.regen_fade_speed_mps = yaml_value<double>(e, "regen_fade_speed_mps", p.regen_fade_speed_mps);
            p.derate_below_fraction = yaml_value<double>(e, "derate_below_fraction", p.derate_below_fraction);
            p.derate_floor = yaml_value<double>(e, "derate_floor", p.derate_floor);
            if (e["shift"]) {
                auto s = e["shift"];
                p.shift.gearbox = yaml_value<std::string>(s, "gearbox", "");
                p.shift.upshift_speed_mps = yaml_value<std::vector<double>>(s, "upshift_speed_mps", std::vector<double>{});
                p.shift.hysteresis_mps = yaml_value<double>(s, "hysteresis_mps", p.shift.hysteresis_mps);
            }
        }

        // ====================================================================
        // Parse components and links
        // ====================================================================
        if (v["sources"]) {
            for (const auto& n : v["sources"]) {
                vehicle.sources.push_back(parse_source(n));
            }
        }
        if (v["converters"]) {
            for (const auto& n : v["converters"]) {
                vehicle.converters.push_back(parse_converter(n));
            }
        }
        if (v["junctions"]) {
            for (const auto& n : v["junctions"]) {
                JunctionSpec j;
                j.name = yaml_value<std::string>(n, "name", "");
                j.domain = parse_domain(yaml_value<std::string>(n, "domain", "electrical"));
                j.bus_voltage_v = yaml_value<double>(n, "bus_voltage_v", 0.0);
                vehicle.junctions.push_back(j);
            }
        }
        if (v["links"]) {
            for (const auto& n : v["links"]) {
                LinkSpec l;
                l.from = yaml_value<std::string>(n, "from", "");
                l.to = yaml_value<std::string>(n, "to", "");
                l.weight = yaml_value<double>(n, "weight", 1.0);
                vehicle.links.push_back(l);
            }
        }

        // Validate loaded config
        vehicle.validate();

        LOG_INFO("[VehicleConfig] Successfully loaded: %s", vehicle.name.c_str());
        vehicle.print_summary();

        return vehicle;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[VehicleConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[VehicleConfig] Load error: ") + e.what()
        );
    }
}

VehicleConfig VehicleConfig::get_default() {
    VehicleConfig vehicle;

    vehicle.name = "Compact EV (Default)";
    vehicle.description = "Single battery, single motor, fixed reduction";

    SourceSpec battery;
    battery.name = "battery";
    battery.type = "battery";
    vehicle.sources.push_back(battery);

    ConverterSpec motor;
    motor.name = "motor";
    motor.type = "electric_motor";
    motor.efficiency.value = 0.92;
    motor.regen_efficiency.value = 0.90;
    vehicle.converters.push_back(motor);

    ConverterSpec diff;
    diff.name = "differential";
    diff.type = "differential";
    diff.gears.ratios = {9.0};
    vehicle.converters.push_back(diff);

    vehicle.links = {
        {"battery", "motor", 1.0},
        {"motor", "differential", 1.0},
        {"differential", "body", 1.0},
    };

    return vehicle;
}

void VehicleConfig::validate() const {
    // Body validation
    if (body.mass_kg <= 0.0) {
        throw std::runtime_error("Invalid mass_kg: must be > 0");
    }
    if (body.wheel_radius_m <= 0.0) {
        throw std::runtime_error("Invalid wheel_radius_m: must be > 0");
    }
    if (body.drag_coefficient < 0.0 || body.frontal_area_m2 < 0.0 ||
        body.rolling_resistance_coeff < 0.0 || body.wheel_inertia_kgm2 < 0.0) {
        throw std::runtime_error("Invalid road load coefficients: must be >= 0");
    }
    if (brakes.max_torque_nm < 0.0) {
        throw std::runtime_error("Invalid brakes max_torque_nm: must be >= 0");
    }

    // ECU validation
    if (ecu.type != "pedal" && ecu.type != "lua") {
        throw std::runtime_error("Invalid ecu type '" + ecu.type + "': expected pedal or lua");
    }
    if (ecu.type == "lua" && ecu.script_path.empty()) {
        throw std::runtime_error("Invalid ecu: type lua needs a script");
    }
    if (ecu.pedal.max_wheel_torque_nm < 0.0 || ecu.pedal.max_braking_torque_nm < 0.0) {
        throw std::runtime_error("Invalid ecu torque limits: must be >= 0");
    }

    // Component validation
    std::set<std::string> names{"body"};
    auto claim = [&](const std::string& n, const char* what) {
        if (n.empty()) {
            throw std::runtime_error(std::string("Invalid ") + what + ": name is required");
        }
        if (!names.insert(n).second) {
            throw std::runtime_error("Duplicate component name: " + n);
        }
    };

    if (sources.empty()) {
        throw std::runtime_error("Invalid vehicle: at least one source is required");
    }
    for (const auto& s : sources) {
        claim(s.name, "source");
        if (s.type == "battery") {
            if (s.battery.capacity_kWh <= 0.0) {
                throw std::runtime_error("Invalid battery capacity_kwh for " + s.name + ": must be > 0");
            }
            if (s.battery.initial_soc < 0.0 || s.battery.initial_soc > 1.0) {
                throw std::runtime_error("Invalid initial_soc for " + s.name + ": must be in [0, 1]");
            }
            if (!valid_eta(s.battery.efficiency_charge) || !valid_eta(s.battery.efficiency_discharge)) {
                throw std::runtime_error("Invalid battery efficiency for " + s.name + ": must be 0 < eff <= 1");
            }
            if (s.battery.max_discharge_power_w < 0.0 || s.battery.max_charge_power_w < 0.0) {
                throw std::runtime_error("Invalid battery power limits for " + s.name + ": must be >= 0");
            }
        } else if (s.type == "fuel_tank") {
            if (s.tank.capacity_l <= 0.0 && s.tank.capacity_kg <= 0.0) {
                throw std::runtime_error("Invalid tank capacity for " + s.name + ": must be > 0");
            }
        } else {
            throw std::runtime_error("Unknown source type '" + s.type + "' for " + s.name);
        }
    }

    for (const auto& c : converters) {
        claim(c.name, "converter");
        if (c.type == "electric_motor") {
            if (c.motor.max_power_w <= 0.0 || c.motor.max_torque_nm <= 0.0) {
                throw std::runtime_error("Invalid motor limits for " + c.name + ": must be > 0");
            }
        } else if (c.type == "gearbox" || c.type == "differential") {
            if (c.gears.ratios.empty()) {
                throw std::runtime_error("Invalid ratios for " + c.name + ": at least one is required");
            }
            for (double r : c.gears.ratios) {
                if (r <= 0.0) {
                    throw std::runtime_error("Invalid ratio for " + c.name + ": must be > 0");
                }
            }
            if (!valid_eta(c.gears.efficiency_forward) || !valid_eta(c.gears.efficiency_backward)) {
                throw std::runtime_error("Invalid gear efficiency for " + c.name + ": must be 0 < eff <= 1");
            }
        } else if (c.type == "combustion_engine") {
            const auto& e = c.engine;
            if (!(e.idle_speed_rpm < e.peak_speed_rpm && e.peak_speed_rpm < e.max_speed_rpm)) {
                throw std::runtime_error("Invalid engine speeds for " + c.name + ": idle < peak < max");
            }
        } else if (c.type == "fuel_cell") {
            if (c.fuel_cell.max_power_w <= 0.0) {
                throw std::runtime_error("Invalid fuel cell max_power_w for " + c.name + ": must be > 0");
            }
            if (c.fuel_cell.min_power_w < 0.0 || c.fuel_cell.min_power_w >= c.fuel_cell.max_power_w) {
                throw std::runtime_error("Invalid fuel cell min_power_w for " + c.name +
                                         ": must be in [0, max_power_w)");
            }
        } else if (c.type == "dc_dc" || c.type == "inverter") {
            if (c.power_electronics.max_power_w <= 0.0 || c.power_electronics.output_voltage_v <= 0.0) {
                throw std::runtime_error("Invalid " + c.type + " rating for " + c.name +
                                         ": max_power_w and output_voltage_v must be > 0");
            }
        } else {
            throw std::runtime_error("Unknown converter type '" + c.type + "' for " + c.name);
        }

        for (const EfficiencySpec* e : {&c.efficiency, &c.regen_efficiency}) {
            if (e->kind == "constant") {
                if (!valid_eta(e->value)) {
                    throw std::runtime_error("Invalid efficiency for " + c.name + ": must be 0 < eff <= 1");
                }
            } else if (e->kind == "gaussian") {
                if (!valid_eta(e->peak.efficiency) || !(e->min_efficiency > 0.0) ||
                    e->min_efficiency > e->peak.efficiency) {
                    throw std::runtime_error("Invalid efficiency map for " + c.name +
                                             ": 0 < min_efficiency <= peak_efficiency <= 1");
                }
            } else {
                throw std::runtime_error("Unknown efficiency kind '" + e->kind + "' for " + c.name);
            }
        }
    }

    for (const auto& j : junctions) {
        claim(j.name, "junction");
        if (j.bus_voltage_v < 0.0) {
            throw std::runtime_error("Invalid bus_voltage_v for " + j.name + ": must be >= 0");
        }
    }

    if (links.empty()) {
        throw std::runtime_error("Invalid vehicle: no links");
    }
    for (const auto& l : links) {
        if (!names.count(l.from) || !names.count(l.to)) {
            throw std::runtime_error("Invalid link " + l.from + " -> " + l.to + ": unknown component");
        }
        if (l.weight <= 0.0) {
            throw std::runtime_error("Invalid link " + l.from + " -> " + l.to + ": weight must be > 0");
        }
    }

    LOG_DEBUG("[VehicleConfig] Validation passed");
}

void VehicleConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Vehicle Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Mass: %.0f kg, wheel radius %.3f m", body.mass_kg, body.wheel_radius_m);
    for (const auto& s : sources) {
        if (s.type == "battery") {
            LOG_INFO("Source %s: battery %.1f kWh", s.name.c_str(), s.battery.capacity_kWh);
            if (s.battery.max_discharge_power_w > 0.0 || s.battery.max_charge_power_w > 0.0) {
                LOG_INFO("  power limits: %.1f kW out, %.1f kW in (0 = unlimited)",
                         s.battery.max_discharge_power_w / 1000.0, s.battery.max_charge_power_w / 1000.0);
            }
        } else {
            LOG_INFO("Source %s: %s tank", s.name.c_str(), plant::to_string(s.tank.fuel));
        }
    }
    for (const auto& c : converters) {
        LOG_INFO("Converter %s: %s", c.name.c_str(), c.type.c_str());
    }
    LOG_INFO("Brakes: %.0f Nm, ECU: %s", brakes.max_torque_nm, ecu.type.c_str());
    LOG_INFO("========================================");
}

std::unique_ptr<plant::Vehicle> VehicleConfig::build(std::unique_ptr<plant::Ecu> ecu_override) const {
    validate();

    plant::VehicleBuilder b(name);

    for (const auto& s : sources) {
        if (s.type == "battery") {
            b.add_source(std::make_unique<plant::Battery>(s.name, s.battery));
        } else {
            b.add_source(std::make_unique<plant::FuelTank>(s.name, s.tank));
        }
    }

    for (const auto& c : converters) {
        if (c.type == "electric_motor") {
            b.add_converter(std::make_unique<plant::ElectricMotor>(c.name, c.motor, c.efficiency.make(),
                                                                   c.regen_efficiency.make()));
        } else if (c.type == "gearbox" || c.type == "differential") {
            b.add_converter(std::make_unique<plant::GearStage>(c.name, c.gears));
        } else if (c.type == "combustion_engine") {
            b.add_converter(std::make_unique<plant::CombustionEngine>(c.name, c.engine, c.efficiency.make()));
        } else if (c.type == "fuel_cell") {
            b.add_converter(std::make_unique<plant::FuelCell>(c.name, c.fuel_cell, c.efficiency.make()));
        } else {
            b.add_converter(std::make_unique<plant::PowerElectronics>(c.name, c.power_electronics,
                                                                      c.efficiency.make(),
                                                                      c.regen_efficiency.make()));
        }
    }

    for (const auto& j : junctions) {
        b.add_junction(j.name, j.domain, j.bus_voltage_v);
    }
    for (const auto& l : links) {
        b.connect(l.from, l.to, l.weight);
    }

    b.set_body(body);
    b.set_brakes(brakes);

    if (ecu_override) {
        b.set_ecu(std::move(ecu_override));
    } else if (ecu.type == "pedal") {
        b.set_ecu(std::make_unique<plant::PedalEcu>(ecu.pedal));
    } else {
        throw std::runtime_error("[VehicleConfig] ECU type '" + ecu.type +
                                 "' must be supplied to build() by the caller");
    }

    return b.build();
}

} // namespace config
