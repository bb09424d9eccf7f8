// src/plant/vehicle.cpp
#include "plant/vehicle.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace plant {

// ============================================================================
// Vehicle
// ============================================================================

Vehicle::Vehicle(std::string name,
                 std::unique_ptr<DriveTrain> drive_train,
                 const BodyParams& body,
                 std::vector<std::unique_ptr<EnergySource>> sources,
                 std::unique_ptr<Ecu> ecu)
    : name_(std::move(name)),
      drive_train_(std::move(drive_train)),
      body_(body),
      sources_(std::move(sources)),
      ecu_(std::move(ecu)) {}

MeasuredState Vehicle::measure(std::size_t step, double time_s) const {
    MeasuredState m;
    m.step = step;
    m.time_s = time_s;
    m.velocity_mps = body_.velocity_mps();
    m.acceleration_mps2 = body_.acceleration_mps2();
    m.position_m = body_.position_m();
    m.wheel_speed_radps = body_.wheel_speed_radps();
    m.source_fractions.reserve(sources_.size());
    for (const auto& s : sources_) {
        m.source_fractions.push_back(s->fraction());
    }
    return m;
}

// ============================================================================
// VehicleBuilder
// ============================================================================

VehicleBuilder::VehicleBuilder(std::string name)
    : name_(std::move(name)),
      drive_train_(std::make_unique<DriveTrain>()) {}

void VehicleBuilder::require_open() const {
    if (built_) {
        throw std::logic_error("VehicleBuilder: build() already called");
    }
}

NodeId VehicleBuilder::add_source(std::unique_ptr<EnergySource> source) {
    require_open();
    if (!source) {
        throw ConnectivityError("null energy source");
    }
    const Domain d = source->output_domain();
    const NodeId id = drive_train_->add_node(NodeKind::Source, sources_.size(), source->name(), d, d);
    LOG_DEBUG("[VehicleBuilder] Source '%s' (%s) -> node %zu", source->name().c_str(), to_string(d), id);
    sources_.push_back(std::move(source));
    return id;
}

NodeId VehicleBuilder::add_converter(std::unique_ptr<Converter> converter) {
    require_open();
    if (!converter) {
        throw ConnectivityError("null converter");
    }
    const NodeId id = drive_train_->add_node(NodeKind::Converter, drive_train_->converters_.size(),
                                             converter->name(), converter->input_domain(),
                                             converter->output_domain());
    LOG_DEBUG("[VehicleBuilder] Converter '%s' (%s -> %s) -> node %zu", converter->name().c_str(),
              to_string(converter->input_domain()), to_string(converter->output_domain()), id);
    drive_train_->converters_.push_back(std::move(converter));
    return id;
}

NodeId VehicleBuilder::add_junction(const std::string& name, Domain domain, double bus_voltage_v) {
    require_open();
    if (bus_voltage_v < 0.0) {
        throw ConnectivityError("junction '" + name + "' has a negative bus voltage");
    }
    const NodeId id = drive_train_->add_node(NodeKind::Junction, drive_train_->junctions_.size(),
                                             name, domain, domain);
    drive_train_->junctions_.push_back(Junction{name, domain, bus_voltage_v});
    LOG_DEBUG("[VehicleBuilder] Junction '%s' (%s) -> node %zu", name.c_str(), to_string(domain), id);
    return id;
}

LinkId VehicleBuilder::connect(NodeId from, NodeId to, double weight) {
    require_open();
    return drive_train_->connect(from, to, weight);
}

NodeId VehicleBuilder::require(const std::string& name) const {
    const auto id = drive_train_->find_node(name);
    if (!id) {
        throw ConnectivityError("unknown component '" + name + "'");
    }
    return *id;
}

VehicleBuilder& VehicleBuilder::connect(const std::string& from, const std::string& to, double weight) {
    connect(require(from), require(to), weight);
    return *this;
}

VehicleBuilder& VehicleBuilder::set_body(const BodyParams& params) {
    require_open();
    body_ = params;
    return *this;
}

VehicleBuilder& VehicleBuilder::set_brakes(const BrakesParams& params, const std::string& name) {
    require_open();
    drive_train_->brakes_ = Brakes(name, params);
    return *this;
}

VehicleBuilder& VehicleBuilder::set_ecu(std::unique_ptr<Ecu> ecu) {
    require_open();
    ecu_ = std::move(ecu);
    return *this;
}

std::optional<NodeId> VehicleBuilder::find(const std::string& name) const {
    return drive_train_->find_node(name);
}

std::unique_ptr<Vehicle> VehicleBuilder::build() {
    require_open();
    if (!ecu_) {
        throw ConnectivityError("vehicle '" + name_ + "' has no ECU");
    }

    drive_train_->validate();
    drive_train_->normalize_weights();
    ecu_->bind(*drive_train_);

    LOG_INFO("[VehicleBuilder] '%s': %zu sources, %zu converters, %zu junctions, %zu links, ECU %s",
             name_.c_str(), sources_.size(), drive_train_->converter_count(),
             drive_train_->junction_count(), drive_train_->links().size(), ecu_->name().c_str());
    LOG_DEBUG("[VehicleBuilder] Topology:\n%s", drive_train_->describe().c_str());

    built_ = true;
    return std::unique_ptr<Vehicle>(new Vehicle(name_, std::move(drive_train_), body_,
                                                std::move(sources_), std::move(ecu_)));
}

} // namespace plant
