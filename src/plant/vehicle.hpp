// src/plant/vehicle.hpp
#pragma once

#include "plant/body.hpp"
#include "plant/brakes.hpp"
#include "plant/drive_train.hpp"
#include "plant/ecu.hpp"
#include "plant/energy_source.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plant {

/**
 * Vehicle - exclusive owner of the drivetrain, body, sources and ECU
 *
 * Only VehicleBuilder creates one, so every Vehicle is fully connected.
 */
class Vehicle {
public:
    Vehicle(const Vehicle&) = delete;
    Vehicle& operator=(const Vehicle&) = delete;

    const std::string& name() const { return name_; }

    DriveTrain& drive_train() { return *drive_train_; }
    const DriveTrain& drive_train() const { return *drive_train_; }

    Body& body() { return body_; }
    const Body& body() const { return body_; }

    std::size_t source_count() const { return sources_.size(); }
    EnergySource& source(std::size_t idx) { return *sources_.at(idx); }
    const EnergySource& source(std::size_t idx) const { return *sources_.at(idx); }

    Ecu& ecu() { return *ecu_; }
    const Ecu& ecu() const { return *ecu_; }

    /// Snapshot fed to the ECU for the next step.
    MeasuredState measure(std::size_t step, double time_s) const;

private:
    friend class VehicleBuilder;

    Vehicle(std::string name,
            std::unique_ptr<DriveTrain> drive_train,
            const BodyParams& body,
            std::vector<std::unique_ptr<EnergySource>> sources,
            std::unique_ptr<Ecu> ecu);

    std::string name_;
    std::unique_ptr<DriveTrain> drive_train_;
    Body body_;
    std::vector<std::unique_ptr<EnergySource>> sources_;
    std::unique_ptr<Ecu> ecu_;
};

/**
 * VehicleBuilder - assembles and validates the component graph
 *
 * Components are added first, then linked from supply side to load side.
 * Links may be given by node id or by component name ("body" is the
 * driven body).
 *
 * Usage:
 *   VehicleBuilder b("ev");
 *   b.add_source(std::make_unique<Battery>("battery", BatteryParams{}));
 *   b.add_converter(std::make_unique<ElectricMotor>("motor", ...));
 *   b.add_converter(std::make_unique<GearStage>("diff", GearStageParams{}));
 *   b.connect("battery", "motor").connect("motor", "diff").connect("diff", "body");
 *   b.set_ecu(std::make_unique<PedalEcu>());
 *   auto vehicle = b.build();   // throws ConnectivityError on a bad graph
 */
class VehicleBuilder {
public:
    explicit VehicleBuilder(std::string name = "vehicle");

    NodeId add_source(std::unique_ptr<EnergySource> source);
    NodeId add_converter(std::unique_ptr<Converter> converter);
    NodeId add_junction(const std::string& name, Domain domain, double bus_voltage_v = 0.0);

    /// Link the output of `from` to an input of `to`; weight applies among `to`'s inputs.
    LinkId connect(NodeId from, NodeId to, double weight = 1.0);
    VehicleBuilder& connect(const std::string& from, const std::string& to, double weight = 1.0);

    VehicleBuilder& set_body(const BodyParams& params);
    VehicleBuilder& set_brakes(const BrakesParams& params, const std::string& name = "brakes");
    VehicleBuilder& set_ecu(std::unique_ptr<Ecu> ecu);

    std::optional<NodeId> find(const std::string& name) const;
    static constexpr NodeId body() { return DriveTrain::body_node(); }

    /**
     * Validate the graph, freeze it and hand ownership to a Vehicle.
     * The builder is spent afterwards.
     *
     * @throws ConnectivityError on an incomplete or inconsistent graph
     */
    std::unique_ptr<Vehicle> build();

private:
    NodeId require(const std::string& name) const;
    void require_open() const;

    std::string name_;
    std::unique_ptr<DriveTrain> drive_train_;
    BodyParams body_;
    std::vector<std::unique_ptr<EnergySource>> sources_;
    std::unique_ptr<Ecu> ecu_;
    bool built_ = false;
};

} // namespace plant
