// test/test_simulator.cpp
/**
 * Integration Test: Simulator
 *
 * Test Coverage:
 *   1. Zero input: nothing moves, nothing is drawn
 *   2. Energy balance every step (drive, regen, brake to rest)
 *   3. Idempotence: identical runs give identical records
 *   4. Battery depletion under constant draw (Failed, partial results)
 *   5. Same run with a large battery completes, level monotonic
 *   6. Non-reversible motor: regeneration diverted to the brakes
 *   7. Engine pushed backward: OperatingPointOutOfRange
 *   8. Controller errors and invalid load profiles
 *   9. Constructor validation and single-use simulate()
 *  10. Record layout, time stamps and rounding
 *  11. Depletion of one of two packs leaves the whole vehicle untouched
 */

#include "test_helpers.hpp"

#include "plant/combustion_engine.hpp"
#include "plant/drive_train.hpp"
#include "plant/fuel_tank.hpp"
#include "plant/sim_errors.hpp"
#include "sim/simulator.hpp"
#include "sim/step_record_visitor.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace plant;
using sim::RunState;
using sim::Simulator;
using sim::StepRecord;

namespace {

std::vector<double> constant_signal(std::size_t n, double value) {
    return std::vector<double>(n, value);
}

/// Flatten every recorded field, in order, for exact comparison
std::vector<std::pair<std::string, double>> flatten(const Simulator& s) {
    std::vector<std::pair<std::string, double>> out;
    auto v = sim::make_visitor([&out](const std::string& name, double value) {
        out.emplace_back(name, value);
    });
    for (const auto& r : s.records()) r.accept_fields(v, s.layout());
    return out;
}

std::unique_ptr<Vehicle> make_ice() {
    FuelTankParams tp;
    tp.capacity_l = 40.0;

    VehicleBuilder b("ice");
    b.add_source(std::make_unique<FuelTank>("tank", tp));
    b.add_converter(std::make_unique<CombustionEngine>("engine", CombustionEngineParams{},
                                                       EfficiencyMap::constant(0.30)));
    GearStageParams gp;
    gp.ratios = {9.0};
    b.add_converter(std::make_unique<GearStage>("diff", gp));
    b.connect("tank", "engine").connect("engine", "diff").connect("diff", "body");
    b.set_ecu(std::make_unique<PedalEcu>());
    return b.build();
}

}  // namespace

// Test 1: Zero input
void test_zero_scenario(TestResult& result) {
    print_header("Test 1: Zero Input");

    Simulator s("zero", 100, 0.1, constant_signal(100, 0.0), make_ev());
    const auto& outcome = s.simulate(0.0);

    bool still = true;
    for (const auto& r : s.records()) {
        still = still && r.v_mps == 0.0 && r.x_m == 0.0 && r.a_mps2 == 0.0 &&
                r.drivetrain_torque_nm == 0.0 && r.source_power_w == 0.0 && r.source_energy_J == 0.0;
    }
    result.check(outcome.state == RunState::Completed && s.records().size() == 100, "Run completes");
    result.check(still, "No torque, no motion, no energy drawn");
    result.check(s.records().back().sources[0].fraction == 1.0, "Battery still full");
}

// Test 2: Energy balance
void test_energy_balance(TestResult& result) {
    print_header("Test 2: Energy Balance");

    EvOptions o;
    o.initial_soc = 0.9;

    std::vector<double> signal(300, 0.0);
    for (std::size_t k = 0; k < 100; ++k) signal[k] = 0.5;
    for (std::size_t k = 100; k < 250; ++k) signal[k] = -0.5;

    Simulator s("balance", 300, 0.1, signal, make_ev(o));
    const auto& outcome = s.simulate(0.0);
    result.check(outcome.state == RunState::Completed, "Drive / brake cycle completes");

    double worst = 0.0;
    double energy = 0.0;
    bool regen_seen = false;
    for (const auto& r : s.records()) {
        const double residual = r.source_power_w - r.wheel_power_w - r.converter_loss_w - r.source_loss_w;
        worst = std::max(worst, std::abs(residual));
        worst = std::max(worst, std::abs(r.balance_error_w));
        energy += r.source_power_w * s.delta_t_s();
        regen_seen = regen_seen || r.source_power_w < 0.0;
    }
    const StepRecord& last = s.records().back();

    std::cout << "  Worst balance residual: " << worst << " W\n";
    std::cout << "  Source energy: " << last.source_energy_J << " J, brakes " << last.brake_loss_J << " J\n";
    result.check(worst < 1e-3, "Source = wheel + converter loss + source loss, every step");
    result.check(regen_seen, "Regeneration charged the battery");
    result.check(std::abs(energy - last.source_energy_J) < 1e-2, "Cumulative energy matches the step sum");
    result.check(last.v_mps == 0.0, "Vehicle brought to rest");
    result.check(last.brake_loss_J > 0.0, "Brakes dissipated energy");
}

// Test 3: Idempotence
void test_idempotence(TestResult& result) {
    print_header("Test 3: Idempotence");

    std::vector<double> signal(200, 0.3);
    for (std::size_t k = 120; k < 200; ++k) signal[k] = -0.4;

    EvOptions o;
    o.initial_soc = 0.8;
    Simulator a("run", 200, 0.05, signal, make_ev(o));
    Simulator b("run", 200, 0.05, signal, make_ev(o));
    a.simulate(50.0);
    b.simulate(50.0);

    const auto fa = flatten(a);
    const auto fb = flatten(b);
    result.check(!fa.empty() && fa == fb, "Identical inputs give identical records");
}

// Test 4: Depletion
void test_depletion(TestResult& result) {
    print_header("Test 4: Depletion Under Constant Draw");

    EvOptions o;
    o.capacity_kWh = 0.001;
    o.reversible = false;

    Simulator s("depletion", 300, 0.1, constant_signal(300, 0.1), make_ev(o));
    const auto& outcome = s.simulate(100.0);

    std::cout << "  Outcome: " << sim::to_string(outcome.state) << " ("
              << to_string(outcome.reason) << ") " << outcome.message << "\n";
    result.check(outcome.state == RunState::Failed && outcome.reason == FailureReason::Depletion,
                 "Run fails with DepletionError");
    result.check(outcome.failed_step.has_value() && *outcome.failed_step > 0, "Failing step recorded");
    result.check(outcome.last_good_step && *outcome.last_good_step + 1 == *outcome.failed_step,
                 "Last good step precedes the failure");
    result.check(s.records().size() == *outcome.failed_step, "Partial results retained up to the failure");

    bool monotonic = !s.records().empty();
    double prev = monotonic ? s.records().front().sources[0].level : 0.0;
    for (const auto& r : s.records()) {
        monotonic = monotonic && r.sources[0].level <= prev && r.sources[0].level >= 0.0;
        prev = r.sources[0].level;
    }
    result.check(monotonic, "Battery level non-increasing and never negative");
    result.check(s.state() == RunState::Failed, "Simulator left in Failed");
}

// Test 5: Same scenario, enough energy
void test_completes(TestResult& result) {
    print_header("Test 5: Constant Draw, Large Battery");

    EvOptions o;
    o.reversible = false;

    Simulator s("cruise", 300, 0.1, constant_signal(300, 0.1), make_ev(o));
    const auto& outcome = s.simulate(100.0);

    bool monotonic = true;
    double prev = 1.0;
    for (const auto& r : s.records()) {
        monotonic = monotonic && r.sources[0].fraction <= prev;
        prev = r.sources[0].fraction;
    }
    const StepRecord& last = s.records().back();
    std::cout << "  After 30 s: v=" << last.v_mps << " m/s, SOC " << last.sources[0].fraction << "\n";
    result.check(outcome.state == RunState::Completed && s.records().size() == 300, "Run completes");
    result.check(outcome.last_good_step && *outcome.last_good_step == 299, "Last good step is the final step");
    result.check(monotonic && last.sources[0].fraction < 1.0, "Battery depletes monotonically");
    result.check(last.v_mps > 0.0 && last.load_torque_nm == 100.0, "Vehicle moves against the load");
}

// Test 6: Non-reversible regeneration
void test_non_reversible_regen(TestResult& result) {
    print_header("Test 6: Non-Reversible Regeneration");

    EvOptions o;
    o.reversible = false;

    std::vector<double> signal(150, 0.4);
    for (std::size_t k = 80; k < 150; ++k) signal[k] = -0.3;

    Simulator s("no_regen", 150, 0.1, signal, make_ev(o));
    const auto& outcome = s.simulate(0.0);

    bool violations = false;
    bool charged = false;
    bool diverted = false;
    for (const auto& r : s.records()) {
        violations = violations || (!r.violations.empty() && r.violations[0].component == "motor");
        charged = charged || r.sources[0].terminal_power_w < 0.0;
        diverted = diverted || (r.diverted_torque_nm > 0.0 && r.brake_torque_nm > 0.0);
    }
    result.check(outcome.state == RunState::Completed, "Violation is not fatal");
    result.check(violations, "ReversibilityViolation recorded");
    result.check(diverted, "Regeneration handed to the brakes");
    result.check(!charged, "Battery never charged");
}

// Test 7: Engine out of range
void test_engine_out_of_range(TestResult& result) {
    print_header("Test 7: Engine Pushed Backward");

    plant::TrackSection hill;
    hill.length_m = 1000.0;
    hill.slope_rad = std::atan(0.20);
    auto track = std::make_shared<plant::SectionTrack>(std::vector<plant::TrackSection>{hill});

    Simulator s("rollback", 50, 0.1, constant_signal(50, 0.0), make_ice(), track);
    const auto& outcome = s.simulate(0.0);

    std::cout << "  " << outcome.message << "\n";
    result.check(outcome.state == RunState::Failed &&
                 outcome.reason == FailureReason::OperatingPointOutOfRange,
                 "Rolling back drives the engine out of its domain");
    result.check(outcome.failed_step && *outcome.failed_step == 1, "Failure on the first step with reverse speed");
    result.check(s.records().size() == 1 && s.records()[0].v_mps < 0.0, "Step before the failure retained");
}

// Test 8: Controller and load errors
void test_controller_errors(TestResult& result) {
    print_header("Test 8: Controller and Load Errors");

    VehicleBuilder b("bad_ecu");
    b.add_source(std::make_unique<Battery>("battery"));
    b.add_converter(std::make_unique<ElectricMotor>("motor", ElectricMotorParams{},
                                                    EfficiencyMap::constant(0.9), EfficiencyMap::constant(0.9)));
    b.connect("battery", "motor").connect("motor", "body");
    CommandSet bad;
    bad.brake_torque_nm = -1.0;
    b.set_ecu(std::make_unique<FixedEcu>(bad));

    Simulator s("bad_ecu", 10, 0.1, constant_signal(10, 0.0), b.build());
    const auto& outcome = s.simulate(0.0);
    result.check(outcome.state == RunState::Failed && outcome.reason == FailureReason::Controller,
                 "Invalid command fails the run with ControllerError");
    result.check(outcome.failed_step && *outcome.failed_step == 0 && !outcome.last_good_step,
                 "No good step when the first step fails");
    result.check(s.records().empty(), "No records");

    Simulator p("bad_load", 10, 0.1, constant_signal(10, 0.2), make_ev());
    bool rethrown = false;
    try {
        p.simulate([](std::size_t k, double) { return (k < 5) ? 10.0 : -1.0; });
    } catch (const std::invalid_argument&) {
        rethrown = true;
    }
    result.check(rethrown, "Negative load from a profile is rethrown");
    result.check(p.state() == RunState::Failed && p.outcome().reason == FailureReason::None &&
                 p.records().size() == 5, "Run marked Failed with the records so far");

    Simulator q("neg", 10, 0.1, constant_signal(10, 0.0), make_ev());
    bool threw = false;
    try {
        q.simulate(-5.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    result.check(threw && q.state() == RunState::Idle, "Negative constant load rejected before the run");
}

// Test 9: Construction and single use
void test_construction(TestResult& result) {
    print_header("Test 9: Construction and Single Use");

    auto rejects = [](std::size_t n, double dt, std::vector<double> sig, bool with_vehicle, int precision) {
        try {
            Simulator s("x", n, dt, std::move(sig), with_vehicle ? make_ev() : nullptr, nullptr, precision);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };

    result.check(rejects(0, 0.1, {}, true, 6), "Zero steps rejected");
    result.check(rejects(10, 0.0, constant_signal(10, 0.0), true, 6), "Zero step size rejected");
    result.check(rejects(10, 0.1, constant_signal(9, 0.0), true, 6), "Signal length mismatch rejected");
    result.check(rejects(10, 0.1, constant_signal(10, 1.5), true, 6), "Signal outside [-1, 1] rejected");
    result.check(rejects(10, 0.1, constant_signal(10, 0.0), false, 6), "Null vehicle rejected");
    result.check(rejects(10, 0.1, constant_signal(10, 0.0), true, -1), "Negative precision rejected");

    Simulator s("once", 10, 0.1, constant_signal(10, 0.1), make_ev());
    result.check(s.state() == RunState::Idle && s.track().name() == "flat", "Idle with a flat track by default");
    s.simulate(0.0);
    bool threw = false;
    try {
        s.simulate(0.0);
    } catch (const std::logic_error&) {
        threw = true;
    }
    result.check(threw && s.records().size() == 10, "Second simulate() refused, records kept");
}

// Test 10: Records
void test_records(TestResult& result) {
    print_header("Test 10: Record Layout and Rounding");

    Simulator s("records", 20, 0.25, constant_signal(20, 0.5), make_ev(), nullptr, 2);
    s.simulate(0.0);

    const auto& layout = s.layout();
    result.check(layout.links.size() == 3 && layout.links[0] == "battery->motor" && layout.links[2] == "diff->body",
                 "Links named from->to");
    result.check(layout.converters.size() == 2 && layout.sources.size() == 1 && layout.sources[0] == "battery",
                 "Converter and source names");

    const StepRecord& r = s.records()[3];
    result.check(r.step == 3 && r.t_s == 1.0, "Record stamped at the end of its step");

    bool rounded = true;
    for (const auto& rec : s.records()) {
        for (double v : {rec.v_mps, rec.x_m, rec.source_power_w, rec.wheel_power_w}) {
            rounded = rounded && std::abs(v * 100.0 - std::round(v * 100.0)) < 1e-6;
        }
    }
    result.check(rounded, "Values rounded to the requested precision");

    std::size_t fields = 0;
    sim::FieldVisitor counter([&fields](const std::string&, double) { ++fields; });
    r.accept_fields(counter, layout);
    std::cout << "  Fields per record: " << fields << "\n";
    result.check(fields == 28 + 3 * 4 + 2 * 8 + 1 * 5, "Visitor enumerates every field");
}

// Test 11: Step atomicity over several sources
void test_atomic_depletion(TestResult& result) {
    print_header("Test 11: Partial Depletion Is Atomic");

    BatteryParams big;
    big.capacity_kWh = 60.0;
    BatteryParams tiny;
    tiny.capacity_kWh = 0.002;

    GearStageParams gp;
    gp.ratios = {9.0};

    VehicleBuilder b("two_packs");
    b.add_source(std::make_unique<Battery>("big", big));
    b.add_source(std::make_unique<Battery>("tiny", tiny));
    b.add_junction("bus", Domain::Electrical);
    b.add_converter(std::make_unique<ElectricMotor>(
        "motor", ElectricMotorParams{}, EfficiencyMap::constant(0.92), EfficiencyMap::constant(0.90)));
    b.add_converter(std::make_unique<GearStage>("diff", gp));
    b.connect("big", "bus").connect("tiny", "bus").connect("bus", "motor");
    b.connect("motor", "diff").connect("diff", "body");
    b.set_ecu(std::make_unique<PedalEcu>());

    Simulator s("two_packs", 400, 0.1, constant_signal(400, 0.5), b.build());
    const auto& outcome = s.simulate(0.0);

    std::cout << "  Outcome: " << sim::to_string(outcome.state) << " (" << to_string(outcome.reason)
              << ") " << outcome.message << "\n";
    result.check(outcome.state == RunState::Failed && outcome.reason == FailureReason::Depletion,
                 "Small pack runs out");
    if (s.records().empty()) {
        result.fail("No step completed before the failure");
        return;
    }

    const StepRecord& last = s.records().back();
    const Vehicle& v = s.vehicle();
    std::cout << "  big: " << v.source(0).level() << " J (last record " << last.sources[0].level
              << "), v: " << v.body().velocity_mps() << " m/s (last record " << last.v_mps << ")\n";

    result.check(std::abs(v.source(0).level() - last.sources[0].level) < 1e-3,
                 "Healthy pack not drained by the failing step");
    result.check(std::abs(v.source(1).level() - last.sources[1].level) < 1e-3,
                 "Depleted pack keeps its last recorded level");
    result.check(std::abs(v.body().velocity_mps() - last.v_mps) < 1e-5 &&
                 std::abs(v.body().position_m() - last.x_m) < 1e-5,
                 "Body not advanced by the failing step");
}

int main() {
    std::cout << COLOR_YELLOW << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║      Simulator Integration Tests      ║\n";
    std::cout << "╚════════════════════════════════════════╝" << COLOR_RESET << "\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;
    test_zero_scenario(result);
    test_energy_balance(result);
    test_idempotence(result);
    test_depletion(result);
    test_completes(result);
    test_non_reversible_regen(result);
    test_engine_out_of_range(result);
    test_controller_errors(result);
    test_construction(result);
    test_records(result);
    test_atomic_depletion(result);

    result.summary();
    return (result.failed == 0) ? 0 : 1;
}
