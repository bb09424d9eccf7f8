// src/sim/simulator.hpp
#pragma once

#include "plant/causality_resolver.hpp"
#include "plant/sim_errors.hpp"
#include "plant/track.hpp"
#include "plant/vehicle.hpp"
#include "sim/step_record.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sim {

enum class RunState {
    Idle,
    Running,
    Completed,
    Failed
};

const char* to_string(RunState s);

struct RunOutcome {
    RunState state = RunState::Idle;
    plant::FailureReason reason = plant::FailureReason::None;
    std::string message;
    std::optional<std::size_t> failed_step;
    std::optional<std::size_t> last_good_step;   // empty if the first step failed
};

/// External load at the wheel for step k at time t [N·m, >= 0].
using LoadProfile = std::function<double(std::size_t step, double t_s)>;

/**
 * Simulator - owns one vehicle and a fixed time axis
 *
 * Per step:
 *   1. ECU computes commands from control_signal[k] and the measured state
 *   2. CausalityResolver resolves and propagates the drivetrain
 *   3. Brakes take the ECU request plus curtailed regeneration
 *   4. Body integrates one step against the track and external load
 *   5. Energy sources apply their demand
 *   6. A StepRecord is appended, rounded to `precision` decimals
 *
 * A modeled failure (SimulationError) stops the run in Failed and keeps
 * every record so far. Any other exception marks the run Failed and is
 * rethrown. simulate() may only be called once.
 */
class Simulator {
public:
    /**
     * @throws std::invalid_argument on a non-positive step count or step size,
     *         a control signal of the wrong length or outside [-1, 1], a null
     *         vehicle or a negative precision
     */
    Simulator(std::string name,
              std::size_t time_steps,
              double delta_t_s,
              std::vector<double> control_signal,
              std::unique_ptr<plant::Vehicle> vehicle,
              std::shared_ptr<const plant::Track> track = nullptr,
              int precision = 6);

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    /// Run with a constant external load torque at the wheel.
    const RunOutcome& simulate(double load_torque_nm = 0.0);

    /// Run with a per-step external load torque at the wheel.
    const RunOutcome& simulate(LoadProfile load);

    RunState state() const { return outcome_.state; }
    const RunOutcome& outcome() const { return outcome_; }
    const std::vector<StepRecord>& records() const { return records_; }
    const RecordLayout& layout() const { return layout_; }

    const std::string& name() const { return name_; }
    std::size_t time_steps() const { return time_steps_; }
    double delta_t_s() const { return dt_s_; }
    int precision() const { return precision_; }
    const plant::Vehicle& vehicle() const { return *vehicle_; }
    const plant::Track& track() const { return *track_; }

private:
    StepRecord step(std::size_t k, const LoadProfile& load);
    void fail(std::size_t k, plant::FailureReason reason, const std::string& message);
    double round(double v) const;

    std::string name_;
    std::size_t time_steps_;
    double dt_s_;
    std::vector<double> control_;
    std::unique_ptr<plant::Vehicle> vehicle_;
    std::shared_ptr<const plant::Track> track_;
    int precision_;

    std::unique_ptr<plant::CausalityResolver> resolver_;
    RecordLayout layout_;
    RunOutcome outcome_;
    std::vector<StepRecord> records_;

    // Running totals, kept unrounded
    double source_energy_J_ = 0.0;
    double converter_loss_J_ = 0.0;
    double source_loss_J_ = 0.0;
    double brake_loss_J_ = 0.0;
};

} // namespace sim
