// src/sim/simulator.cpp
#include "sim/simulator.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace sim {

namespace {
// Balance residual reported at DEBUG above this share of the step's source power
constexpr double kBalanceRelTolerance = 1e-6;
}

const char* to_string(RunState s) {
    switch (s) {
        case RunState::Idle:      return "Idle";
        case RunState::Running:   return "Running";
        case RunState::Completed: return "Completed";
        case RunState::Failed:    return "Failed";
    }
    return "unknown";
}

Simulator::Simulator(std::string name,
                     std::size_t time_steps,
                     double delta_t_s,
                     std::vector<double> control_signal,
                     std::unique_ptr<plant::Vehicle> vehicle,
                     std::shared_ptr<const plant::Track> track,
                     int precision)
    : name_(std::move(name)),
      time_steps_(time_steps),
      dt_s_(delta_t_s),
      control_(std::move(control_signal)),
      vehicle_(std::move(vehicle)),
      track_(std::move(track)),
      precision_(precision) {
    if (time_steps_ == 0) {
        throw std::invalid_argument("Simulator: time_steps must be > 0");
    }
    if (!(dt_s_ > 0.0) || !std::isfinite(dt_s_)) {
        throw std::invalid_argument("Simulator: delta_t must be > 0");
    }
    if (control_.size() != time_steps_) {
        throw std::invalid_argument("Simulator: control signal has " + std::to_string(control_.size()) +
                                    " entries, expected " + std::to_string(time_steps_));
    }
    for (std::size_t k = 0; k < control_.size(); ++k) {
        if (!(control_[k] >= -1.0 && control_[k] <= 1.0)) {
            throw std::invalid_argument("Simulator: control signal[" + std::to_string(k) +
                                        "] outside [-1, 1]");
        }
    }
    if (!vehicle_) {
        throw std::invalid_argument("Simulator: vehicle is null");
    }
    if (precision_ < 0) {
        throw std::invalid_argument("Simulator: precision must be >= 0");
    }
    if (!track_) {
        track_ = std::make_shared<plant::FlatTrack>();
    }

    resolver_ = std::make_unique<plant::CausalityResolver>(*vehicle_);

    const plant::DriveTrain& dt = vehicle_->drive_train();
    for (const auto& l : dt.links()) {
        layout_.links.push_back(dt.node(l.from).name + "->" + dt.node(l.to).name);
    }
    for (std::size_t i = 0; i < dt.converter_count(); ++i) {
        layout_.converters.push_back(dt.converter(i).name());
    }
    for (std::size_t i = 0; i < vehicle_->source_count(); ++i) {
        layout_.sources.push_back(vehicle_->source(i).name());
    }
}

double Simulator::round(double v) const {
    return utils::round_to(v, precision_);
}

const RunOutcome& Simulator::simulate(double load_torque_nm) {
    if (!(load_torque_nm >= 0.0) || !std::isfinite(load_torque_nm)) {
        throw std::invalid_argument("Simulator: load torque must be >= 0");
    }
    return simulate([load_torque_nm](std::size_t, double) { return load_torque_nm; });
}

const RunOutcome& Simulator::simulate(LoadProfile load) {
    if (outcome_.state != RunState::Idle) {
        throw std::logic_error("Simulator '" + name_ + "': simulate() already called");
    }
    if (!load) {
        throw std::invalid_argument("Simulator: load profile is empty");
    }

    outcome_.state = RunState::Running;
    records_.reserve(time_steps_);

    LOG_INFO("[Simulator] '%s': %zu steps x %.4f s, vehicle '%s', track '%s'",
             name_.c_str(), time_steps_, dt_s_, vehicle_->name().c_str(), track_->name().c_str());

    std::size_t k = 0;
    try {
        for (; k < time_steps_; ++k) {
            records_.push_back(step(k, load));
        }
    } catch (const plant::SimulationError& e) {
        fail(k, e.reason(), e.what());
        return outcome_;
    } catch (const std::exception& e) {
        fail(k, plant::FailureReason::None, e.what());
        throw;
    }

    outcome_.state = RunState::Completed;
    outcome_.last_good_step = time_steps_ - 1;

    const StepRecord& last = records_.back();
    LOG_INFO("[Simulator] '%s' completed: v=%.2f m/s, x=%.1f m, source energy %.1f kJ, "
             "converter loss %.1f kJ, brake loss %.1f kJ",
             name_.c_str(), last.v_mps, last.x_m, source_energy_J_ / 1000.0,
             converter_loss_J_ / 1000.0, brake_loss_J_ / 1000.0);
    return outcome_;
}

void Simulator::fail(std::size_t k, plant::FailureReason reason, const std::string& message) {
    outcome_.state = RunState::Failed;
    outcome_.reason = reason;
    outcome_.message = message;
    outcome_.failed_step = k;
    if (k > 0) outcome_.last_good_step = k - 1;

    LOG_ERROR("[Simulator] '%s' failed at step %zu (t=%.3f s): %s",
              name_.c_str(), k, static_cast<double>(k) * dt_s_, message.c_str());
}

// ============================================================================
// One step
// ============================================================================

StepRecord Simulator::step(std::size_t k, const LoadProfile& load) {
    plant::Body& body = vehicle_->body();
    plant::Brakes& brakes = vehicle_->drive_train().brakes();
    const double t0 = static_cast<double>(k) * dt_s_;

    // 1. ECU
    const plant::MeasuredState measured = vehicle_->measure(k, t0);
    const plant::CommandSet cmd = vehicle_->ecu().compute(control_[k], measured);
    if (!std::isfinite(cmd.wheel_torque_nm) || !std::isfinite(cmd.brake_torque_nm) ||
        cmd.brake_torque_nm < 0.0) {
        throw plant::ControllerError("invalid command at step " + std::to_string(k));
    }

    // 2. Drivetrain
    const double w0 = body.wheel_speed_radps();
    const plant::Resolution res = resolver_->resolve(cmd, w0);

    const double load_nm = load(k, t0);
    if (!(load_nm >= 0.0) || !std::isfinite(load_nm)) {
        throw std::invalid_argument("Simulator: load profile returned " + std::to_string(load_nm) +
                                    " N·m at step " + std::to_string(k));
    }
    const plant::TrackSample track = track_->sample(body.position_m(), t0);

    // Every source must cover its demand before any state moves
    for (std::size_t i = 0; i < vehicle_->source_count(); ++i) {
        vehicle_->source(i).check(res.source_demand_w[i], dt_s_);
    }

    // 3. Brakes
    const double brake_nm = brakes.command(cmd.brake_torque_nm + res.diverted_brake_torque_nm);

    // 4. Body

    plant::BodyLoads loads;
    loads.drivetrain_torque_nm = res.drivetrain_torque_nm;
    loads.brake_torque_nm = brake_nm;
    loads.load_torque_nm = load_nm;
    loads.drivetrain_inertia_kgm2 = res.reflected_inertia_kgm2;
    loads.track = track;
    const plant::BodyStep motion = body.step(loads, dt_s_);

    const double brake_w = brakes.dissipate(brake_nm, w0, dt_s_);

    // 5. Sources
    double source_w = 0.0;
    double source_loss_w = 0.0;
    std::vector<SourceRecord> sources;
    sources.reserve(vehicle_->source_count());
    for (std::size_t i = 0; i < vehicle_->source_count(); ++i) {
        plant::EnergySource& src = vehicle_->source(i);
        const plant::SourceUpdate u = src.apply(res.source_demand_w[i], dt_s_);
        source_w += u.stored_power_w;
        source_loss_w += u.loss_w;

        SourceRecord sr;
        sr.level = round(src.level());
        sr.fraction = round(src.fraction());
        sr.terminal_power_w = round(u.terminal_power_w);
        sr.stored_power_w = round(u.stored_power_w);
        sr.loss_w = round(u.loss_w);
        sources.push_back(sr);
    }

    // 6. Record
    double converter_loss_w = 0.0;
    StepRecord r;
    r.converters.reserve(res.converters.size());
    for (const auto& op : res.converters) {
        converter_loss_w += op.loss_w();

        ConverterRecord cr;
        cr.direction = op.direction;
        cr.speed_radps = round(op.speed_radps);
        cr.torque_nm = round(op.torque_nm);
        cr.power_in_w = round(op.power_in_w);
        cr.power_out_w = round(op.power_out_w);
        cr.efficiency = round(op.efficiency);
        cr.loss_w = round(op.loss_w());
        cr.gear = op.gear;
        r.converters.push_back(cr);
    }

    r.links.reserve(res.links.size());
    for (const auto& lf : res.links) {
        LinkRecord lr;
        lr.direction = lf.direction;
        lr.effort = round(lf.quantity.effort);
        lr.flow = round(lf.quantity.flow);
        lr.power_w = round(lf.quantity.power());
        r.links.push_back(lr);
    }

    const double wheel_w = res.wheel_power_w();
    const double balance_w = source_w - wheel_w - converter_loss_w - source_loss_w;
    if (std::abs(balance_w) > kBalanceRelTolerance * std::max(1.0, std::abs(source_w))) {
        LOG_DEBUG("[Simulator] step %zu: energy balance residual %.6f W", k, balance_w);
    }

    source_energy_J_ += source_w * dt_s_;
    converter_loss_J_ += converter_loss_w * dt_s_;
    source_loss_J_ += source_loss_w * dt_s_;
    brake_loss_J_ += brake_w * dt_s_;

    r.step = k;
    r.t_s = round(static_cast<double>(k + 1) * dt_s_);
    r.control_signal = control_[k];
    r.v_mps = round(body.velocity_mps());
    r.a_mps2 = round(body.acceleration_mps2());
    r.x_m = round(body.position_m());
    r.wheel_speed_radps = round(w0);

    r.requested_torque_nm = round(res.requested_torque_nm);
    r.drivetrain_torque_nm = round(res.drivetrain_torque_nm);
    r.brake_torque_nm = round(brake_nm);
    r.diverted_torque_nm = round(res.diverted_brake_torque_nm);
    r.load_torque_nm = round(load_nm);
    r.aero_torque_nm = round(motion.aero_torque_nm);
    r.rolling_torque_nm = round(motion.rolling_torque_nm);
    r.grade_torque_nm = round(motion.grade_torque_nm);
    r.slope_rad = round(track.slope_rad);
    r.inertia_kgm2 = round(motion.inertia_kgm2);

    r.wheel_power_w = round(wheel_w);
    r.brake_power_w = round(brake_w);
    r.source_power_w = round(source_w);
    r.converter_loss_w = round(converter_loss_w);
    r.source_loss_w = round(source_loss_w);
    r.balance_error_w = round(balance_w);

    r.source_energy_J = round(source_energy_J_);
    r.converter_loss_J = round(converter_loss_J_);
    r.source_loss_J = round(source_loss_J_);
    r.brake_loss_J = round(brake_loss_J_);

    r.sources = std::move(sources);
    r.violations = res.violations;
    return r;
}

} // namespace sim
