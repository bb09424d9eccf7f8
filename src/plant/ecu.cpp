// src/plant/ecu.cpp
#include "plant/ecu.hpp"
#include "plant/drive_train.hpp"
#include "plant/gear_stage.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace plant {

PedalEcu::PedalEcu(const PedalEcuParams& p) : p_(p) {
    if (p_.max_wheel_torque_nm < 0.0 || p_.max_braking_torque_nm < 0.0) {
        throw std::invalid_argument("PedalEcu: torque limits must be >= 0");
    }
    if (p_.standstill_speed_mps < 0.0 || p_.regen_fade_speed_mps < 0.0) {
        throw std::invalid_argument("PedalEcu: standstill and fade speeds must be >= 0");
    }
    if (p_.derate_below_fraction < 0.0 || p_.derate_below_fraction > 1.0 ||
        p_.derate_floor < 0.0 || p_.derate_floor > 1.0) {
        throw std::invalid_argument("PedalEcu: derating fractions must be in [0, 1]");
    }
}

void PedalEcu::bind(const DriveTrain& drive_train) {
    converter_count_ = drive_train.converter_count();
    gearbox_.reset();
    gear_ = 0;

    if (p_.shift.gearbox.empty()) return;

    const auto idx = drive_train.find_converter(p_.shift.gearbox);
    if (!idx) {
        throw ConnectivityError("shift schedule names unknown gearbox '" + p_.shift.gearbox + "'");
    }
    const auto* stage = dynamic_cast<const GearStage*>(&drive_train.converter(*idx));
    if (!stage) {
        throw ConnectivityError("shift schedule target '" + p_.shift.gearbox + "' is not a gear stage");
    }
    if (p_.shift.upshift_speed_mps.size() + 1 != stage->gear_count()) {
        throw ConnectivityError("shift schedule for '" + p_.shift.gearbox + "' needs " +
                                std::to_string(stage->gear_count() - 1) + " upshift speeds");
    }

    gearbox_ = idx;
    gear_count_ = stage->gear_count();
    gear_ = stage->gear();
    LOG_INFO("[PedalEcu] Scheduling %zu gears on '%s'", gear_count_, p_.shift.gearbox.c_str());
}

double PedalEcu::derate(const MeasuredState& state) const {
    if (p_.derate_below_fraction <= 0.0 || state.source_fractions.empty()) return 1.0;

    const double lowest = *std::min_element(state.source_fractions.begin(), state.source_fractions.end());
    if (lowest >= p_.derate_below_fraction) return 1.0;

    const double t = std::clamp(lowest / p_.derate_below_fraction, 0.0, 1.0);
    return p_.derate_floor + (1.0 - p_.derate_floor) * t;
}

void PedalEcu::schedule_gear(double speed_mps) {
    const auto& up = p_.shift.upshift_speed_mps;
    const double v = std::abs(speed_mps);

    while (static_cast<std::size_t>(gear_) + 1 < gear_count_ && v > up[static_cast<std::size_t>(gear_)]) {
        ++gear_;
    }
    while (gear_ > 0 && v < up[static_cast<std::size_t>(gear_ - 1)] - p_.shift.hysteresis_mps) {
        --gear_;
    }
}

CommandSet PedalEcu::compute(double control_signal, const MeasuredState& state) {
    CommandSet cmd;
    cmd.converters.assign(converter_count_, ConverterCommand{});

    const double s = std::clamp(control_signal, -1.0, 1.0);
    const double v = state.velocity_mps;

    if (s > 0.0) {
        cmd.wheel_torque_nm = s * p_.max_wheel_torque_nm * derate(state);
    } else if (s < 0.0) {
        const double braking = -s * p_.max_braking_torque_nm;
        if (p_.blend_regen && std::abs(v) > p_.standstill_speed_mps) {
            double share = 1.0;
            if (std::abs(v) < p_.regen_fade_speed_mps) {
                share = std::abs(v) / p_.regen_fade_speed_mps;
            }
            cmd.wheel_torque_nm = -utils::sign(v) * braking * share;
            cmd.brake_torque_nm = braking * (1.0 - share);
        } else {
            cmd.brake_torque_nm = braking;
        }
    }

    if (gearbox_) {
        schedule_gear(v);
        cmd.converters[*gearbox_].gear = gear_;
    }

    LOG_TRACE("[PedalEcu] step %zu: signal=%.3f -> T_wheel=%.1f Nm, T_brake=%.1f Nm",
              state.step, s, cmd.wheel_torque_nm, cmd.brake_torque_nm);
    return cmd;
}

} // namespace plant
