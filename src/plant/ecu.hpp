// src/plant/ecu.hpp
#pragma once

#include "plant/converter.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace plant {

class DriveTrain;

/// Vehicle state as measured at the end of the previous step.
struct MeasuredState {
    std::size_t step = 0;
    double time_s = 0.0;
    double velocity_mps = 0.0;
    double acceleration_mps2 = 0.0;
    double position_m = 0.0;
    double wheel_speed_radps = 0.0;
    std::vector<double> source_fractions;   // per source, level / capacity
};

/**
 * CommandSet - everything the ECU asks of the vehicle for one step
 *
 * wheel_torque_nm is a request at the wheel, not a promise: the resolver
 * saturates traction to what the prime movers can deliver and hands
 * regeneration they cannot absorb to the brakes.
 */
struct CommandSet {
    double wheel_torque_nm = 0.0;   // signed; positive pushes the vehicle forward
    double brake_torque_nm = 0.0;   // direct friction brake request (magnitude)
    std::vector<ConverterCommand> converters;   // by converter index; empty = defaults
};

/// Controller interface called once per step by the simulator.
class Ecu {
public:
    virtual ~Ecu() = default;

    virtual std::string name() const = 0;

    /// Called once when the vehicle is assembled.
    virtual void bind(const DriveTrain& drive_train) { (void)drive_train; }

    /**
     * @param control_signal driver demand in [-1, 1] (negative = braking)
     * @param state          measured state from the previous step
     */
    virtual CommandSet compute(double control_signal, const MeasuredState& state) = 0;
};

// ============================================================================
// PedalEcu
// ============================================================================

struct GearShiftSchedule {
    std::string gearbox;                    // converter name; empty = no shifting
    std::vector<double> upshift_speed_mps;  // one threshold per upshift
    double hysteresis_mps = 1.0;
};

struct PedalEcuParams {
    double max_wheel_torque_nm = 3000.0;    // at control_signal = +1
    double max_braking_torque_nm = 4000.0;  // at control_signal = -1
    double standstill_speed_mps = 0.05;     // below: braking goes to the friction brakes only
    bool blend_regen = true;                // braking requested from the drivetrain first
    double regen_fade_speed_mps = 2.0;      // below: drivetrain share of braking falls with speed

    // Traction derating on a low energy store
    double derate_below_fraction = 0.0;     // 0 disables
    double derate_floor = 0.3;

    GearShiftSchedule shift;
};

/**
 * PedalEcu - maps a pedal-like control signal to wheel torque
 *
 * Positive signal requests traction. Negative signal requests braking:
 * while moving it is asked of the drivetrain as negative wheel torque
 * (regeneration first, remainder to the brakes), at standstill it goes
 * straight to the friction brakes. Below the fade speed the drivetrain
 * share shrinks in proportion to speed and the brakes take the rest, so
 * the vehicle comes to rest on friction. Optionally schedules gears by speed.
 */
class PedalEcu : public Ecu {
public:
    explicit PedalEcu(const PedalEcuParams& p = {});

    std::string name() const override { return "PedalEcu"; }
    void bind(const DriveTrain& drive_train) override;
    CommandSet compute(double control_signal, const MeasuredState& state) override;

    int current_gear() const { return gear_; }
    const PedalEcuParams& params() const { return p_; }

private:
    double derate(const MeasuredState& state) const;
    void schedule_gear(double speed_mps);

    PedalEcuParams p_;
    std::size_t converter_count_ = 0;
    std::optional<std::size_t> gearbox_;
    std::size_t gear_count_ = 0;
    int gear_ = 0;
};

} // namespace plant
