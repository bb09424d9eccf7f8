// src/plant/body.hpp
#pragma once

#include "plant/track.hpp"

namespace plant {

struct BodyParams {
    double mass_kg = 1800.0;
    double wheel_radius_m = 0.33;

    // Road loads
    double drag_coefficient = 0.30;          // Cd
    double frontal_area_m2 = 2.2;
    double rolling_resistance_coeff = 0.012; // C_rr

    double wheel_inertia_kgm2 = 3.2;         // all wheels, hubs and half-shafts
};

/// Torques acting on the wheel boundary for one step.
struct BodyLoads {
    double drivetrain_torque_nm = 0.0;     // signed, delivered by the drivetrain
    double brake_torque_nm = 0.0;          // magnitude, opposes motion
    double load_torque_nm = 0.0;           // magnitude, external resistance
    double drivetrain_inertia_kgm2 = 0.0;  // converters reflected to the wheel
    TrackSample track;
};

struct BodyStep {
    double aero_torque_nm = 0.0;
    double rolling_torque_nm = 0.0;
    double grade_torque_nm = 0.0;
    double net_torque_nm = 0.0;
    double inertia_kgm2 = 0.0;        // total, seen at the wheel
    double acceleration_mps2 = 0.0;
    bool held = false;                // friction kept the vehicle at rest
};

/**
 * Body - the driven mass and its road loads
 *
 * One longitudinal degree of freedom, integrated with semi-implicit Euler:
 *   v[k+1] = v[k] + a[k] * dt
 *   x[k+1] = x[k] + v[k+1] * dt
 *
 * Rolling resistance, brakes and the external load are Coulomb-type: at
 * rest they hold the vehicle unless the active torque exceeds them, and
 * in motion they can stop it but never reverse it within a step.
 */
class Body {
public:
    explicit Body(const BodyParams& p = {});

    BodyStep step(const BodyLoads& loads, double dt_s);

    double velocity_mps() const { return v_mps_; }
    double position_m() const { return x_m_; }
    double acceleration_mps2() const { return a_mps2_; }
    double wheel_speed_radps() const { return v_mps_ / p_.wheel_radius_m; }

    /// Inertia at the wheel: m r^2 + wheels + reflected drivetrain
    double total_inertia_kgm2(double drivetrain_inertia_kgm2) const;

    const BodyParams& params() const { return p_; }

private:
    BodyParams p_;
    double v_mps_ = 0.0;
    double x_m_ = 0.0;
    double a_mps2_ = 0.0;
};

} // namespace plant
