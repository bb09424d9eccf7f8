// src/plant/body.cpp
#include "plant/body.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <cmath>
#include <stdexcept>

namespace plant {

Body::Body(const BodyParams& p) : p_(p) {
    if (p_.mass_kg <= 0.0) {
        throw std::invalid_argument("Body: mass must be > 0");
    }
    if (p_.wheel_radius_m <= 0.0) {
        throw std::invalid_argument("Body: wheel radius must be > 0");
    }
    if (p_.drag_coefficient < 0.0 || p_.frontal_area_m2 < 0.0 ||
        p_.rolling_resistance_coeff < 0.0 || p_.wheel_inertia_kgm2 < 0.0) {
        throw std::invalid_argument("Body: road load coefficients must be >= 0");
    }
}

double Body::total_inertia_kgm2(double drivetrain_inertia_kgm2) const {
    const double r = p_.wheel_radius_m;
    return p_.mass_kg * r * r + p_.wheel_inertia_kgm2 + drivetrain_inertia_kgm2;
}

BodyStep Body::step(const BodyLoads& loads, double dt_s) {
    BodyStep out;
    if (dt_s <= 0.0) return out;

    const double v = v_mps_;
    const double r = p_.wheel_radius_m;
    const double m = p_.mass_kg;
    const TrackSample& tr = loads.track;

    // --- Road loads at the wheel
    out.aero_torque_nm = 0.5 * tr.air_density_kgpm3 * p_.drag_coefficient *
                         p_.frontal_area_m2 * v * std::abs(v) * r;
    out.grade_torque_nm = m * utils::kGravity_mps2 * std::sin(tr.slope_rad) * r;
    out.rolling_torque_nm = p_.rolling_resistance_coeff * tr.rolling_multiplier *
                            m * utils::kGravity_mps2 * std::cos(tr.slope_rad) * r;

    // Active torques can drive the vehicle either way; Coulomb terms only resist
    const double active = loads.drivetrain_torque_nm - out.aero_torque_nm - out.grade_torque_nm;
    const double coulomb = out.rolling_torque_nm + loads.brake_torque_nm + loads.load_torque_nm;

    out.inertia_kgm2 = total_inertia_kgm2(loads.drivetrain_inertia_kgm2);

    double net = 0.0;
    if (v != 0.0) {
        net = active - utils::sign(v) * coulomb;
    } else if (std::abs(active) > coulomb) {
        net = active - utils::sign(active) * coulomb;
    } else {
        out.held = true;
    }

    const double a = net * r / out.inertia_kgm2;
    double v_next = v + a * dt_s;

    // Friction stopped the vehicle inside this step
    if (v != 0.0 && utils::sign(v_next) != utils::sign(v) && std::abs(active) <= coulomb) {
        v_next = 0.0;
        out.held = true;
    }

    out.net_torque_nm = net;
    out.acceleration_mps2 = (v_next - v) / dt_s;

    v_mps_ = v_next;
    x_m_ += v_next * dt_s;
    a_mps2_ = out.acceleration_mps2;

    LOG_TRACE("[Body] v=%.3f m/s, T_dt=%.1f, T_aero=%.1f, T_roll=%.1f, T_brake=%.1f, T_net=%.1f Nm",
              v_mps_, loads.drivetrain_torque_nm, out.aero_torque_nm, out.rolling_torque_nm,
              loads.brake_torque_nm, net);
    return out;
}

} // namespace plant
