// utils/units.hpp
#pragma once

#include <cmath>

namespace utils {

constexpr double kPi = 3.14159265358979323846;
constexpr double kGravity_mps2 = 9.81;
constexpr double kAirDensity_kgpm3 = 1.225;

// Unit conversions
constexpr double kRpmToRadps = 2.0 * kPi / 60.0;
constexpr double kRadpsToRpm = 60.0 / (2.0 * kPi);
constexpr double kJoulesPerKWh = 3.6e6;

inline double rpm_to_radps(double rpm) { return rpm * kRpmToRadps; }
inline double radps_to_rpm(double w) { return w * kRadpsToRpm; }
inline double kwh_to_joules(double kwh) { return kwh * kJoulesPerKWh; }

inline double sign(double v) {
    return (v > 0.0) ? 1.0 : ((v < 0.0) ? -1.0 : 0.0);
}

/**
 * Round to a fixed number of decimal places.
 * Negative precision leaves the value untouched.
 */
inline double round_to(double v, int precision) {
    if (precision < 0 || !std::isfinite(v)) return v;
    const double scale = std::pow(10.0, precision);
    const double r = std::round(v * scale) / scale;
    return (r == 0.0) ? 0.0 : r; // no negative zero in records
}

} // namespace utils
