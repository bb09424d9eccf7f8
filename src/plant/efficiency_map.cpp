// src/plant/efficiency_map.cpp
#include "plant/efficiency_map.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace plant {

// ============================================================================
// EfficiencyMap
// ============================================================================

EfficiencyMap EfficiencyMap::constant(double efficiency) {
    if (!(efficiency > 0.0 && efficiency <= 1.0)) {
        throw std::invalid_argument("EfficiencyMap: constant efficiency must be in (0, 1]");
    }
    EfficiencyMap m;
    m.kind_ = Kind::Constant;
    m.peak_ = EfficiencyPeak{0.0, 0.0, efficiency};
    m.min_eff_ = efficiency;
    return m;
}

EfficiencyMap EfficiencyMap::gaussian(const EfficiencyPeak& peak,
                                      double min_efficiency,
                                      double falloff_speed,
                                      double falloff_power) {
    if (!(peak.efficiency > 0.0 && peak.efficiency <= 1.0)) {
        throw std::invalid_argument("EfficiencyMap: peak efficiency must be in (0, 1]");
    }
    if (!(min_efficiency > 0.0 && min_efficiency <= peak.efficiency)) {
        throw std::invalid_argument("EfficiencyMap: min efficiency must be in (0, peak]");
    }
    if (falloff_speed < 0.0 || falloff_power < 0.0) {
        throw std::invalid_argument("EfficiencyMap: falloff rates must be >= 0");
    }
    EfficiencyMap m;
    m.kind_ = Kind::Gaussian;
    m.peak_ = peak;
    m.min_eff_ = min_efficiency;
    m.falloff_speed_ = falloff_speed;
    m.falloff_power_ = falloff_power;
    return m;
}

double EfficiencyMap::evaluate(double speed_rpm, double power_w) const {
    if (kind_ == Kind::Constant) {
        return peak_.efficiency;
    }

    const double ds = std::abs(speed_rpm) - peak_.speed_rpm;
    const double dp = std::abs(power_w) - peak_.power_w;
    const double eta = peak_.efficiency *
        std::exp(-falloff_speed_ * ds * ds - falloff_power_ * dp * dp);
    return std::max(eta, min_eff_);
}

// ============================================================================
// MaxPowerCurve
// ============================================================================

MaxPowerCurve MaxPowerCurve::electric(double base_rpm, double max_rpm, double max_power_w) {
    if (base_rpm <= 0.0 || max_rpm <= base_rpm || max_power_w <= 0.0) {
        throw std::invalid_argument("MaxPowerCurve: electric curve needs 0 < base_rpm < max_rpm and power > 0");
    }
    MaxPowerCurve c;
    c.kind_ = Kind::Electric;
    c.base_rpm_ = base_rpm;
    c.min_rpm_ = 0.0;
    c.max_rpm_ = max_rpm;
    c.max_power_w_ = max_power_w;
    return c;
}

MaxPowerCurve MaxPowerCurve::combustion(const PowerPoint& idle,
                                        const PowerPoint& peak,
                                        const PowerPoint& max) {
    if (!(idle.speed_rpm > 0.0 && idle.speed_rpm < peak.speed_rpm && peak.speed_rpm < max.speed_rpm)) {
        throw std::invalid_argument("MaxPowerCurve: combustion curve needs idle < peak < max speed");
    }
    if (!(idle.power_w < peak.power_w && max.power_w < peak.power_w) ||
        idle.power_w < 0.0 || max.power_w < 0.0) {
        throw std::invalid_argument("MaxPowerCurve: combustion peak power must exceed idle and max-speed power");
    }

    MaxPowerCurve c;
    c.kind_ = Kind::Combustion;
    c.min_rpm_ = idle.speed_rpm;
    c.max_rpm_ = max.speed_rpm;
    c.peak_rpm_ = peak.speed_rpm;
    c.max_power_w_ = peak.power_w;

    // Each side passes through its end point at one standard deviation.
    const double e = std::exp(-0.5) - 1.0;
    c.a1_ = 0.5 / ((peak.speed_rpm - idle.speed_rpm) * (peak.speed_rpm - idle.speed_rpm));
    c.k2_ = (idle.power_w - peak.power_w) / e;
    c.k1_ = peak.power_w - c.k2_;
    c.a2_ = 0.5 / ((peak.speed_rpm - max.speed_rpm) * (peak.speed_rpm - max.speed_rpm));
    c.k4_ = (max.power_w - peak.power_w) / e;
    c.k3_ = peak.power_w - c.k4_;
    return c;
}

double MaxPowerCurve::evaluate(double speed_rpm) const {
    if (max_power_w_ <= 0.0) return 0.0; // default-constructed curve
    const double rpm = std::abs(speed_rpm);
    if (rpm < min_rpm_ || rpm > max_rpm_) return 0.0;

    switch (kind_) {
        case Kind::Electric:
            return (rpm <= base_rpm_) ? max_power_w_ * rpm / base_rpm_ : max_power_w_;
        case Kind::Combustion: {
            const double d = rpm - peak_rpm_;
            if (rpm <= peak_rpm_) return k1_ + k2_ * std::exp(-a1_ * d * d);
            return k3_ + k4_ * std::exp(-a2_ * d * d);
        }
    }
    return 0.0;
}

double MaxPowerCurve::max_torque(double speed_rpm) const {
    if (max_power_w_ <= 0.0) return 0.0;
    const double rpm = std::abs(speed_rpm);
    if (rpm > max_rpm_) return 0.0;

    if (kind_ == Kind::Electric && rpm <= base_rpm_) {
        return max_power_w_ / utils::rpm_to_radps(base_rpm_);
    }
    if (rpm < min_rpm_ || rpm <= 0.0) return 0.0;
    return evaluate(rpm) / utils::rpm_to_radps(rpm);
}

} // namespace plant
