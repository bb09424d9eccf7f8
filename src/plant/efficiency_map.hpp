// src/plant/efficiency_map.hpp
#pragma once

namespace plant {

/// Point of peak efficiency on a speed/power map.
struct EfficiencyPeak {
    double speed_rpm = 3000.0;
    double power_w = 40000.0;
    double efficiency = 0.95;
};

/**
 * EfficiencyMap - efficiency as a function of the operating point
 *
 * Two shapes are supported:
 *   - constant:  eta = value everywhere
 *   - gaussian:  eta = max(peak * exp(-a_s (rpm - rpm0)^2 - a_p (P - P0)^2), min)
 *
 * Power is taken as a magnitude, so the same map serves motoring and
 * generating. The result is always in (0, 1].
 */
class EfficiencyMap {
public:
    EfficiencyMap() = default;

    static EfficiencyMap constant(double efficiency);
    static EfficiencyMap gaussian(const EfficiencyPeak& peak,
                                  double min_efficiency,
                                  double falloff_speed,
                                  double falloff_power);

    double evaluate(double speed_rpm, double power_w) const;

private:
    enum class Kind { Constant, Gaussian };

    Kind kind_ = Kind::Constant;
    EfficiencyPeak peak_{0.0, 0.0, 1.0};
    double min_eff_ = 1.0;
    double falloff_speed_ = 0.0;
    double falloff_power_ = 0.0;
};

/// Point on a max-power vs speed curve.
struct PowerPoint {
    double speed_rpm = 0.0;
    double power_w = 0.0;
};

/**
 * MaxPowerCurve - maximum shaft power available at a speed
 *
 * electric():   rises linearly to base speed, flat up to max speed
 * combustion(): two half-Gaussians joined at the peak point, between the
 *               idle point and the max-speed point
 * Outside the speed range the curve returns 0.
 */
class MaxPowerCurve {
public:
    MaxPowerCurve() = default;

    static MaxPowerCurve electric(double base_rpm, double max_rpm, double max_power_w);
    static MaxPowerCurve combustion(const PowerPoint& idle,
                                    const PowerPoint& peak,
                                    const PowerPoint& max);

    double evaluate(double speed_rpm) const;

    /**
     * Torque envelope derived from the power curve.
     * In the electric constant-torque region (below base speed) the torque
     * is P_max / w_base, so the envelope stays finite at standstill.
     */
    double max_torque(double speed_rpm) const;

private:
    enum class Kind { Electric, Combustion };

    Kind kind_ = Kind::Electric;
    double min_rpm_ = 0.0;
    double max_rpm_ = 0.0;
    double max_power_w_ = 0.0;
    double base_rpm_ = 0.0;

    // Combustion curve coefficients (low side k1/k2/a1, high side k3/k4/a2)
    double peak_rpm_ = 0.0;
    double k1_ = 0.0, k2_ = 0.0, a1_ = 0.0;
    double k3_ = 0.0, k4_ = 0.0, a2_ = 0.0;
};

} // namespace plant
