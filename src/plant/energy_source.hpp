// src/plant/energy_source.hpp
#pragma once

#include "plant/quantity.hpp"
#include <limits>
#include <string>
#include <utility>

namespace plant {

/**
 * Result of applying one step of demand to a source.
 *
 * terminal_power_w: power at the output port (positive = discharge)
 * stored_power_w:   rate of change of the stored energy (positive = discharge)
 * loss_w:           stored_power_w - terminal_power_w, never negative
 */
struct SourceUpdate {
    double terminal_power_w = 0.0;
    double stored_power_w = 0.0;
    double loss_w = 0.0;
};

/**
 * EnergySource - bounded energy store at one domain boundary
 *
 * The stored state lives in [0, capacity()] and never goes below the
 * usable floor silently: a demand that cannot be covered raises
 * DepletionError and leaves the state untouched.
 */
class EnergySource {
public:
    EnergySource(std::string name, Domain output_domain)
        : name_(std::move(name)), output_domain_(output_domain) {}
    virtual ~EnergySource() = default;

    EnergySource(const EnergySource&) = delete;
    EnergySource& operator=(const EnergySource&) = delete;

    /**
     * Apply a signed terminal power for dt seconds.
     * Positive power discharges, negative power charges.
     *
     * @throws DepletionError if the store cannot supply the demand
     */
    virtual SourceUpdate apply(double terminal_power_w, double dt_s) = 0;

    /**
     * Verify that apply() would accept this demand, without changing state.
     *
     * @throws DepletionError if the store cannot supply the demand
     */
    virtual void check(double terminal_power_w, double dt_s) const = 0;

    /// Largest terminal power the source can deliver; infinity when unlimited
    virtual double max_discharge_power_w() const { return std::numeric_limits<double>::infinity(); }

    /// Largest charging power the source accepts; infinity when unlimited
    virtual double max_charge_power_w() const { return std::numeric_limits<double>::infinity(); }

    virtual bool rechargeable() const = 0;

    /// True if negative (charging) power can be taken this step
    virtual bool can_absorb() const = 0;

    /// Stored state in the source's own unit (J for batteries, kg for tanks)
    virtual double level() const = 0;
    virtual double capacity() const = 0;

    /// Energy still stored [J]
    virtual double stored_energy_J() const = 0;

    /// Effort presented at the output port (volts or J/kg)
    virtual double output_effort() const = 0;

    double fraction() const {
        const double cap = capacity();
        return (cap > 0.0) ? level() / cap : 0.0;
    }

    const std::string& name() const { return name_; }
    Domain output_domain() const { return output_domain_; }
    const SourceUpdate& last_update() const { return last_; }

protected:
    SourceUpdate last_;

private:
    std::string name_;
    Domain output_domain_;
};

} // namespace plant
