// src/plant/track.hpp
#pragma once

#include "utils/units.hpp"
#include <string>
#include <vector>

namespace plant {

/// Terrain seen by the vehicle for one step.
struct TrackSample {
    double slope_rad = 0.0;                             // positive = uphill
    double air_density_kgpm3 = utils::kAirDensity_kgpm3;
    double rolling_multiplier = 1.0;                    // scales the body's C_rr
};

/**
 * Track - terrain collaborator
 *
 * The simulator samples it once per step at the body's position; the core
 * never models terrain itself.
 */
class Track {
public:
    virtual ~Track() = default;
    virtual TrackSample sample(double position_m, double time_s) const = 0;
    virtual std::string name() const = 0;
};

class FlatTrack : public Track {
public:
    explicit FlatTrack(const TrackSample& surface = {}) : surface_(surface) { surface_.slope_rad = 0.0; }

    TrackSample sample(double position_m, double time_s) const override {
        (void)position_m;
        (void)time_s;
        return surface_;
    }
    std::string name() const override { return "flat"; }

private:
    TrackSample surface_;
};

struct TrackSection {
    double length_m = 100.0;
    double slope_rad = 0.0;
    double rolling_multiplier = 1.0;
    double air_density_kgpm3 = utils::kAirDensity_kgpm3;
};

/**
 * SectionTrack - consecutive sections of constant grade
 *
 * Positions before the start use the first section, positions past the
 * end use the last one.
 */
class SectionTrack : public Track {
public:
    explicit SectionTrack(std::vector<TrackSection> sections);

    TrackSample sample(double position_m, double time_s) const override;
    std::string name() const override { return "sections"; }

    double length_m() const;

private:
    std::vector<TrackSection> sections_;
};

} // namespace plant
