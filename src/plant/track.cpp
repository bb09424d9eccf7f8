// src/plant/track.cpp
#include "plant/track.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace plant {

SectionTrack::SectionTrack(std::vector<TrackSection> sections)
    : sections_(std::move(sections)) {
    if (sections_.empty()) {
        throw std::invalid_argument("SectionTrack: at least one section is required");
    }
    for (const auto& s : sections_) {
        if (!(s.length_m > 0.0)) {
            throw std::invalid_argument("SectionTrack: section length must be > 0");
        }
        if (std::abs(s.slope_rad) >= utils::kPi / 2.0) {
            throw std::invalid_argument("SectionTrack: slope must be within +-90 deg");
        }
        if (s.rolling_multiplier < 0.0 || s.air_density_kgpm3 < 0.0) {
            throw std::invalid_argument("SectionTrack: multipliers must be >= 0");
        }
    }
}

TrackSample SectionTrack::sample(double position_m, double time_s) const {
    (void)time_s;
    double start = 0.0;
    const TrackSection* current = &sections_.front();
    for (const auto& s : sections_) {
        current = &s;
        if (position_m < start + s.length_m) break;
        start += s.length_m;
    }

    TrackSample out;
    out.slope_rad = current->slope_rad;
    out.rolling_multiplier = current->rolling_multiplier;
    out.air_density_kgpm3 = current->air_density_kgpm3;
    return out;
}

double SectionTrack::length_m() const {
    double total = 0.0;
    for (const auto& s : sections_) total += s.length_m;
    return total;
}

} // namespace plant
