// src/config/scenario_config.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "plant/track.hpp"
#include "utils/logging.hpp"

namespace config {

/// Control signal held at `value` until `until_s` (exclusive).
struct SignalSegment {
    double until_s = 0.0;
    double value = 0.0;
};

/**
 * ScenarioConfig - time axis, driver signal, load and track for one run
 *
 * YAML layout:
 *   scenario:
 *     name: hill_start
 *     time_steps: 300
 *     delta_t_s: 0.1
 *     precision: 6
 *     control_signal: 0.5              # or a list of {until_s, value}
 *     load_torque_nm: 100
 *     log_level: info
 *     track:
 *       sections:
 *         - {length_m: 200, grade_pct: 4}
 */
class ScenarioConfig {
public:
    std::string name = "default";
    std::size_t time_steps = 300;
    double delta_t_s = 0.1;
    int precision = 6;

    double constant_signal = 0.0;          // used when `segments` is empty
    std::vector<SignalSegment> segments;   // last value holds past the final segment

    double load_torque_nm = 0.0;
    std::vector<plant::TrackSection> track_sections;   // empty = flat track
    utils::LogLevel log_level = utils::LogLevel::Info;

    /**
     * Load scenario from YAML file
     * @throws std::runtime_error if file is missing or invalid
     */
    static ScenarioConfig load(const std::string& yaml_path);

    /**
     * Validate loaded parameters
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    /// Sampled control signal, one entry per step, evaluated at the step start.
    std::vector<double> control_signal() const;

    /// FlatTrack when no sections are given, SectionTrack otherwise.
    std::shared_ptr<const plant::Track> make_track() const;

    /// Install `log_level` as the process-wide logging threshold.
    void apply_logging() const;
};

} // namespace config
