// src/config/scenario_config.cpp
#include "config/scenario_config.hpp"
#include "config/yaml_value.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace config {

ScenarioConfig ScenarioConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        throw std::runtime_error("[ScenarioConfig] File not found: " + yaml_path);
    }
    file_check.close();

    LOG_INFO("[ScenarioConfig] Loading scenario from: %s", yaml_path.c_str());

    try {
        YAML::Node config = YAML::LoadFile(yaml_path);
        if (!config["scenario"]) {
            throw std::runtime_error("missing top-level 'scenario' section");
        }
        auto s = config["scenario"];

        ScenarioConfig sc;
        sc.name = yaml_value<std::string>(s, "name", sc.name);
        sc.time_steps = yaml_value<std::size_t>(s, "time_steps", sc.time_steps);
        sc.delta_t_s = yaml_value<double>(s, "delta_t_s", sc.delta_t_s);
        sc.precision = yaml_value<int>(s, "precision", sc.precision);
        sc.load_torque_nm = yaml_value<double>(s, "load_torque_nm", sc.load_torque_nm);
        sc.log_level = utils::level_from_string(yaml_value<std::string>(s, "log_level", "info"), sc.log_level);

        // ====================================================================
        // Control signal: constant or segments
        // ====================================================================
        if (s["control_signal"]) {
            auto cs = s["control_signal"];
            if (cs.IsScalar()) {
                sc.constant_signal = cs.as<double>();
            } else {
                for (const auto& seg : cs) {
                    sc.segments.push_back(SignalSegment{seg["until_s"].as<double>(),
                                                        seg["value"].as<double>()});
                }
            }
        }

        // ====================================================================
        // Track
        // ====================================================================
        if (s["track"] && s["track"]["sections"]) {
            for (const auto& n : s["track"]["sections"]) {
                plant::TrackSection t;
                t.length_m = yaml_value<double>(n, "length_m", t.length_m);
                if (n["grade_pct"]) {
                    t.slope_rad = std::atan(n["grade_pct"].as<double>() / 100.0);
                } else {
                    t.slope_rad = yaml_value<double>(n, "slope_rad", t.slope_rad);
                }
                t.rolling_multiplier = yaml_value<double>(n, "rolling_multiplier", t.rolling_multiplier);
                t.air_density_kgpm3 = yaml_value<double>(n, "air_density_kgpm3", t.air_density_kgpm3);
                sc.track_sections.push_back(t);
            }
        }

        sc.validate();

        LOG_INFO("[ScenarioConfig] '%s': %zu steps x %.3f s, load %.1f Nm, %zu track sections",
                 sc.name.c_str(), sc.time_steps, sc.delta_t_s, sc.load_torque_nm,
                 sc.track_sections.size());
        return sc;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[ScenarioConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[ScenarioConfig] Load error: ") + e.what()
        );
    }
}

void ScenarioConfig::validate() const {
    if (time_steps == 0) {
        throw std::runtime_error("Invalid time_steps: must be > 0");
    }
    if (!(delta_t_s > 0.0)) {
        throw std::runtime_error("Invalid delta_t_s: must be > 0");
    }
    if (precision < 0) {
        throw std::runtime_error("Invalid precision: must be >= 0");
    }
    if (load_torque_nm < 0.0) {
        throw std::runtime_error("Invalid load_torque_nm: must be >= 0");
    }
    if (constant_signal < -1.0 || constant_signal > 1.0) {
        throw std::runtime_error("Invalid control_signal: must be in [-1, 1]");
    }

    double prev = 0.0;
    for (const auto& seg : segments) {
        if (seg.value < -1.0 || seg.value > 1.0) {
            throw std::runtime_error("Invalid control_signal segment value: must be in [-1, 1]");
        }
        if (seg.until_s <= prev) {
            throw std::runtime_error("Invalid control_signal segments: until_s must increase");
        }
        prev = seg.until_s;
    }

    for (const auto& t : track_sections) {
        if (t.length_m <= 0.0) {
            throw std::runtime_error("Invalid track section length_m: must be > 0");
        }
        if (t.rolling_multiplier < 0.0 || t.air_density_kgpm3 < 0.0) {
            throw std::runtime_error("Invalid track section: rolling_multiplier and air density must be >= 0");
        }
    }
}

std::vector<double> ScenarioConfig::control_signal() const {
    std::vector<double> out(time_steps, constant_signal);
    if (segments.empty()) return out;

    std::size_t seg = 0;
    for (std::size_t k = 0; k < time_steps; ++k) {
        const double t = static_cast<double>(k) * delta_t_s;
        while (seg + 1 < segments.size() && t >= segments[seg].until_s) {
            ++seg;
        }
        out[k] = segments[seg].value;
    }
    return out;
}

std::shared_ptr<const plant::Track> ScenarioConfig::make_track() const {
    if (track_sections.empty()) {
        return std::make_shared<plant::FlatTrack>();
    }
    return std::make_shared<plant::SectionTrack>(track_sections);
}

void ScenarioConfig::apply_logging() const {
    utils::set_level(log_level);
    LOG_DEBUG("[ScenarioConfig] '%s': log level %s", name.c_str(), utils::to_string(log_level));
}

} // namespace config
