// test/test_scenario_config.cpp
/**
 * Unit Test: ScenarioConfig
 *
 * Test Coverage:
 *   1. Full scenario: segments, grade in percent, log level
 *   2. Constant signal and flat track defaults
 *   3. Validation errors
 *   4. Missing file is an error (no default scenario)
 *   5. Log level applied to the global logger
 */

#include "test_helpers.hpp"

#include "config/scenario_config.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* kPath = "/tmp/test_scenario.yaml";

config::ScenarioConfig load_text(const char* text) {
    std::ofstream f(kPath);
    f << text;
    f.close();
    return config::ScenarioConfig::load(kPath);
}

bool rejects(const char* text, const std::string& needle) {
    bool ok = false;
    try {
        load_text(text);
    } catch (const std::runtime_error& e) {
        std::cout << "  " << e.what() << "\n";
        ok = std::string(e.what()).find(needle) != std::string::npos;
    }
    std::remove(kPath);
    return ok;
}

} // namespace

// Test 1: Full scenario
void test_full_scenario(TestResult& result) {
    print_header("Test 1: Full Scenario");

    try {
        auto sc = load_text(R"(
scenario:
  name: hill_start
  time_steps: 10
  delta_t_s: 0.5
  precision: 3
  load_torque_nm: 25.0
  log_level: debug
  control_signal:
    - {until_s: 1.0, value: 0.6}
    - {until_s: 3.0, value: -0.2}
  track:
    sections:
      - {length_m: 100.0}
      - {length_m: 50.0, grade_pct: 4.0, rolling_multiplier: 1.2}
      - {length_m: 80.0, slope_rad: -0.01}
)");
        std::remove(kPath);

        result.check(sc.name == "hill_start" && sc.time_steps == 10 && is_close(sc.delta_t_s, 0.5) &&
                     sc.precision == 3, "Time axis loaded");
        result.check(is_close(sc.load_torque_nm, 25.0), "Load torque loaded");
        result.check(sc.log_level == utils::LogLevel::Debug, "Log level parsed");

        const auto signal = sc.control_signal();
        result.check(signal.size() == 10, "One signal sample per step");
        result.check(signal[0] == 0.6 && signal[1] == 0.6, "First segment held before 1.0 s");
        result.check(signal[2] == -0.2 && signal[5] == -0.2, "Second segment from 1.0 s");
        result.check(signal[6] == -0.2 && signal[9] == -0.2, "Last value held past the final segment");

        result.check(sc.track_sections.size() == 3, "Track sections loaded");
        result.check(is_close(sc.track_sections[1].slope_rad, std::atan(0.04)), "Grade converted to slope");
        result.check(is_close(sc.track_sections[2].slope_rad, -0.01), "Slope in radians accepted");

        auto track = sc.make_track();
        result.check(track->name() == "sections" && is_close(track->sample(120.0, 0.0).rolling_multiplier, 1.2),
                     "Section track built");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }
}

// Test 2: Defaults
void test_defaults(TestResult& result) {
    print_header("Test 2: Constant Signal and Defaults");

    try {
        auto sc = load_text(R"(
scenario:
  control_signal: 0.25
)");
        std::remove(kPath);

        const auto signal = sc.control_signal();
        bool constant = signal.size() == sc.time_steps;
        for (double s : signal) constant = constant && s == 0.25;
        result.check(constant, "Constant signal on every step");
        result.check(sc.load_torque_nm == 0.0 && sc.log_level == utils::LogLevel::Info, "Defaults kept");
        result.check(sc.make_track()->name() == "flat", "No sections: flat track");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }
}

// Test 3: Validation
void test_validation(TestResult& result) {
    print_header("Test 3: Validation");

    result.check(rejects("scenario: {time_steps: 0}\n", "time_steps"), "Zero steps rejected");
    result.check(rejects("scenario: {delta_t_s: 0.0}\n", "delta_t_s"), "Zero step size rejected");
    result.check(rejects("scenario: {precision: -2}\n", "precision"), "Negative precision rejected");
    result.check(rejects("scenario: {load_torque_nm: -10}\n", "load_torque_nm"), "Negative load rejected");
    result.check(rejects("scenario: {control_signal: 1.5}\n", "control_signal"), "Signal above 1 rejected");
    result.check(rejects(R"(
scenario:
  control_signal:
    - {until_s: 2.0, value: 0.1}
    - {until_s: 2.0, value: 0.2}
)", "until_s"), "Non-increasing segments rejected");
    result.check(rejects(R"(
scenario:
  track:
    sections: [{length_m: 0.0}]
)", "length_m"), "Zero-length section rejected");
    result.check(rejects("run: {}\n", "scenario"), "Missing scenario section reported");
    result.check(rejects("scenario: {time_steps: many}\n", "YAML parse error"), "Bad number reported");
}

// Test 4: Missing file
void test_missing_file(TestResult& result) {
    print_header("Test 4: Missing File");

    bool threw = false;
    try {
        config::ScenarioConfig::load("/tmp/nonexistent_scenario.yaml");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("File not found") != std::string::npos;
    }
    result.check(threw, "Missing scenario file is an error");
}

// Test 5: Log level
void test_apply_logging(TestResult& result) {
    print_header("Test 5: Apply Log Level");

    try {
        auto sc = load_text("scenario: {log_level: warn}\n");
        std::remove(kPath);

        utils::set_level(utils::LogLevel::Error);
        sc.apply_logging();
        result.check(utils::global_level() == utils::LogLevel::Warn, "Scenario level installed");

        std::vector<std::string> seen;
        utils::set_sink([&seen](utils::LogLevel, const char* msg) { seen.push_back(msg); });
        LOG_INFO("[Test] below threshold");
        LOG_WARN("[Test] at threshold");
        utils::set_sink(nullptr);
        result.check(seen.size() == 1 && seen[0].find("at threshold") != std::string::npos,
                     "Messages filtered by the scenario level");

        auto quiet = load_text("scenario: {log_level: off}\n");
        std::remove(kPath);
        quiet.apply_logging();
        result.check(utils::global_level() == utils::LogLevel::Off, "Level 'off' installed");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }
    utils::set_level(utils::LogLevel::Error);
}

int main() {
    std::cout << COLOR_YELLOW << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║       ScenarioConfig Unit Tests       ║\n";
    std::cout << "╚════════════════════════════════════════╝" << COLOR_RESET << "\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;
    test_full_scenario(result);
    test_defaults(result);
    test_validation(result);
    test_missing_file(result);
    test_apply_logging(result);

    result.summary();
    return (result.failed == 0) ? 0 : 1;
}
