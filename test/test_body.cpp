// test/test_body.cpp
/**
 * Unit Test: Body and Track
 *
 * Test Coverage:
 *   1. Vehicle at rest stays at rest without active torque
 *   2. Traction acceleration and semi-implicit Euler update
 *   3. Reflected drivetrain inertia slows acceleration
 *   4. Brakes stop the vehicle without reversing it
 *   5. Grade: held by friction on a gentle slope, rolls back on a steep one
 *   6. Section track sampling
 */

#include "test_helpers.hpp"

#include "plant/body.hpp"
#include "plant/track.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace plant;

// Test 1: Rest
void test_rest(TestResult& result) {
    print_header("Test 1: Rest");

    Body body;
    BodyLoads loads;
    bool held = true;
    for (int k = 0; k < 50; ++k) {
        held = body.step(loads, 0.1).held && held;
    }
    result.check(body.velocity_mps() == 0.0 && body.position_m() == 0.0, "No motion without torque");
    result.check(held, "Rolling resistance holds the vehicle");

    loads.drivetrain_torque_nm = 50.0;   // below rolling resistance torque
    const BodyStep s = body.step(loads, 0.1);
    result.check(s.held && body.velocity_mps() == 0.0, "Torque below breakaway does not move the vehicle");
}

// Test 2: Traction
void test_traction(TestResult& result) {
    print_header("Test 2: Traction");

    BodyParams p;
    Body body(p);
    BodyLoads loads;
    loads.drivetrain_torque_nm = 1000.0;

    const double dt = 0.1;
    const BodyStep s = body.step(loads, dt);

    const double r = p.wheel_radius_m;
    const double roll = p.rolling_resistance_coeff * p.mass_kg * utils::kGravity_mps2 * r;
    const double inertia = p.mass_kg * r * r + p.wheel_inertia_kgm2;
    const double a = (1000.0 - roll) * r / inertia;

    std::cout << "  a = " << s.acceleration_mps2 << " m/s^2 (expected " << a << ")\n";
    result.check(is_close(s.rolling_torque_nm, roll), "Rolling torque = C_rr m g r");
    result.check(s.aero_torque_nm == 0.0, "No drag at standstill");
    result.check(is_close(s.acceleration_mps2, a), "Acceleration from net torque and inertia");
    result.check(is_close(body.velocity_mps(), a * dt), "v[k+1] = v[k] + a dt");
    result.check(is_close(body.position_m(), a * dt * dt), "x[k+1] = x[k] + v[k+1] dt");

    const BodyStep s2 = body.step(loads, dt);
    result.check(s2.aero_torque_nm > 0.0, "Drag appears once moving");
}

// Test 3: Reflected inertia
void test_reflected_inertia(TestResult& result) {
    print_header("Test 3: Reflected Inertia");

    Body light;
    Body heavy;
    BodyLoads loads;
    loads.drivetrain_torque_nm = 1000.0;
    const BodyStep a = light.step(loads, 0.1);

    loads.drivetrain_inertia_kgm2 = 10.0;
    const BodyStep b = heavy.step(loads, 0.1);

    result.check(is_close(b.inertia_kgm2 - a.inertia_kgm2, 10.0), "Drivetrain inertia added at the wheel");
    result.check(b.acceleration_mps2 < a.acceleration_mps2, "More inertia, less acceleration");
}

// Test 4: Braking
void test_braking(TestResult& result) {
    print_header("Test 4: Braking");

    Body body;
    BodyLoads drive;
    drive.drivetrain_torque_nm = 2000.0;
    for (int k = 0; k < 20; ++k) body.step(drive, 0.1);
    const double v_top = body.velocity_mps();

    BodyLoads brake;
    brake.brake_torque_nm = 4000.0;
    double v_min = v_top;
    for (int k = 0; k < 100; ++k) {
        body.step(brake, 0.1);
        v_min = std::min(v_min, body.velocity_mps());
    }

    std::cout << "  v before braking: " << v_top << " m/s\n";
    result.check(v_top > 0.0, "Vehicle accelerated");
    result.check(body.velocity_mps() == 0.0, "Brakes stop the vehicle");
    result.check(v_min >= 0.0, "Brakes never reverse the vehicle");
}

// Test 5: Grade
void test_grade(TestResult& result) {
    print_header("Test 5: Grade");

    BodyParams p;
    BodyLoads loads;

    Body gentle(p);
    loads.track.slope_rad = std::atan(0.005);
    gentle.step(loads, 0.1);
    result.check(gentle.velocity_mps() == 0.0, "Friction holds on a 0.5% grade");

    Body steep(p);
    loads.track.slope_rad = std::atan(0.20);
    const BodyStep s = steep.step(loads, 0.1);
    result.check(s.grade_torque_nm > 0.0 && steep.velocity_mps() < 0.0, "Vehicle rolls back on a 20% grade");

    Body down(p);
    loads.track.slope_rad = -std::atan(0.20);
    down.step(loads, 0.1);
    result.check(down.velocity_mps() > 0.0, "Vehicle rolls forward downhill");
}

// Test 6: Tracks
void test_tracks(TestResult& result) {
    print_header("Test 6: Tracks");

    FlatTrack flat;
    result.check(flat.sample(1e4, 10.0).slope_rad == 0.0 && flat.name() == "flat", "Flat track is level");

    std::vector<TrackSection> sections(3);
    sections[0].length_m = 100.0;
    sections[1].length_m = 50.0;
    sections[1].slope_rad = 0.05;
    sections[2].length_m = 100.0;
    sections[2].slope_rad = -0.02;
    sections[2].rolling_multiplier = 1.5;
    SectionTrack track(sections);

    result.check(is_close(track.length_m(), 250.0), "Track length is the sum of sections");
    result.check(track.sample(-5.0, 0.0).slope_rad == 0.0, "Before start uses the first section");
    result.check(is_close(track.sample(120.0, 0.0).slope_rad, 0.05), "Middle section sampled");
    result.check(is_close(track.sample(160.0, 0.0).rolling_multiplier, 1.5), "Surface properties sampled");
    result.check(is_close(track.sample(1000.0, 0.0).slope_rad, -0.02), "Past the end uses the last section");

    bool threw = false;
    try {
        std::vector<TrackSection> bad(1);
        bad[0].length_m = 0.0;
        SectionTrack t(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    result.check(threw, "Zero-length section rejected");
}

int main() {
    std::cout << COLOR_YELLOW << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║       Body Dynamics Unit Tests        ║\n";
    std::cout << "╚════════════════════════════════════════╝" << COLOR_RESET << "\n";

    utils::set_level(utils::LogLevel::Warn);

    TestResult result;
    test_rest(result);
    test_traction(result);
    test_reflected_inertia(result);
    test_braking(result);
    test_grade(result);
    test_tracks(result);

    result.summary();
    return (result.failed == 0) ? 0 : 1;
}
