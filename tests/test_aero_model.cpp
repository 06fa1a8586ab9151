#include "aircraft/aircraft_config.hpp"
#include "aircraft/physics/aerodynamic_model.hpp"

#include <cmath>
#include <iostream>
#include <limits>

using namespace contrail;

namespace {

constexpr float kDeg = 3.14159265f / 180.0f;

bool isFinite(const AeroOutput& out) {
    return out.force.isFinite() && out.torque.isFinite() &&
           out.controlTorque.isFinite() && out.stabilityTorque.isFinite() &&
           std::isfinite(out.lift) && std::isfinite(out.drag) &&
           std::isfinite(out.cl) && std::isfinite(out.cd) &&
           std::isfinite(out.aoa) && std::isfinite(out.sideslip) &&
           std::isfinite(out.dynamicPressure) && std::isfinite(out.airspeed);
}

// One linear-lift wing at the centre of gravity, no stability terms.
AeroConfig singleWingConfig() {
    AeroConfig config;
    AeroSurfaceParams wing;
    wing.name = "wing";
    wing.role = SurfaceRole::Wing;
    wing.area = 16.0f;
    wing.lift = LiftCurve::linear(LinearLiftParams{});
    config.surfaces.push_back(wing);
    config.referenceArea = 16.0f;
    return config;
}

// Level attitude with the air arriving from below at the given angle.
AircraftState flightAtAngle(float speed, float alphaRad) {
    AircraftState state;
    state.velocity = Vec3(0.0f, -std::sin(alphaRad), std::cos(alphaRad)) * speed;
    return state;
}

bool testLiftExample() {
    std::cout << "Test: Lift at 50 m/s, rho 1.225, S 16, CL 0.5\n";
    float lift = AerodynamicModel::liftForce(1.225f, 50.0f, 16.0f, 0.5f);
    bool passed = std::abs(lift - 12250.0f) < 0.5f;
    std::cout << "  Output: " << lift << " N (expected 12250)\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testZeroSpeed() {
    std::cout << "Test: Zero airspeed produces zero lift and drag\n";
    bool passed = true;
    if (AerodynamicModel::liftForce(1.225f, 0.0f, 16.0f, 1.2f) != 0.0f) {
        passed = false;
        std::cout << "  FAILED: liftForce(0) is not zero\n";
    }
    if (AerodynamicModel::dragForce(1.225f, 0.0f, 16.0f, 0.05f) != 0.0f) {
        passed = false;
        std::cout << "  FAILED: dragForce(0) is not zero\n";
    }

    AerodynamicModel model(AircraftConfig::defaults().aero);
    AircraftState state;
    ControlInputs controls;
    controls.elevator = 1.0f;
    controls.aileron = -1.0f;
    AeroOutput out = model.compute(state, controls, AtmosphereSample{});
    if (out.force.length() != 0.0f || out.torque.length() != 0.0f || out.lift != 0.0f || out.drag != 0.0f) {
        passed = false;
        std::cout << "  FAILED: model produced load with the aircraft at rest\n";
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testLiftNonNegativeAndFinite() {
    std::cout << "Test: Lift is non-negative and finite for all speeds\n";
    bool passed = true;
    float previous = -1.0f;
    for (float v = 0.0f; v <= 2000.0f; v += 10.0f) {
        float lift = AerodynamicModel::liftForce(1.225f, v, 16.0f, 0.5f);
        if (!std::isfinite(lift) || lift < 0.0f || lift < previous) {
            passed = false;
            std::cout << "  FAILED: lift(" << v << ") = " << lift << "\n";
            break;
        }
        previous = lift;
    }
    float capped = AerodynamicModel::dynamicPressure(1.225f, 1.0e6f);
    if (capped > AerodynamicModel::kMaxDynamicPressure) {
        passed = false;
        std::cout << "  FAILED: dynamic pressure not capped (" << capped << ")\n";
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testLiftRisesThenFallsThroughStall() {
    std::cout << "Test: Lift grows with angle of attack up to stall, then drops\n";
    AerodynamicModel model(singleWingConfig());
    ControlInputs controls;
    AtmosphereSample air;
    bool passed = true;

    float stall = model.config().surfaces[0].lift.stallAngle();
    float previous = -1.0e9f;
    for (float deg = 0.0f; deg * kDeg < stall; deg += 1.0f) {
        AeroOutput out = model.compute(flightAtAngle(50.0f, deg * kDeg), controls, air);
        if (!(out.lift > previous)) {
            passed = false;
            std::cout << "  FAILED: lift did not increase at " << deg << " deg\n";
            break;
        }
        previous = out.lift;
    }

    float atStall = model.compute(flightAtAngle(50.0f, stall), controls, air).lift;
    previous = atStall;
    for (float deg : {20.0f, 25.0f, 30.0f, 45.0f}) {
        AeroOutput out = model.compute(flightAtAngle(50.0f, deg * kDeg), controls, air);
        if (!(out.lift < previous)) {
            passed = false;
            std::cout << "  FAILED: lift did not decrease at " << deg << " deg\n";
        }
        if (deg > 20.0f && !out.stalled) {
            passed = false;
            std::cout << "  FAILED: wing not reported stalled at " << deg << " deg\n";
        }
        previous = out.lift;
    }
    std::cout << "  Output: stall angle " << stall / kDeg << " deg, peak lift " << atStall << " N\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testComputeMatchesHandCalculation() {
    std::cout << "Test: Single wing at 5 deg matches q * S * CL\n";
    AerodynamicModel model(singleWingConfig());
    float alpha = 5.0f * kDeg;
    AeroOutput out = model.compute(flightAtAngle(50.0f, alpha), ControlInputs{}, AtmosphereSample{});

    float expectedCl = 5.5f * alpha;
    float expectedLift = 0.5f * 1.225f * 2500.0f * 16.0f * expectedCl;
    bool passed = std::abs(out.lift - expectedLift) < 1.0f &&
                  std::abs(out.aoa - alpha) < 1e-4f &&
                  std::abs(out.cl - expectedCl) < 1e-3f;
    std::cout << "  Output: lift " << out.lift << " N (expected " << expectedLift << "), aoa "
              << out.aoa / kDeg << " deg\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testDragOpposesMotion() {
    std::cout << "Test: Net aerodynamic force does negative work on the aircraft\n";
    AerodynamicModel model(AircraftConfig::defaults().aero);
    AircraftState state;
    state.velocity = Vec3(0.0f, 0.0f, 50.0f);
    AeroOutput out = model.compute(state, ControlInputs{}, AtmosphereSample{});

    float power = out.force.dot(state.velocity);
    bool passed = out.drag > 0.0f && power < 0.0f && out.force.y > 0.0f;
    std::cout << "  Output: drag " << out.drag << " N, F.v " << power << " W, lift force y " << out.force.y << " N\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testWindIsRelative() {
    std::cout << "Test: Headwind on a stationary aircraft equals forward flight\n";
    AerodynamicModel model(AircraftConfig::defaults().aero);

    AircraftState moving;
    moving.velocity = Vec3(0.0f, 0.0f, 40.0f);
    AeroOutput flying = model.compute(moving, ControlInputs{}, AtmosphereSample{});

    AircraftState parked;
    AtmosphereSample headwind;
    headwind.wind = Vec3(0.0f, 0.0f, -40.0f);
    AeroOutput windy = model.compute(parked, ControlInputs{}, headwind);

    bool passed = std::abs(flying.lift - windy.lift) < 1e-2f &&
                  (flying.force - windy.force).length() < 1e-2f;
    std::cout << "  Output: " << flying.lift << " N vs " << windy.lift << " N\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool checkChannel(const AerodynamicModel& model, const char* label, ControlInputs controls, int axis) {
    auto component = [axis](const Vec3& v) { return axis == 0 ? v.x : (axis == 1 ? v.y : v.z); };

    Vec3 positive = model.controlTorque(controls, 1500.0f);
    controls.elevator = -controls.elevator;
    controls.aileron = -controls.aileron;
    controls.rudder = -controls.rudder;
    Vec3 negative = model.controlTorque(controls, 1500.0f);

    bool passed = component(positive) > 0.0f && component(negative) < 0.0f;
    std::cout << "  " << label << ": +" << component(positive) << " / " << component(negative) << " N*m\n";
    return passed;
}

bool testControlTorqueSigns() {
    std::cout << "Test: Control torque sign follows the control input sign\n";
    AerodynamicModel model(AircraftConfig::defaults().aero);
    bool passed = true;

    ControlInputs elevator;
    elevator.elevator = 1.0f;
    ControlInputs aileron;
    aileron.aileron = 1.0f;
    ControlInputs rudder;
    rudder.rudder = 1.0f;

    passed &= checkChannel(model, "elevator -> pitch (x)", elevator, 0);
    passed &= checkChannel(model, "rudder -> yaw (y)", rudder, 1);
    passed &= checkChannel(model, "aileron -> roll (z)", aileron, 2);

    Vec3 neutral = model.controlTorque(ControlInputs{}, 1500.0f);
    if (neutral.length() != 0.0f) {
        passed = false;
        std::cout << "  FAILED: neutral controls produced torque\n";
    }

    // The same signs hold inside a full evaluation in level flight.
    AircraftState state;
    state.velocity = Vec3(0.0f, 0.0f, 50.0f);
    AeroOutput rolled = model.compute(state, aileron, AtmosphereSample{});
    AeroOutput pitched = model.compute(state, elevator, AtmosphereSample{});
    AeroOutput yawed = model.compute(state, rudder, AtmosphereSample{});
    if (!(rolled.controlTorque.z > 0.0f && pitched.controlTorque.x > 0.0f && yawed.controlTorque.y > 0.0f)) {
        passed = false;
        std::cout << "  FAILED: compute() control torque signs disagree\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testNonFiniteInputs() {
    std::cout << "Test: NaN and infinite inputs give finite output\n";
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    AerodynamicModel model(AircraftConfig::defaults().aero);
    bool passed = true;

    AircraftState state;
    state.velocity = Vec3(nan, 3.0f, inf);
    state.orientation = Quat(nan, 0.0f, 0.0f, 0.0f);
    state.angularVelocity = Vec3(inf, -inf, nan);
    ControlInputs controls;
    controls.elevator = nan;
    controls.aileron = inf;
    controls.rudder = -inf;
    controls.throttle = nan;
    AtmosphereSample air;
    air.density = nan;
    air.wind = Vec3(inf, 0.0f, 0.0f);
    passed &= isFinite(model.compute(state, controls, air));

    AircraftState fast;
    fast.velocity = Vec3(0.0f, -3.0e5f, 1.0e6f);
    fast.angularVelocity = Vec3(1.0e4f, 0.0f, -1.0e4f);
    AeroOutput out = model.compute(fast, ControlInputs{}, AtmosphereSample{});
    passed &= isFinite(out);
    passed &= out.force.length() <= AerodynamicModel::kMaxForce * 1.001f;

    AircraftState backwards;
    backwards.velocity = Vec3(0.0f, 0.0f, -50.0f);
    passed &= isFinite(model.compute(backwards, ControlInputs{}, AtmosphereSample{}));

    passed &= std::isfinite(AerodynamicModel::liftForce(nan, 50.0f, 16.0f, 0.5f));
    passed &= AerodynamicModel::dragForce(1.225f, 50.0f, 16.0f, -1.0f) == 0.0f;
    passed &= model.controlTorque(controls, nan).isFinite();

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testDampingOpposesRotation() {
    std::cout << "Test: Rate damping opposes body rotation\n";
    AerodynamicModel model(AircraftConfig::defaults().aero);
    AircraftState state;
    state.velocity = Vec3(0.0f, 0.0f, 50.0f);
    state.angularVelocity = Vec3(0.5f, 0.5f, 0.5f);
    AeroOutput out = model.compute(state, ControlInputs{}, AtmosphereSample{});

    bool passed = out.stabilityTorque.x < 0.0f && out.stabilityTorque.y < 0.0f && out.stabilityTorque.z < 0.0f;
    std::cout << "  Output: (" << out.stabilityTorque.x << ", " << out.stabilityTorque.y << ", "
              << out.stabilityTorque.z << ") N*m\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Aerodynamic Model Tests\n";
    std::cout << "=======================\n\n";

    int passed = 0;
    const int total = 10;

    if (testLiftExample()) passed++;
    if (testZeroSpeed()) passed++;
    if (testLiftNonNegativeAndFinite()) passed++;
    if (testLiftRisesThenFallsThroughStall()) passed++;
    if (testComputeMatchesHandCalculation()) passed++;
    if (testDragOpposesMotion()) passed++;
    if (testWindIsRelative()) passed++;
    if (testControlTorqueSigns()) passed++;
    if (testNonFiniteInputs()) passed++;
    if (testDampingOpposesRotation()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
