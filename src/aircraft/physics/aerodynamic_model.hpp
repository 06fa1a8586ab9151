#pragma once

#include "aircraft/aircraft_state.hpp"
#include "aircraft/physics/aero_surface.hpp"
#include "environment/atmosphere.hpp"
#include "math/vec3.hpp"
#include <vector>

namespace contrail {

struct SurfaceForces {
    float aoa = 0.0f;         // local angle of attack, radians
    float deflection = 0.0f;  // control deflection, radians
    float cl = 0.0f;          // including the control increment
    float cd = 0.0f;
    float lift = 0.0f;        // N, signed along the lift direction
    float drag = 0.0f;        // N, >= 0
    Vec3 force;               // world frame
    bool stalled = false;
};

/**
 * @brief Result of one force-model evaluation.
 *
 * force and torque are world-frame and ready for the integrator; torque is
 * about the centre of gravity. The body-frame breakdowns use
 * (x: pitch, y: yaw, z: roll).
 */
struct AeroOutput {
    Vec3 force;
    Vec3 torque;
    Vec3 controlTorque;
    Vec3 stabilityTorque;

    float dynamicPressure = 0.0f;
    float airspeed = 0.0f;
    float aoa = 0.0f;
    float sideslip = 0.0f;
    float lift = 0.0f;
    float drag = 0.0f;
    float cl = 0.0f;
    float cd = 0.0f;
    bool stalled = false;

    std::vector<SurfaceForces> surfaces;
};

/**
 * @brief Stateless aerodynamic force model.
 *
 * compute() is a pure function of its arguments and the immutable
 * configuration. Degenerate input (zero airspeed, NaN, extreme angles) is
 * clamped; the model never throws and never returns non-finite values.
 */
class AerodynamicModel {
public:
    explicit AerodynamicModel(AeroConfig config);

    AeroOutput compute(const AircraftState& state,
                       const ControlInputs& controls,
                       const AtmosphereSample& air) const;

    // Body-frame torque from control deflections alone in undisturbed flow.
    Vec3 controlTorque(const ControlInputs& controls, float dynamicPressure) const;

    const AeroConfig& config() const { return m_config; }

    // 0.5 * rho * v^2, floored at zero and capped.
    static float dynamicPressure(float density, float speed);
    // 0.5 * rho * v^2 * S * CL
    static float liftForce(float density, float speed, float area, float cl);
    // 0.5 * rho * v^2 * S * CD, never negative
    static float dragForce(float density, float speed, float area, float cd);

    static constexpr float kMaxDynamicPressure = 2.0e5f;
    static constexpr float kMaxForce = 1.0e7f;

private:
    float controlInput(ControlChannel channel, const ControlInputs& controls) const;
    float controlLiftSlope(const AeroSurfaceParams& surface) const;

    AeroConfig m_config;
};

}
