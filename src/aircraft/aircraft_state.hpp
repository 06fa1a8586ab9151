#pragma once

#include "math/vec3.hpp"
#include "math/quat.hpp"

namespace contrail {

/**
 * @brief High-performance struct for "hot path" aircraft state.
 * Owned by the integrator and read by the force model every physics tick.
 */
struct AircraftState {
    Vec3 position = Vec3(0, 0, 0);
    Quat orientation = Quat::identity();
    Vec3 velocity = Vec3(0, 0, 0);        // World-space linear velocity
    Vec3 angularVelocity = Vec3(0, 0, 0); // Body-space angular velocity (about +X, +Y, +Z)
};

/**
 * @brief Normalized pilot commands.
 *
 * Deflection signs follow the trailing-edge-down convention: positive elevator
 * gives a positive torque about body +X, positive aileron a positive torque
 * about body +Z and positive rudder a positive torque about body +Y.
 */
struct ControlInputs {
    float throttle = 0.0f; // [0, 1]
    float elevator = 0.0f; // [-1, 1]
    float aileron = 0.0f;  // [-1, 1]
    float rudder = 0.0f;   // [-1, 1]

    // Clamps to range; non-finite channels become neutral.
    ControlInputs sanitized() const;
};

}
