#pragma once

#include "math/vec3.hpp"

namespace contrail {

/**
 * @brief World-frame force and torque about the centre of gravity for one tick.
 */
struct ForceAccumulator {
    Vec3 force;
    Vec3 torque;

    void clear() {
        force = Vec3();
        torque = Vec3();
    }

    void addForce(const Vec3& f) { force += f; }
    void addTorque(const Vec3& t) { torque += t; }

    // arm is the world-frame offset from the centre of gravity to where f acts.
    void addForceAtArm(const Vec3& f, const Vec3& arm) {
        force += f;
        torque += arm.cross(f);
    }
};

}
