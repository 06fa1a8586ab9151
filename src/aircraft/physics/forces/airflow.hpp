#pragma once

#include "math/vec3.hpp"
#include "math/quat.hpp"

namespace contrail {

/**
 * @brief Relative airflow resolved into body axes.
 */
struct AirflowData {
    Vec3 airVelocity;   // motion through the air, world frame
    float airSpeed = 0.0f;
    Vec3 airflowDir = Vec3(0, 0, 1);
    Vec3 forward = Vec3(0, 0, 1);
    Vec3 up = Vec3(0, 1, 0);
    Vec3 right = Vec3(1, 0, 0);
    float forwardSpeed = 0.0f;
    float rightSpeed = 0.0f;
    float upSpeed = 0.0f;
    float aoa = 0.0f;
    float sideslip = 0.0f;
};

// Below this speed the flow direction is undefined and angles are reported as zero.
constexpr float kMinAirflowSpeed = 0.5f;

AirflowData computeAirflow(const Vec3& airVelocity, const Quat& orientation);

// Angle of attack of a surface whose lift axis is `normal` (world frame).
float surfaceAngleOfAttack(const Vec3& airVelocity, const Vec3& forward, const Vec3& normal);

}
