#include "aircraft/physics/forces/airflow.hpp"
#include <cmath>

namespace contrail {

AirflowData computeAirflow(const Vec3& airVelocity, const Quat& orientation) {
    AirflowData data;

    data.airVelocity = airVelocity;
    data.airSpeed = airVelocity.length();
    data.airflowDir = data.airSpeed > kMinAirflowSpeed ? airVelocity * (1.0f / data.airSpeed) : Vec3(0, 0, 1);

    data.forward = orientation.forward();
    data.up = orientation.up();
    data.right = orientation.right();

    data.forwardSpeed = data.forward.dot(airVelocity);
    data.rightSpeed = data.right.dot(airVelocity);
    data.upSpeed = data.up.dot(airVelocity);

    if (data.airSpeed > kMinAirflowSpeed) {
        data.aoa = std::atan2(-data.upSpeed, data.forwardSpeed);
        data.sideslip = std::atan2(data.rightSpeed, data.forwardSpeed);
    }

    return data;
}

float surfaceAngleOfAttack(const Vec3& airVelocity, const Vec3& forward, const Vec3& normal) {
    float forwardSpeed = forward.dot(airVelocity);
    float normalSpeed = normal.dot(airVelocity);
    if (std::abs(forwardSpeed) < 1e-6f && std::abs(normalSpeed) < 1e-6f) {
        return 0.0f;
    }
    return std::atan2(-normalSpeed, forwardSpeed);
}

}
