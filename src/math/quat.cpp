#include "math/quat.hpp"
#include <algorithm>

namespace contrail {

Quat Quat::fromHeadingPitchRoll(float heading, float pitch, float roll) {
    // +Y rotation swings the nose toward +X; rotations about +X and +Z are
    // nose-down and right-wing-up respectively, hence the negated angles.
    Quat qHeading = fromAxisAngle(Vec3(0, 1, 0), heading);
    Quat qPitch = fromAxisAngle(Vec3(1, 0, 0), -pitch);
    Quat qRoll = fromAxisAngle(Vec3(0, 0, 1), -roll);
    return (qHeading * qPitch * qRoll).normalized();
}

float Quat::headingRad() const {
    Vec3 f = forward();
    return std::atan2(f.x, f.z);
}

float Quat::pitchRad() const {
    return std::asin(std::clamp(forward().y, -1.0f, 1.0f));
}

float Quat::rollRad() const {
    Vec3 r = right();
    Vec3 u = up();
    return std::atan2(-r.y, u.y);
}

}
