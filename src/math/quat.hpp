#pragma once

#include "math/vec3.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

namespace contrail {

struct Quat {
    float w, x, y, z;

    // JSON conversion from Euler angles [x, y, z] in degrees
    friend void from_json(const nlohmann::json& j, Quat& q) {
        if (j.is_array() && j.size() == 3) {
            float rx = j[0].get<float>() * (3.14159265f / 180.0f);
            float ry = j[1].get<float>() * (3.14159265f / 180.0f);
            float rz = j[2].get<float>() * (3.14159265f / 180.0f);
            Quat qx = Quat::fromAxisAngle(Vec3(1, 0, 0), rx);
            Quat qy = Quat::fromAxisAngle(Vec3(0, 1, 0), ry);
            Quat qz = Quat::fromAxisAngle(Vec3(0, 0, 1), rz);
            q = (qz * qy * qx).normalized();
        }
    }

    Quat() : w(1.0f), x(0.0f), y(0.0f), z(0.0f) {}
    Quat(float w, float x, float y, float z) : w(w), x(x), y(y), z(z) {}
    Quat(double w_, double x_, double y_, double z_)
        : w(static_cast<float>(w_)), x(static_cast<float>(x_))
        , y(static_cast<float>(y_)), z(static_cast<float>(z_)) {}

    static Quat identity() { return Quat(1.0f, 0.0f, 0.0f, 0.0f); }

    static Quat fromAxisAngle(const Vec3& axis, float angle) {
        float half = angle * 0.5f;
        float s = std::sin(half);
        Vec3 n = axis.normalized();
        return Quat{std::cos(half), n.x * s, n.y * s, n.z * s};
    }

    /**
     * @brief Builds an attitude from heading (about world up), pitch (nose up positive)
     * and roll (right wing down positive), all in radians.
     */
    static Quat fromHeadingPitchRoll(float heading, float pitch, float roll);

    Quat operator*(const Quat& q) const {
        return Quat{
            w*q.w - x*q.x - y*q.y - z*q.z,
            w*q.x + x*q.w + y*q.z - z*q.y,
            w*q.y - x*q.z + y*q.w + z*q.x,
            w*q.z + x*q.y - y*q.x + z*q.w
        };
    }

    Quat conjugate() const { return Quat{w, -x, -y, -z}; }

    Vec3 rotate(const Vec3& v) const {
        Vec3 u{x, y, z};
        return u * (2.0f * u.dot(v))
             + v * (w*w - u.dot(u))
             + u.cross(v) * (2.0f * w);
    }

    // World to body for a unit quaternion.
    Vec3 inverseRotate(const Vec3& v) const { return conjugate().rotate(v); }

    Quat normalized() const {
        float len = std::sqrt(w*w + x*x + y*y + z*z);
        if (!(len > 1e-6f) || !std::isfinite(len)) {
            return identity();
        }
        return Quat{w/len, x/len, y/len, z/len};
    }

    bool isFinite() const {
        return std::isfinite(w) && std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    // Body axes in world space. Body frame: +Z forward, +Y up, +X right.
    Vec3 forward() const { return rotate(Vec3(0, 0, 1)); }
    Vec3 up() const { return rotate(Vec3(0, 1, 0)); }
    Vec3 right() const { return rotate(Vec3(1, 0, 0)); }

    float headingRad() const;
    float pitchRad() const;
    float rollRad() const;
};

}
