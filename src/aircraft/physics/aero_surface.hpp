#pragma once

#include "aircraft/physics/lift_curve.hpp"
#include "math/vec3.hpp"
#include <string>
#include <vector>

namespace contrail {

enum class SurfaceRole { Wing, Aileron, HorizontalTail, VerticalTail };
enum class SurfaceSide { Left, Right, Centre };
enum class ControlChannel { None, Aileron, Elevator, Rudder };

/**
 * @brief How a pilot control channel moves a surface.
 *
 * The lift increment is q * area * liftSlope * deflection, applied along the
 * surface's lift direction. deflection = input * maxDeflection * sign, where
 * the sign is fixed by channel and side.
 */
struct ControlSurfaceParams {
    ControlChannel channel = ControlChannel::None;
    float maxDeflection = 0.35f; // radians
    float liftSlope = 0.0f;      // per radian; <= 0 uses the surface's lift curve slope
};

/**
 * @brief Static parameters of one lifting surface. Immutable after load.
 */
struct AeroSurfaceParams {
    std::string name;
    SurfaceRole role = SurfaceRole::Wing;
    SurfaceSide side = SurfaceSide::Centre;

    Vec3 position;  // body-frame centre of pressure, metres
    float area = 0.0f;

    LiftCurve lift;
    float cd0 = 0.032f;
    float inducedDragFactor = 0.045f;
    float cdStall = 0.8f;          // extra drag fully applied at the post-stall angle
    float postStallSpan = 0.35f;   // radians past stall over which cdStall ramps in

    ControlSurfaceParams control;

    // Lift acts in the plane spanned by the airflow and this axis (body frame).
    Vec3 normal() const {
        return role == SurfaceRole::VerticalTail ? Vec3(1, 0, 0) : Vec3(0, 1, 0);
    }

    // Deflection per unit control input, including the side sign.
    float deflectionSign() const;
};

/**
 * @brief Aerodynamic rate damping and static stability derivatives, body axes.
 */
struct StabilityConfig {
    float pitchStability = 0.0f;
    float yawStability = 0.0f;
    float rollStability = 0.0f;
    float pitchDamping = 0.0f;
    float yawDamping = 0.0f;
    float rollDamping = 0.0f;
    float minAirspeed = 5.0f;
};

struct FuselageConfig {
    float frontalArea = 0.0f;
    float cd = 0.0f;
};

/**
 * @brief Everything the force model needs besides per-tick state.
 */
struct AeroConfig {
    std::vector<AeroSurfaceParams> surfaces;
    StabilityConfig stability;
    FuselageConfig fuselage;
    Vec3 centreOfGravity;       // body frame
    float referenceArea = 16.0f;
    float referenceChord = 1.5f;
    float referenceSpan = 11.0f;
};

const char* toString(SurfaceRole role);
const char* toString(SurfaceSide side);
const char* toString(ControlChannel channel);

}
