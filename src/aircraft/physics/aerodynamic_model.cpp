#include "aircraft/physics/aerodynamic_model.hpp"
#include "aircraft/physics/forces/airflow.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace contrail {

namespace {

float finiteOr(float value, float fallback) {
    return std::isfinite(value) ? value : fallback;
}

Vec3 finiteOr(const Vec3& value, const Vec3& fallback) {
    return value.isFinite() ? value : fallback;
}

Vec3 clampMagnitude(const Vec3& v, float maxLength) {
    if (!v.isFinite()) {
        return Vec3();
    }
    float len = v.length();
    if (len > maxLength) {
        return v * (maxLength / len);
    }
    return v;
}

// Unit vector in the plane of `normal` and the flow, perpendicular to the flow.
Vec3 liftDirection(const Vec3& normal, const Vec3& flowDir) {
    Vec3 dir = normal - flowDir * normal.dot(flowDir);
    float len = dir.length();
    if (len < 1e-3f) {
        return Vec3();
    }
    return dir * (1.0f / len);
}

} // namespace

AerodynamicModel::AerodynamicModel(AeroConfig config)
    : m_config(std::move(config))
{
}

float AerodynamicModel::dynamicPressure(float density, float speed) {
    if (!std::isfinite(density) || !std::isfinite(speed) || density <= 0.0f) {
        return 0.0f;
    }
    float q = 0.5f * density * speed * speed;
    return std::clamp(q, 0.0f, kMaxDynamicPressure);
}

float AerodynamicModel::liftForce(float density, float speed, float area, float cl) {
    float q = dynamicPressure(density, speed);
    float lift = q * finiteOr(area, 0.0f) * finiteOr(cl, 0.0f);
    return std::clamp(lift, -kMaxForce, kMaxForce);
}

float AerodynamicModel::dragForce(float density, float speed, float area, float cd) {
    float q = dynamicPressure(density, speed);
    float drag = q * std::max(finiteOr(area, 0.0f), 0.0f) * std::max(finiteOr(cd, 0.0f), 0.0f);
    return std::min(drag, kMaxForce);
}

float AerodynamicModel::controlInput(ControlChannel channel, const ControlInputs& controls) const {
    switch (channel) {
    case ControlChannel::Aileron: return controls.aileron;
    case ControlChannel::Elevator: return controls.elevator;
    case ControlChannel::Rudder: return controls.rudder;
    case ControlChannel::None: break;
    }
    return 0.0f;
}

float AerodynamicModel::controlLiftSlope(const AeroSurfaceParams& surface) const {
    if (surface.control.liftSlope > 0.0f) {
        return surface.control.liftSlope;
    }
    return std::max(surface.lift.liftSlope(), 0.0f);
}

Vec3 AerodynamicModel::controlTorque(const ControlInputs& rawControls, float dynamicPressure) const {
    ControlInputs controls = rawControls.sanitized();
    float q = std::clamp(finiteOr(dynamicPressure, 0.0f), 0.0f, kMaxDynamicPressure);

    Vec3 torque;
    for (const auto& surface : m_config.surfaces) {
        if (surface.control.channel == ControlChannel::None) {
            continue;
        }
        float deflection = controlInput(surface.control.channel, controls)
            * surface.control.maxDeflection * surface.deflectionSign();
        float deltaLift = q * surface.area * controlLiftSlope(surface) * deflection;
        Vec3 arm = surface.position - m_config.centreOfGravity;
        torque += arm.cross(surface.normal() * deltaLift);
    }
    return torque;
}

AeroOutput AerodynamicModel::compute(const AircraftState& rawState,
                                     const ControlInputs& rawControls,
                                     const AtmosphereSample& rawAir) const {
    AeroOutput out;
    out.surfaces.resize(m_config.surfaces.size());

    // Fail closed: anything non-finite is replaced by a neutral value.
    const ControlInputs controls = rawControls.sanitized();
    const Quat orientation = rawState.orientation.isFinite() ? rawState.orientation.normalized() : Quat::identity();
    const Vec3 velocity = finiteOr(rawState.velocity, Vec3());
    const Vec3 angularVelocityBody = finiteOr(rawState.angularVelocity, Vec3());
    const float density = std::max(finiteOr(rawAir.density, 0.0f), 0.0f);
    const Vec3 wind = finiteOr(rawAir.wind, Vec3());

    const Vec3 airVelocity = velocity - wind;
    const AirflowData flow = computeAirflow(airVelocity, orientation);

    out.airspeed = flow.airSpeed;
    out.aoa = flow.aoa;
    out.sideslip = flow.sideslip;
    out.dynamicPressure = dynamicPressure(density, flow.airSpeed);

    if (flow.airSpeed < kMinAirflowSpeed || density <= 0.0f) {
        out.aoa = 0.0f;
        out.sideslip = 0.0f;
        return out;
    }

    const Vec3 angularVelocityWorld = orientation.rotate(angularVelocityBody);
    const Vec3 forward = flow.forward;

    Vec3 force;
    Vec3 torque;
    Vec3 controlTorqueWorld;

    for (std::size_t i = 0; i < m_config.surfaces.size(); ++i) {
        const AeroSurfaceParams& surface = m_config.surfaces[i];
        SurfaceForces& result = out.surfaces[i];

        const Vec3 arm = orientation.rotate(surface.position - m_config.centreOfGravity);
        // The surface moves with the body plus the rotation about the centre of gravity.
        const Vec3 localAir = airVelocity + angularVelocityWorld.cross(arm);
        const float localSpeed = localAir.length();
        if (!(localSpeed >= kMinAirflowSpeed) || !std::isfinite(localSpeed)) {
            continue;
        }

        const Vec3 flowDir = localAir * (1.0f / localSpeed);
        const Vec3 normal = orientation.rotate(surface.normal());
        const Vec3 liftDir = liftDirection(normal, flowDir);

        result.aoa = surfaceAngleOfAttack(localAir, forward, normal);

        float cl = surface.lift.evaluate(result.aoa);
        float clControl = 0.0f;
        if (surface.control.channel != ControlChannel::None) {
            result.deflection = controlInput(surface.control.channel, controls)
                * surface.control.maxDeflection * surface.deflectionSign();
            clControl = controlLiftSlope(surface) * result.deflection;
        }
        result.cl = cl + clControl;

        float stallAngle = surface.lift.stallAngle();
        float beyondStall = std::abs(result.aoa) - stallAngle;
        result.stalled = beyondStall > 0.0f;
        float stallRamp = 0.0f;
        if (result.stalled) {
            stallRamp = std::clamp(beyondStall / std::max(surface.postStallSpan, 0.001f), 0.0f, 1.0f);
        }
        result.cd = surface.cd0 + surface.inducedDragFactor * result.cl * result.cl + surface.cdStall * stallRamp;

        result.lift = liftForce(density, localSpeed, surface.area, result.cl);
        result.drag = dragForce(density, localSpeed, surface.area, result.cd);
        result.force = liftDir * result.lift - flowDir * result.drag;

        force += result.force;
        torque += arm.cross(result.force);

        if (clControl != 0.0f) {
            float controlLift = liftForce(density, localSpeed, surface.area, clControl);
            Vec3 controlDir = liftDir.length() > 0.0f ? liftDir : normal;
            controlTorqueWorld += arm.cross(controlDir * controlLift);
        }

        out.lift += result.lift;
        out.drag += result.drag;
        if (surface.role == SurfaceRole::Wing && result.stalled) {
            out.stalled = true;
        }
    }

    if (m_config.fuselage.frontalArea > 0.0f && m_config.fuselage.cd > 0.0f) {
        float fuselageDrag = dragForce(density, flow.airSpeed, m_config.fuselage.frontalArea, m_config.fuselage.cd);
        force += flow.airflowDir * -fuselageDrag;
        out.drag += fuselageDrag;
    }

    const StabilityConfig& stab = m_config.stability;
    if (flow.airSpeed >= stab.minAirspeed) {
        constexpr float kMaxAngle = 0.5f;
        float aoa = std::clamp(flow.aoa, -kMaxAngle, kMaxAngle);
        float sideslip = std::clamp(flow.sideslip, -kMaxAngle, kMaxAngle);

        float qbar = out.dynamicPressure;
        float area = std::max(m_config.referenceArea, 0.01f);
        float chord = std::max(m_config.referenceChord, 0.01f);
        float span = std::max(m_config.referenceSpan, 0.01f);
        float pitchRateScale = chord / (2.0f * flow.airSpeed);
        float lateralRateScale = span / (2.0f * flow.airSpeed);
        const Vec3& w = angularVelocityBody;

        out.stabilityTorque = Vec3(
            (stab.pitchStability * aoa - stab.pitchDamping * w.x * pitchRateScale) * qbar * area * chord,
            (stab.yawStability * sideslip - stab.yawDamping * w.y * lateralRateScale) * qbar * area * span,
            (stab.rollStability * sideslip - stab.rollDamping * w.z * lateralRateScale) * qbar * area * span);
        torque += orientation.rotate(out.stabilityTorque);
    }

    float qS = out.dynamicPressure * m_config.referenceArea;
    if (qS > 1e-3f) {
        out.cl = out.lift / qS;
        out.cd = out.drag / qS;
    }

    out.force = clampMagnitude(force, kMaxForce);
    out.torque = clampMagnitude(torque, kMaxForce);
    out.controlTorque = clampMagnitude(orientation.inverseRotate(controlTorqueWorld), kMaxForce);
    out.stabilityTorque = clampMagnitude(out.stabilityTorque, kMaxForce);
    if (!std::isfinite(out.lift) || !std::isfinite(out.drag)) {
        out.lift = 0.0f;
        out.drag = 0.0f;
        out.cl = 0.0f;
        out.cd = 0.0f;
    }

    return out;
}

}
