#include "physics_integrator.hpp"
#include "aircraft/aircraft_frame.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "core/properties/property_context.hpp"
#include "core/properties/property_paths.hpp"
#include <algorithm>
#include <iostream>

namespace contrail {

PhysicsIntegrator::PhysicsIntegrator(const PhysicsConfig& config, AircraftFrame& frame)
    : m_config(config)
    , m_frame(&frame)
{
}

void PhysicsIntegrator::init(AircraftState& state, PropertyContext& properties) {
    m_acState = &state;
    m_properties = &properties;
    m_onGround = m_acState->position.y <= m_config.groundAltitude;
    publish();
}

void PhysicsIntegrator::update(float dt) {
    if (!(dt > 0.0f)) {
        return;
    }
    integrate(dt);
    publish();
}

void PhysicsIntegrator::integrate(float dt) {
    AircraftState& state = *m_acState;
    Vec3 force = m_frame->forces.force;
    Vec3 torque = m_frame->forces.torque;

    if (!force.isFinite() || !torque.isFinite()) {
        if (!m_reportedNonFinite) {
            std::cerr << "[PhysicsIntegrator] Non-finite force or torque discarded" << std::endl;
            m_reportedNonFinite = true;
        }
        force = Vec3();
        torque = Vec3();
    }

    const float mass = m_config.mass;

    if (state.position.y <= m_config.groundAltitude + 0.01f) {
        Vec3 horizontalVelocity(state.velocity.x, 0.0f, state.velocity.z);
        float horizontalSpeed = horizontalVelocity.length();
        if (horizontalSpeed > 0.01f) {
            // Friction may stop the aircraft within a step but never reverse it.
            float frictionMagnitude = m_config.groundFriction * mass * static_cast<float>(PhysicsConstants::GRAVITY);
            frictionMagnitude = std::min(frictionMagnitude, mass * horizontalSpeed / dt);
            force += horizontalVelocity.normalized() * -frictionMagnitude;
        }
    }

    Vec3 acceleration = force * (1.0f / mass);
    state.velocity += acceleration * dt;
    state.position += state.velocity * dt;

    m_onGround = false;
    if (state.position.y < m_config.groundAltitude) {
        state.position.y = m_config.groundAltitude;
        if (state.velocity.y < 0.0f) {
            state.velocity.y = 0.0f;
        }
        m_onGround = true;
    }

    // Angular acceleration = torque / inertia about the principal axes
    Vec3 torqueBody = state.orientation.inverseRotate(torque);
    const Vec3& inertia = m_config.inertia;
    Vec3 angularAccel(torqueBody.x / inertia.x,
                      torqueBody.y / inertia.y,
                      torqueBody.z / inertia.z);
    state.angularVelocity += angularAccel * dt;

    // q_new = q + 0.5 * q * w_body * dt
    Quat q = state.orientation;
    Quat w(0.0f, state.angularVelocity.x, state.angularVelocity.y, state.angularVelocity.z);
    Quat dq = q * w;
    q.w += dq.w * 0.5f * dt;
    q.x += dq.x * 0.5f * dt;
    q.y += dq.y * 0.5f * dt;
    q.z += dq.z * 0.5f * dt;
    state.orientation = q.normalized();

    if (!state.velocity.isFinite() || !state.position.isFinite() || !state.angularVelocity.isFinite()) {
        std::cerr << "[PhysicsIntegrator] State diverged, resetting rates" << std::endl;
        state.velocity = Vec3();
        state.angularVelocity = Vec3();
        if (!state.position.isFinite()) {
            state.position = Vec3(0.0f, m_config.groundAltitude, 0.0f);
        }
    }
}

void PhysicsIntegrator::publish() {
    const AircraftState& state = *m_acState;
    PropertyBus& local = m_properties->telemetry();

    local.set(Properties::Position::ALTITUDE, static_cast<double>(state.position.y));
    local.set(Properties::Position::ON_GROUND, m_onGround);
    local.set(Properties::Velocities::VERTICAL_SPEED, static_cast<double>(state.velocity.y));
    local.set(Properties::Orientation::PITCH_DEG, state.orientation.pitchRad() * PhysicsConstants::RAD_TO_DEG);
    local.set(Properties::Orientation::ROLL_DEG, state.orientation.rollRad() * PhysicsConstants::RAD_TO_DEG);
    local.set(Properties::Orientation::HEADING_DEG, state.orientation.headingRad() * PhysicsConstants::RAD_TO_DEG);
    local.set(Properties::Forces::TOTAL, m_frame->forces.force);
    local.set(Properties::Forces::TORQUE, m_frame->forces.torque);
}

}
