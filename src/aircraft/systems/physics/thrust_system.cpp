#include "thrust_system.hpp"
#include "aircraft/aircraft_frame.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "core/properties/property_context.hpp"
#include "core/properties/property_paths.hpp"
#include <algorithm>

namespace contrail {

ThrustSystem::ThrustSystem(const ThrustConfig& config, const Vec3& centreOfGravity, AircraftFrame& frame)
    : m_config(config)
    , m_centreOfGravity(centreOfGravity)
    , m_frame(&frame)
{
}

void ThrustSystem::init(AircraftState& state, PropertyContext& properties) {
    m_acState = &state;
    m_properties = &properties;
}

void ThrustSystem::update(float dt) {
    (void)dt;
    const Quat& orientation = m_acState->orientation;

    float densityRatio = std::clamp(m_frame->air.density / static_cast<float>(PhysicsConstants::SEA_LEVEL_DENSITY),
                                    0.0f, 1.5f);
    float magnitude = m_frame->controls.throttle * m_config.maxThrust * densityRatio;

    Vec3 thrust = orientation.forward() * magnitude;
    Vec3 arm = orientation.rotate(m_config.thrustPoint - m_centreOfGravity);
    m_frame->forces.addForceAtArm(thrust, arm);

    m_properties->telemetry().set(Properties::Forces::THRUST, thrust);
}

}
