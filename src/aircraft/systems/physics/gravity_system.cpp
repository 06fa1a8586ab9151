#include "gravity_system.hpp"
#include "aircraft/aircraft_frame.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "core/properties/property_context.hpp"
#include "core/properties/property_paths.hpp"

namespace contrail {

GravitySystem::GravitySystem(float mass, AircraftFrame& frame)
    : m_mass(mass)
    , m_frame(&frame)
{
}

void GravitySystem::init(AircraftState& state, PropertyContext& properties) {
    (void)state;
    m_properties = &properties;
}

void GravitySystem::update(float dt) {
    (void)dt;
    Vec3 weight(0.0f, -m_mass * static_cast<float>(PhysicsConstants::GRAVITY), 0.0f);
    m_frame->forces.addForce(weight);
    m_properties->telemetry().set(Properties::Forces::GRAVITY, weight);
}

}
