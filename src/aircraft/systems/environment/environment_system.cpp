#include "environment_system.hpp"
#include "aircraft/aircraft_frame.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "core/properties/property_context.hpp"
#include "core/properties/property_paths.hpp"
#include "environment/atmosphere.hpp"

namespace contrail {

EnvironmentSystem::EnvironmentSystem(Atmosphere& atmosphere, AircraftFrame& frame)
    : m_atmosphere(atmosphere)
    , m_frame(frame)
{
}

void EnvironmentSystem::init(AircraftState& state, PropertyContext& properties) {
    m_state = &state;
    m_telemetry = &properties.telemetry();
    m_frame.air = m_atmosphere.sample(state.position);
}

void EnvironmentSystem::update(float dt) {
    (void)dt;
    AtmosphereSample& air = m_frame.air;
    air = m_atmosphere.sample(m_state->position);

    m_telemetry->set(Properties::Atmosphere::DENSITY, static_cast<double>(air.density));
    m_telemetry->set(Properties::Atmosphere::DENSITY_RATIO, static_cast<double>(densityRatio()));
    m_telemetry->set(Properties::Atmosphere::TEMPERATURE, static_cast<double>(air.temperature));
    m_telemetry->set(Properties::Atmosphere::WIND, air.wind);
}

float EnvironmentSystem::densityRatio() const {
    return m_frame.air.density / static_cast<float>(PhysicsConstants::SEA_LEVEL_DENSITY);
}

}
