#include "aerodynamics_system.hpp"
#include "aircraft/aircraft_frame.hpp"
#include "core/properties/property_context.hpp"
#include "core/properties/property_paths.hpp"

namespace contrail {

AerodynamicsSystem::AerodynamicsSystem(const AeroConfig& config, AircraftFrame& frame)
    : m_model(config)
    , m_frame(&frame)
{
}

void AerodynamicsSystem::init(AircraftState& state, PropertyContext& properties) {
    m_acState = &state;
    m_properties = &properties;
}

void AerodynamicsSystem::update(float dt) {
    (void)dt;
    m_lastOutput = m_model.compute(*m_acState, m_frame->controls, m_frame->air);

    m_frame->forces.addForce(m_lastOutput.force);
    m_frame->forces.addTorque(m_lastOutput.torque);

    publish();
}

void AerodynamicsSystem::publish() {
    PropertyBus& local = m_properties->telemetry();
    local.set(Properties::Aero::AOA, static_cast<double>(m_lastOutput.aoa));
    local.set(Properties::Aero::SIDESLIP, static_cast<double>(m_lastOutput.sideslip));
    local.set(Properties::Aero::CL, static_cast<double>(m_lastOutput.cl));
    local.set(Properties::Aero::CD, static_cast<double>(m_lastOutput.cd));
    local.set(Properties::Aero::LIFT, static_cast<double>(m_lastOutput.lift));
    local.set(Properties::Aero::DRAG, static_cast<double>(m_lastOutput.drag));
    local.set(Properties::Aero::DYNAMIC_PRESSURE, static_cast<double>(m_lastOutput.dynamicPressure));
    local.set(Properties::Aero::STALLED, m_lastOutput.stalled);
    local.set(Properties::Velocities::AIRSPEED, static_cast<double>(m_lastOutput.airspeed));
    local.set(Properties::Forces::AERO, m_lastOutput.force);
}

}
