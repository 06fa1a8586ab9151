#include "aircraft/aircraft.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "core/properties/property_paths.hpp"
#include "environment/atmosphere.hpp"

#include "aircraft/systems/environment/environment_system.hpp"
#include "aircraft/systems/physics/aerodynamics_system.hpp"
#include "aircraft/systems/physics/thrust_system.hpp"
#include "aircraft/systems/physics/gravity_system.hpp"
#include "aircraft/systems/physics/physics_integrator.hpp"
#include <iostream>

namespace contrail {

void Aircraft::Instance::init(const AircraftConfig& config, Atmosphere& atmosphere) {
    m_config = config;
    m_properties.bind(PropertyBus::global(), m_bus);

    const SpawnConfig& spawn = m_config.spawn;
    const float heading = spawn.headingDeg * static_cast<float>(PhysicsConstants::DEG_TO_RAD);
    const float pitch = spawn.pitchDeg * static_cast<float>(PhysicsConstants::DEG_TO_RAD);

    m_currentState.position = spawn.position;
    m_currentState.orientation = Quat::fromHeadingPitchRoll(heading, pitch, 0.0f);
    m_currentState.velocity = m_currentState.orientation.forward() * spawn.airspeed;
    m_currentState.angularVelocity = Vec3();

    PropertyBus& global = m_properties.shared();
    if (!global.has(Properties::Controls::THROTTLE)) {
        global.set(Properties::Controls::THROTTLE, static_cast<double>(spawn.throttle));
    }

    // Order matters: loads are gathered before the integrator consumes them.
    addSystem<EnvironmentSystem>(atmosphere, m_frame);
    addSystem<AerodynamicsSystem>(m_config.aero, m_frame);
    addSystem<ThrustSystem>(m_config.thrust, m_config.aero.centreOfGravity, m_frame);
    addSystem<GravitySystem>(m_config.physics.mass, m_frame);
    addSystem<PhysicsIntegrator>(m_config.physics, m_frame);

    std::cout << "[Aircraft] Spawned '" << m_config.name << "' at altitude "
              << m_currentState.position.y << " m, " << spawn.airspeed << " m/s" << std::endl;
}

void Aircraft::Instance::readControls() {
    const PropertyBus& global = m_properties.shared();

    ControlInputs raw;
    raw.throttle = static_cast<float>(global.get(Properties::Controls::THROTTLE, 0.0));
    raw.elevator = static_cast<float>(global.get(Properties::Controls::ELEVATOR, 0.0));
    raw.aileron = static_cast<float>(global.get(Properties::Controls::AILERON, 0.0));
    raw.rudder = static_cast<float>(global.get(Properties::Controls::RUDDER, 0.0));
    m_frame.controls = raw.sanitized();

    PropertyBus& local = m_properties.telemetry();
    local.set(Properties::Controls::THROTTLE, static_cast<double>(m_frame.controls.throttle));
    local.set(Properties::Controls::ELEVATOR, static_cast<double>(m_frame.controls.elevator));
    local.set(Properties::Controls::AILERON, static_cast<double>(m_frame.controls.aileron));
    local.set(Properties::Controls::RUDDER, static_cast<double>(m_frame.controls.rudder));
}

void Aircraft::Instance::update(float dt) {
    readControls();
    m_frame.forces.clear();

    for (auto& system : m_systems) {
        system->update(dt);
    }
}

}
