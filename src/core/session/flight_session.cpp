#include "core/session/flight_session.hpp"
#include <iostream>

namespace contrail {

FlightSession::FlightSession(const FlightConfig& config)
    : m_config(config) {
}

FlightSession::~FlightSession() {
    shutdown();
}

bool FlightSession::init() {
    m_atmosphere.init();
    m_atmosphere.setWind(m_config.windSpeed, m_config.windHeading);

    m_aircraft.init(m_atmosphere);

    if (m_config.aircraft) {
        m_aircraft.spawnPlayer(*m_config.aircraft);
    } else if (!m_config.aircraftPath.empty()) {
        if (!m_aircraft.spawnPlayer(m_config.aircraftPath)) {
            return false;
        }
    } else {
        std::cout << "[FlightSession] No aircraft file given, using the built-in trainer" << std::endl;
        m_aircraft.spawnPlayer(AircraftConfig::defaults());
    }

    return true;
}

void FlightSession::shutdown() {
    m_aircraft.shutdown();
}

void FlightSession::fixedUpdate(float dt) {
    m_aircraft.fixedUpdate(dt);
}

}
