#pragma once

#include "aircraft/aircraft.hpp"
#include "environment/atmosphere.hpp"
#include "core/session/flight_config.hpp"

namespace contrail {

/**
 * @brief Represents an active flight simulation session.
 */
class FlightSession {
public:
    explicit FlightSession(const FlightConfig& config);
    ~FlightSession();

    // ConfigError from the aircraft file propagates; unreadable files return false.
    bool init();
    void fixedUpdate(float dt);
    void shutdown();

    Aircraft& aircraft() { return m_aircraft; }
    const Aircraft& aircraft() const { return m_aircraft; }
    Atmosphere& atmosphere() { return m_atmosphere; }

private:
    FlightConfig m_config;

    Aircraft m_aircraft;
    Atmosphere m_atmosphere;
};

}
