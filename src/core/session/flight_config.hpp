#pragma once

#include "aircraft/aircraft_config.hpp"
#include <optional>
#include <string>

namespace contrail {

/**
 * @brief Parameters for starting a flight session.
 */
struct FlightConfig {
    // Used when aircraft is not set; empty means the built-in trainer.
    std::string aircraftPath;
    std::optional<AircraftConfig> aircraft;

    float windSpeed = 0.0f;   // m/s
    float windHeading = 0.0f; // degrees, direction the wind blows toward
};

}
