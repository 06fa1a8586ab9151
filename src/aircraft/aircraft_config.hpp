#pragma once

#include "aircraft/physics/aero_surface.hpp"
#include "math/vec3.hpp"
#include "utils/config_loader.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace contrail {

struct PhysicsConfig {
    float mass = 1000.0f;
    Vec3 inertia = {1350.0f, 1950.0f, 950.0f}; // principal moments about body X, Y, Z
    float groundAltitude = 0.0f;
    float groundFriction = 0.02f;
};

struct ThrustConfig {
    float maxThrust = 2400.0f;
    Vec3 thrustPoint = {0.0f, 0.0f, 2.5f}; // body frame
};

struct SpawnConfig {
    Vec3 position = {0.0f, 500.0f, 0.0f};
    float airspeed = 50.0f;
    float headingDeg = 0.0f;
    float pitchDeg = 0.0f;
    float throttle = 0.6f;
};

struct AircraftConfig {
    std::string name = "Default";
    PhysicsConfig physics;
    ThrustConfig thrust;
    AeroConfig aero;
    SpawnConfig spawn;

    // Light single-engine trainer with the stock lift tables.
    static AircraftConfig defaults();
};

// Starts from defaults() and overrides whatever the document provides.
// Throws ConfigError naming the offending key when a value is invalid.
AircraftConfig parseAircraftConfig(const nlohmann::json& json);

// I/O and JSON syntax problems are logged and yield std::nullopt; invalid values throw ConfigError.
std::optional<AircraftConfig> loadAircraftConfig(const std::string& path);

}
