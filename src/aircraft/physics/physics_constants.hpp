#pragma once

namespace contrail {

namespace PhysicsConstants {

constexpr double GRAVITY = 9.81;
constexpr double SEA_LEVEL_DENSITY = 1.225;
constexpr double AIR_GAS_CONSTANT = 287.05;
constexpr double STANDARD_PRESSURE = 101325.0;
constexpr double STANDARD_TEMPERATURE = 288.15;
constexpr double LAPSE_RATE = 0.0065;
constexpr double TROPOPAUSE_ALTITUDE = 11000.0;
constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

}

}
