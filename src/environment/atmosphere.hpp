#pragma once

#include "math/vec3.hpp"

namespace contrail {

/**
 * @brief Air properties at one point, sampled once per tick for each aircraft.
 */
struct AtmosphereSample {
    float density = 1.225f;       // kg/m^3
    float temperature = 288.15f;  // K
    Vec3 wind;              // m/s, world frame, direction the air moves toward
};

class Atmosphere {
public:
    void init();

    // ISA troposphere below 11 km, isothermal exponential decay above.
    float getAirDensity(float altitude) const;
    float getTemperature(float altitude) const;
    Vec3 getWind(const Vec3& position) const;

    AtmosphereSample sample(const Vec3& position) const;

    // heading in degrees, measured from +Z toward +X
    void setWind(float speed, float heading);
    float windSpeed() const { return m_windSpeed; }
    float windHeading() const { return m_windHeading; }

private:
    float m_windSpeed = 0.0f;
    float m_windHeading = 0.0f;
};

}
