#include "environment/atmosphere.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include <algorithm>
#include <cmath>

namespace contrail {

namespace {
constexpr float kMinAltitude = -500.0f;
constexpr float kMaxAltitude = 86000.0f;

float clampAltitude(float altitude) {
    if (!std::isfinite(altitude)) {
        return 0.0f;
    }
    return std::clamp(altitude, kMinAltitude, kMaxAltitude);
}
}

void Atmosphere::init() {
    m_windSpeed = 0.0f;
    m_windHeading = 0.0f;
}

float Atmosphere::getTemperature(float altitude) const {
    using namespace PhysicsConstants;
    double h = std::min(static_cast<double>(clampAltitude(altitude)), TROPOPAUSE_ALTITUDE);
    return static_cast<float>(STANDARD_TEMPERATURE - LAPSE_RATE * h);
}

float Atmosphere::getAirDensity(float altitude) const {
    using namespace PhysicsConstants;
    double h = clampAltitude(altitude);

    // rho = rho0 * (T / T0)^(g / (R * L) - 1)
    const double exponent = GRAVITY / (AIR_GAS_CONSTANT * LAPSE_RATE) - 1.0;
    double hTropo = std::min(h, TROPOPAUSE_ALTITUDE);
    double temperature = STANDARD_TEMPERATURE - LAPSE_RATE * hTropo;
    double density = SEA_LEVEL_DENSITY * std::pow(temperature / STANDARD_TEMPERATURE, exponent);

    if (h > TROPOPAUSE_ALTITUDE) {
        double scaleHeight = AIR_GAS_CONSTANT * temperature / GRAVITY;
        density *= std::exp(-(h - TROPOPAUSE_ALTITUDE) / scaleHeight);
    }

    return static_cast<float>(density);
}

Vec3 Atmosphere::getWind(const Vec3& position) const {
    (void)position;
    if (m_windSpeed <= 0.0f) {
        return Vec3(0, 0, 0);
    }

    float headingRad = m_windHeading * static_cast<float>(PhysicsConstants::DEG_TO_RAD);
    return Vec3(
        std::sin(headingRad) * m_windSpeed,
        0.0f,
        std::cos(headingRad) * m_windSpeed
    );
}

AtmosphereSample Atmosphere::sample(const Vec3& position) const {
    AtmosphereSample s;
    s.density = getAirDensity(position.y);
    s.temperature = getTemperature(position.y);
    s.wind = getWind(position);
    return s;
}

void Atmosphere::setWind(float speed, float heading) {
    m_windSpeed = std::isfinite(speed) ? std::max(speed, 0.0f) : 0.0f;
    m_windHeading = std::isfinite(heading) ? std::fmod(heading, 360.0f) : 0.0f;
}

}
