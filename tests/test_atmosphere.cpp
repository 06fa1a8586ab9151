#include "environment/atmosphere.hpp"

#include <cmath>
#include <iostream>
#include <limits>

using namespace contrail;

namespace {

bool testSeaLevel() {
    std::cout << "Test: Sea-level density and temperature\n";
    Atmosphere atmosphere;
    atmosphere.init();
    float density = atmosphere.getAirDensity(0.0f);
    float temperature = atmosphere.getTemperature(0.0f);
    bool passed = std::abs(density - 1.225f) < 1e-3f && std::abs(temperature - 288.15f) < 1e-3f;
    std::cout << "  Output: rho " << density << " kg/m^3 (expected 1.225), T " << temperature << " K\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testDensityDecreasesWithAltitude() {
    std::cout << "Test: Density falls monotonically with altitude\n";
    Atmosphere atmosphere;
    atmosphere.init();
    bool passed = true;
    float previous = atmosphere.getAirDensity(-400.0f);
    for (float h = 0.0f; h <= 40000.0f; h += 500.0f) {
        float density = atmosphere.getAirDensity(h);
        if (!(density < previous) || !(density > 0.0f)) {
            passed = false;
            std::cout << "  FAILED: rho(" << h << ") = " << density << " after " << previous << "\n";
            break;
        }
        previous = density;
    }

    // Reference ISA values
    float at5k = atmosphere.getAirDensity(5000.0f);
    float at11k = atmosphere.getAirDensity(11000.0f);
    passed &= std::abs(at5k - 0.7364f) < 0.005f;
    passed &= std::abs(at11k - 0.3639f) < 0.005f;
    passed &= std::abs(atmosphere.getTemperature(11000.0f) - 216.65f) < 0.01f;
    passed &= std::abs(atmosphere.getTemperature(20000.0f) - 216.65f) < 0.01f;
    std::cout << "  Output: rho(5 km) " << at5k << ", rho(11 km) " << at11k << "\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testAltitudeClamping() {
    std::cout << "Test: Out-of-range and non-finite altitudes stay finite\n";
    Atmosphere atmosphere;
    atmosphere.init();
    bool passed = true;
    passed &= atmosphere.getAirDensity(-1.0e6f) == atmosphere.getAirDensity(-500.0f);
    passed &= atmosphere.getAirDensity(1.0e9f) == atmosphere.getAirDensity(86000.0f);
    passed &= atmosphere.getAirDensity(86000.0f) > 0.0f;
    passed &= atmosphere.getAirDensity(std::numeric_limits<float>::quiet_NaN()) == atmosphere.getAirDensity(0.0f);
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testWindVector() {
    std::cout << "Test: Wind heading is measured from +Z toward +X\n";
    Atmosphere atmosphere;
    atmosphere.init();
    bool passed = atmosphere.getWind(Vec3()).length() == 0.0f;

    atmosphere.setWind(10.0f, 90.0f);
    Vec3 east = atmosphere.getWind(Vec3(0.0f, 1000.0f, 0.0f));
    passed &= std::abs(east.x - 10.0f) < 1e-4f && std::abs(east.z) < 1e-4f && east.y == 0.0f;

    atmosphere.setWind(5.0f, 0.0f);
    AtmosphereSample sample = atmosphere.sample(Vec3(0.0f, 0.0f, 0.0f));
    passed &= std::abs(sample.wind.z - 5.0f) < 1e-4f;
    passed &= std::abs(sample.density - 1.225f) < 1e-3f;
    passed &= std::abs(sample.temperature - 288.15f) < 1e-2f;
    passed &= atmosphere.sample(Vec3(0.0f, 3000.0f, 0.0f)).temperature < sample.temperature;

    atmosphere.setWind(std::numeric_limits<float>::quiet_NaN(), 45.0f);
    passed &= atmosphere.windSpeed() == 0.0f;
    atmosphere.setWind(-3.0f, 45.0f);
    passed &= atmosphere.windSpeed() == 0.0f;

    std::cout << "  Output: heading 90 -> (" << east.x << ", " << east.y << ", " << east.z << ")\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Atmosphere Tests\n";
    std::cout << "================\n\n";

    int passed = 0;
    const int total = 4;

    if (testSeaLevel()) passed++;
    if (testDensityDecreasesWithAltitude()) passed++;
    if (testAltitudeClamping()) passed++;
    if (testWindVector()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
