#include "core/properties/property_bus.hpp"
#include "core/properties/property_context.hpp"
#include "core/properties/property_paths.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace contrail;

namespace {

bool testTypedRoundTrip() {
    std::cout << "Test: Typed properties store and return their values\n";
    PropertyBus bus;
    bus.set(Properties::Aero::CL, 0.42);
    bus.set(Properties::Aero::STALLED, true);
    bus.set(Properties::Forces::AERO, Vec3(1.0f, 2.0f, 3.0f));

    bool passed = true;
    passed &= bus.get(Properties::Aero::CL, 0.0) == 0.42;
    passed &= bus.get(Properties::Aero::STALLED, false);
    Vec3 force = bus.get(Properties::Forces::AERO, Vec3());
    passed &= force.x == 1.0f && force.y == 2.0f && force.z == 3.0f;
    passed &= bus.has(Properties::Aero::CL) && !bus.has(Properties::Aero::CD);
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testFallbacks() {
    std::cout << "Test: Missing keys and type mismatches return the fallback\n";
    PropertyBus bus;
    bool passed = true;
    passed &= bus.get(Properties::Aero::CD, 7.0) == 7.0;
    passed &= !bus.has(Properties::Aero::CD);

    // Stored as int, read as double
    bus.set<int>(Properties::Aero::CD.id, 3);
    passed &= bus.has(Properties::Aero::CD);
    passed &= bus.get(Properties::Aero::CD, -1.0) == -1.0;
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testStringKeysShareIds() {
    std::cout << "Test: String paths and typed keys address the same slot\n";
    PropertyBus bus;
    bus.set<double>(std::string("controls/flight/elevator"), -0.3);

    bool passed = true;
    passed &= PropertyBus::getID("controls/flight/elevator") == Properties::Controls::ELEVATOR.id;
    passed &= bus.get(Properties::Controls::ELEVATOR, 0.0) == -0.3;
    passed &= bus.has(std::string(Properties::Controls::ELEVATOR.path));
    passed &= "aero/cl"_id == Properties::Aero::CL.id;
    passed &= Properties::Aero::CL.id != Properties::Aero::CD.id;
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testIncrement() {
    std::cout << "Test: Increment accumulates doubles and replaces other types\n";
    PropertyBus bus;
    bus.increment(Properties::Sim::TIME, 0.5);
    bus.increment(Properties::Sim::TIME, 0.25);

    bool passed = std::abs(bus.get(Properties::Sim::TIME, 0.0) - 0.75) < 1e-12;

    bus.set(Properties::Sim::PAUSED, true);
    bus.increment(Properties::Sim::PAUSED.id, 1.0);
    passed &= !bus.get(Properties::Sim::PAUSED, false);
    passed &= bus.get<double>(Properties::Sim::PAUSED.id, 0.0) == 1.0;
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testContextSeparatesBuses() {
    std::cout << "Test: Property context keeps shared and telemetry buses apart\n";
    PropertyBus global;
    PropertyBus local;
    PropertyContext context(global, local);

    context.shared().set(Properties::Controls::THROTTLE, 0.8);
    context.telemetry().set(Properties::Controls::THROTTLE, 0.2);

    bool passed = global.get(Properties::Controls::THROTTLE, 0.0) == 0.8 &&
                  local.get(Properties::Controls::THROTTLE, 0.0) == 0.2;
    passed &= &PropertyBus::global() == &PropertyBus::global();

    PropertyContext unbound;
    passed &= !unbound.bound() && context.bound();
    try {
        unbound.telemetry();
        passed = false;
    } catch (const std::runtime_error&) {
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Property Bus Tests\n";
    std::cout << "==================\n\n";

    int passed = 0;
    const int total = 5;

    if (testTypedRoundTrip()) passed++;
    if (testFallbacks()) passed++;
    if (testStringKeysShareIds()) passed++;
    if (testIncrement()) passed++;
    if (testContextSeparatesBuses()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
