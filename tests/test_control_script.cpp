#include "scripting/control_script.hpp"
#include "core/properties/property_bus.hpp"
#include "core/properties/property_paths.hpp"
#include "utils/config_loader.hpp"

#include <cmath>
#include <functional>
#include <iostream>
#include <string>

using namespace contrail;
using nlohmann::json;

namespace {

const std::string kDataDir = CONTRAIL_TEST_DATA_DIR;

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

bool expectConfigError(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const ConfigError&) {
        return true;
    }
}

bool testInterpolation() {
    std::cout << "Test: Channels interpolate between their own keyframes\n";
    ControlScript script = ControlScript::fromJson(json::parse(R"({
        "keyframes": [
            { "t": 0.0, "throttle": 0.5, "elevator": 0.0 },
            { "t": 4.0, "throttle": 1.0 },
            { "t": 2.0, "elevator": -0.4 }
        ]
    })"));

    bool passed = true;
    passed &= script.keyframeCount() == 3;
    passed &= near(script.duration(), 4.0);
    passed &= near(script.throttle().sample(2.0), 0.75);
    passed &= near(script.elevator().sample(1.0), -0.2);
    passed &= near(script.elevator().sample(3.0), -0.4);
    passed &= script.aileron().empty() && script.rudder().empty();
    std::cout << "  Output: throttle(2) " << script.throttle().sample(2.0)
              << ", elevator(1) " << script.elevator().sample(1.0) << "\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testHoldsOutsideRange() {
    std::cout << "Test: Values hold before the first and after the last keyframe\n";
    ControlScript script = ControlScript::fromJson(json::parse(R"([
        { "t": 1.0, "rudder": 0.3 },
        { "t": 2.0, "rudder": -0.3 }
    ])"));
    bool passed = near(script.rudder().sample(0.0), 0.3) && near(script.rudder().sample(50.0), -0.3);
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testApplyWritesOnlyScriptedChannels() {
    std::cout << "Test: Apply writes scripted channels and leaves others alone\n";
    PropertyBus bus;
    bus.set(Properties::Controls::AILERON, 0.25);

    ControlScript script = ControlScript::fromJson(json::parse(R"({
        "keyframes": [ { "t": 0.0, "throttle": 0.2 }, { "t": 10.0, "throttle": 0.8 } ]
    })"));
    script.attach(bus);
    bus.set(Properties::Sim::TIME, 5.0);
    script.init();

    bool passed = near(bus.get(Properties::Controls::THROTTLE, 0.0), 0.5);
    passed &= near(bus.get(Properties::Controls::AILERON, 0.0), 0.25);
    passed &= !bus.has(Properties::Controls::ELEVATOR);

    bus.set(Properties::Sim::TIME, 10.0);
    script.tick(0.1);
    passed &= near(bus.get(Properties::Controls::THROTTLE, 0.0), 0.8);
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testMalformedScripts() {
    std::cout << "Test: Malformed scripts raise ConfigError\n";
    bool passed = true;
    passed &= expectConfigError([] { ControlScript::fromJson(json::parse(R"({ "frames": [] })")); });
    passed &= expectConfigError([] { ControlScript::fromJson(json::parse(R"({ "keyframes": 3 })")); });
    passed &= expectConfigError([] { ControlScript::fromJson(json::parse(R"([ { "throttle": 1.0 } ])")); });
    passed &= expectConfigError([] { ControlScript::fromJson(json::parse(R"([ { "t": -1.0, "throttle": 1.0 } ])")); });
    passed &= expectConfigError([] { ControlScript::fromJson(json::parse(R"([ { "t": 1.0, "elevator": "up" } ])")); });
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testInitWithoutBus() {
    std::cout << "Test: Initializing without a bus is a wiring error\n";
    ControlScript script;
    bool passed = false;
    try {
        script.init();
    } catch (const std::runtime_error&) {
        passed = true;
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testLoadBundledScript() {
    std::cout << "Test: Loading the bundled climb script\n";
    auto script = ControlScript::load(kDataDir + "/scripts/climb.json");
    bool passed = script.has_value();
    if (passed) {
        passed &= script->keyframeCount() == 6;
        passed &= near(script->duration(), 30.0);
        passed &= near(script->throttle().sample(0.0), 0.6);
        passed &= near(script->throttle().sample(5.0), 1.0);
        passed &= near(script->aileron().sample(21.5), 0.1);
    }
    passed &= !ControlScript::load(kDataDir + "/scripts/missing.json").has_value();
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Control Script Tests\n";
    std::cout << "====================\n\n";

    int passed = 0;
    const int total = 6;

    if (testInterpolation()) passed++;
    if (testHoldsOutsideRange()) passed++;
    if (testApplyWritesOnlyScriptedChannels()) passed++;
    if (testMalformedScripts()) passed++;
    if (testInitWithoutBus()) passed++;
    if (testLoadBundledScript()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
