#include "cli/cli_options.hpp"
#include "core/app.hpp"
#include "scripting/control_script.hpp"
#include "telemetry/telemetry_recorder.hpp"
#include "core/properties/property_bus.hpp"
#include "utils/config_loader.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    contrail::CliOptions options;
    if (!contrail::parseCliArgs(argc, argv, options)) {
        contrail::printUsage(argv[0]);
        return 2;
    }
    if (options.help) {
        contrail::printUsage(argv[0]);
        return 0;
    }

    try {
        if (!options.configPath.empty() && !contrail::applySettingsFile(options.configPath, options)) {
            return 1;
        }
        contrail::validateCliOptions(options);

        contrail::App app;
        if (!app.init(contrail::toAppConfig(options))) {
            return 1;
        }

        contrail::FlightConfig flight;
        flight.aircraftPath = options.aircraftPath;
        flight.windSpeed = options.windSpeed;
        flight.windHeading = options.windHeading;

        if (!app.startFlight(flight)) {
            std::cerr << "Failed to start flight session" << std::endl;
            return 1;
        }

        if (!options.scriptPath.empty()) {
            auto script = contrail::ControlScript::load(options.scriptPath);
            if (!script) {
                return 1;
            }
            script->attach(contrail::PropertyBus::global());
            app.subsystems().add(std::make_shared<contrail::ControlScript>(std::move(*script)));
        }

        contrail::TelemetryConfig telemetry;
        telemetry.csvPath = options.telemetryPath;
        telemetry.interval = options.telemetryInterval;
        telemetry.printSummary = !options.quiet;
        app.subsystems().add(std::make_shared<contrail::TelemetryRecorder>(app.session()->aircraft(), telemetry));

        app.run(options.duration);
        app.shutdown();
    } catch (const contrail::ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
