#include "cli/cli_options.hpp"
#include "utils/config_loader.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace contrail {

namespace {

bool parseNumber(const std::string& text, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

float settingFloat(const json& section, const char* key, float fallback, const std::string& parent) {
    double value = readConfigNumber(section, key, fallback, parent);
    if (std::abs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        throw ConfigError("Value out of range for '" + configKeyPath(parent, key) + "'");
    }
    return static_cast<float>(value);
}

int settingInt(const json& section, const char* key, int fallback, const std::string& parent) {
    double value = readConfigNumber(section, key, fallback, parent);
    if (value != std::floor(value) || value < 1.0 || value > std::numeric_limits<int>::max()) {
        throw ConfigError("'" + configKeyPath(parent, key) + "' must be a positive integer");
    }
    return static_cast<int>(value);
}

}

bool parseCliArgs(int argc, const char* const* argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextValue = [&](double& out) {
            if (i + 1 >= argc || !parseNumber(argv[i + 1], out)) {
                std::cerr << "[CLI] " << arg << " expects a number" << std::endl;
                return false;
            }
            ++i;
            return true;
        };
        auto nextString = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "[CLI] " << arg << " expects a value" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--duration") {
            if (!nextValue(options.duration)) return false;
            options.given.duration = true;
        } else if (arg == "--rate") {
            if (!nextValue(options.rate)) return false;
            options.given.rate = true;
        } else if (arg == "--interval") {
            if (!nextValue(options.telemetryInterval)) return false;
            options.given.interval = true;
        } else if (arg == "--wind") {
            double speed = 0.0;
            double heading = 0.0;
            if (!nextValue(speed) || !nextValue(heading)) return false;
            if (std::abs(speed) > std::numeric_limits<float>::max() ||
                std::abs(heading) > std::numeric_limits<float>::max()) {
                std::cerr << "[CLI] --wind value out of range" << std::endl;
                return false;
            }
            if (speed < 0.0) {
                std::cerr << "[CLI] --wind speed must not be negative" << std::endl;
                return false;
            }
            options.windSpeed = static_cast<float>(speed);
            options.windHeading = static_cast<float>(heading);
            options.given.wind = true;
        } else if (arg == "--script") {
            if (!nextString(options.scriptPath)) return false;
        } else if (arg == "--telemetry") {
            if (!nextString(options.telemetryPath)) return false;
        } else if (arg == "--config") {
            if (!nextString(options.configPath)) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[CLI] Unknown option: " << arg << std::endl;
            return false;
        } else if (options.aircraftPath.empty()) {
            options.aircraftPath = arg;
        } else {
            std::cerr << "[CLI] Unexpected argument: " << arg << std::endl;
            return false;
        }
    }

    if (options.given.duration && !(options.duration > 0.0)) {
        std::cerr << "[CLI] --duration must be positive" << std::endl;
        return false;
    }
    if (options.given.rate && !(options.rate > 0.0)) {
        std::cerr << "[CLI] --rate must be positive" << std::endl;
        return false;
    }
    if (options.given.interval && !(options.telemetryInterval > 0.0)) {
        std::cerr << "[CLI] --interval must be positive" << std::endl;
        return false;
    }
    return true;
}

bool applySettingsFile(const std::string& path, CliOptions& options) {
    auto settings = loadJsonConfig(path);
    if (!settings) {
        return false;
    }
    if (!settings->is_object()) {
        throw ConfigError("Simulator settings must be a JSON object");
    }

    if (const json* sim = findConfigSection(*settings, "simulation")) {
        if (!options.given.rate) {
            options.rate = readConfigNumber(*sim, "rate", options.rate, "simulation");
        }
        options.maxSubsteps = settingInt(*sim, "maxSubsteps", options.maxSubsteps, "simulation");
        if (!options.given.duration) {
            options.duration = readConfigNumber(*sim, "duration", options.duration, "simulation");
        }
        std::string defaultAircraft = readConfigString(*sim, "defaultAircraft", "", "simulation");
        if (options.aircraftPath.empty()) {
            options.aircraftPath = defaultAircraft;
        }
    }

    if (const json* env = findConfigSection(*settings, "environment")) {
        float speed = settingFloat(*env, "windSpeed", options.windSpeed, "environment");
        float heading = settingFloat(*env, "windHeading", options.windHeading, "environment");
        if (!options.given.wind) {
            options.windSpeed = speed;
            options.windHeading = heading;
        }
    }

    if (const json* telemetry = findConfigSection(*settings, "telemetry")) {
        double interval = readConfigNumber(*telemetry, "interval", options.telemetryInterval, "telemetry");
        if (!options.given.interval) {
            options.telemetryInterval = interval;
        }
    }

    validateCliOptions(options);
    std::cout << "[CLI] Loaded settings from " << path << std::endl;
    return true;
}

void validateCliOptions(const CliOptions& options) {
    if (!(options.duration > 0.0)) {
        throw ConfigError("'simulation.duration' must be positive");
    }
    if (!(options.rate > 0.0)) {
        throw ConfigError("'simulation.rate' must be positive");
    }
    if (options.maxSubsteps < 1) {
        throw ConfigError("'simulation.maxSubsteps' must be a positive integer");
    }
    if (!(options.telemetryInterval > 0.0)) {
        throw ConfigError("'telemetry.interval' must be positive");
    }
    if (!(options.windSpeed >= 0.0f)) {
        throw ConfigError("'environment.windSpeed' must not be negative");
    }
}

AppConfig toAppConfig(const CliOptions& options) {
    AppConfig config;
    config.physicsRate = options.rate;
    config.maxSubsteps = options.maxSubsteps;
    config.verbose = !options.quiet;
    return config;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [aircraft.json] [options]\n"
              << "  --duration <s>        simulated time to run (default 60)\n"
              << "  --rate <hz>           physics rate (default 120)\n"
              << "  --script <file>       control script with timed keyframes\n"
              << "  --telemetry <file>    write CSV telemetry\n"
              << "  --interval <s>        telemetry sample interval (default 0.1)\n"
              << "  --wind <m/s> <deg>    steady wind speed and heading\n"
              << "  --config <file>       simulator settings JSON\n"
              << "  --quiet               suppress the run summary\n"
              << "  --help                show this message\n";
}

}
