#pragma once

#include "core/app.hpp"
#include <string>

namespace contrail {

struct CliOptions {
    std::string aircraftPath;
    std::string configPath;
    std::string scriptPath;
    std::string telemetryPath;
    double duration = 60.0;
    double rate = 120.0;
    int maxSubsteps = 8;
    double telemetryInterval = 0.1;
    float windSpeed = 0.0f;
    float windHeading = 0.0f;
    bool quiet = false;
    bool help = false;

    // Values set on the command line; a settings file never overrides these.
    struct Explicit {
        bool duration = false;
        bool rate = false;
        bool interval = false;
        bool wind = false;
    } given;
};

// Returns false on a usage error (unknown flag, missing or malformed value).
bool parseCliArgs(int argc, const char* const* argv, CliOptions& options);

// Fills every value not given on the command line from a simulator settings file:
//   { "simulation": { "rate", "maxSubsteps", "duration", "defaultAircraft" },
//     "environment": { "windSpeed", "windHeading" },
//     "telemetry": { "interval" } }
// Returns false when the file cannot be read or parsed. Throws ConfigError on
// wrong-typed or out-of-range values, naming the key.
bool applySettingsFile(const std::string& path, CliOptions& options);

// Throws ConfigError when the merged options cannot drive a run.
void validateCliOptions(const CliOptions& options);

AppConfig toAppConfig(const CliOptions& options);

void printUsage(const char* program);

}
