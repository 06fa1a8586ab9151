#pragma once

#include "core/subsystem.hpp"
#include <fstream>
#include <ostream>
#include <string>

namespace contrail {

class Aircraft;

struct TelemetryConfig {
    std::string csvPath;        // empty: no CSV, summary only
    double interval = 0.1;      // seconds between samples
    bool printSummary = true;
};

/**
 * @brief Samples the player aircraft at a fixed interval into CSV and keeps
 * flight statistics for the closing summary.
 */
class TelemetryRecorder : public Subsystem {
public:
    struct Summary {
        std::size_t samples = 0;
        double duration = 0.0;
        double minAltitude = 0.0;
        double maxAltitude = 0.0;
        double maxAirspeed = 0.0;
        double maxAoaDeg = 0.0;
        double maxLift = 0.0;
        std::size_t stalledSamples = 0;
    };

    TelemetryRecorder(Aircraft& aircraft, TelemetryConfig config);

    void init() override;
    void tick(double dt) override;
    void shutdown() override;
    std::string name() const override { return "TelemetryRecorder"; }

    // Takes one sample immediately regardless of the interval.
    void sample();

    const Summary& summary() const { return m_summary; }
    void printSummary(std::ostream& out) const;

    static const char* csvHeader();

private:
    Aircraft* m_aircraft = nullptr;
    TelemetryConfig m_config;
    std::ofstream m_csv;
    double m_sinceLastSample = 0.0;
    Summary m_summary;
};

}
