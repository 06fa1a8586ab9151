#pragma once

#include "core/session/flight_config.hpp"
#include "core/session/flight_session.hpp"
#include "core/subsystem_manager.hpp"
#include <cstdint>
#include <memory>

namespace contrail {

struct AppConfig {
    double physicsRate = 120.0; // Hz
    int maxSubsteps = 8;        // per frame; the remainder is dropped
    double frameTime = 1.0 / 60.0;
    bool verbose = true;
};

/**
 * @brief Headless host loop: fixed-step physics driven by an accumulator,
 * with control and telemetry subsystems stepped after every physics tick.
 */
class App {
public:
    bool init(const AppConfig& config = {});
    // Runs until `duration` seconds of frame time have elapsed or a quit is requested.
    void run(double duration);
    void shutdown();

    // Session Management
    bool startFlight(const FlightConfig& config);
    void endFlight();
    bool isFlightActive() const { return m_session != nullptr; }

    SubsystemManager& subsystems() { return m_subsystems; }
    const SubsystemManager& subsystems() const { return m_subsystems; }

    FlightSession* session() { return m_session.get(); }

    // Advances the loop by one frame of the given length.
    void frame(double frameDt);

    void setPaused(bool paused);
    bool paused() const;

    void quit();

    double time() const { return m_time; }
    double simTime() const { return m_simTime; }
    double fixedDt() const { return m_fixedDt; }
    std::uint64_t ticks() const { return m_ticks; }
    std::uint64_t droppedSteps() const { return m_droppedSteps; }

private:
    void updatePhysics(double frameDt);

    AppConfig m_config;
    SubsystemManager m_subsystems;
    std::unique_ptr<FlightSession> m_session;

    double m_fixedDt = 1.0 / 120.0;
    double m_time = 0.0;
    double m_simTime = 0.0;
    double m_physicsAccumulator = 0.0;
    std::uint64_t m_ticks = 0;
    std::uint64_t m_droppedSteps = 0;
};

}
