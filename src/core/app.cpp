#include "core/app.hpp"
#include "core/properties/property_paths.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace contrail {

bool App::init(const AppConfig& config) {
    if (!(config.physicsRate > 0.0) || !std::isfinite(config.physicsRate)) {
        std::cerr << "[App] Physics rate must be positive" << std::endl;
        return false;
    }
    if (config.maxSubsteps < 1 || !(config.frameTime > 0.0)) {
        std::cerr << "[App] Invalid frame settings" << std::endl;
        return false;
    }

    m_config = config;
    m_fixedDt = 1.0 / config.physicsRate;

    PropertyBus& global = PropertyBus::global();
    global.set(Properties::Sim::PAUSED, false);
    global.set(Properties::Sim::QUIT_REQUESTED, false);
    global.set(Properties::Sim::TIME, 0.0);
    return true;
}

bool App::startFlight(const FlightConfig& config) {
    endFlight();

    m_session = std::make_unique<FlightSession>(config);
    if (!m_session->init()) {
        m_session.reset();
        return false;
    }

    m_simTime = 0.0;
    m_ticks = 0;
    PropertyBus::global().set(Properties::Sim::TIME, 0.0);
    setPaused(false);
    return true;
}

void App::endFlight() {
    m_session.reset();
    m_physicsAccumulator = 0.0;
}

void App::run(double duration) {
    using clock = std::chrono::steady_clock;

    if (!m_subsystems.initialized()) {
        m_subsystems.initAll();
    }

    auto start = clock::now();
    const double end = m_time + duration;
    while (m_time < end && !PropertyBus::global().get(Properties::Sim::QUIT_REQUESTED, false)) {
        frame(std::min(m_config.frameTime, end - m_time));
    }
    auto stop = clock::now();

    if (m_config.verbose) {
        double wallMs = std::chrono::duration<double, std::milli>(stop - start).count();
        std::cout << "[App] Simulated " << m_simTime << " s in " << m_ticks << " ticks ("
                  << wallMs << " ms wall";
        if (m_droppedSteps > 0) {
            std::cout << ", " << m_droppedSteps << " steps dropped";
        }
        std::cout << ")" << std::endl;
    }
}

void App::frame(double frameDt) {
    m_time += frameDt;
    updatePhysics(frameDt);
}

void App::shutdown() {
    m_subsystems.shutdownAll();
    endFlight();
}

void App::setPaused(bool paused) {
    PropertyBus& global = PropertyBus::global();
    if (global.get(Properties::Sim::PAUSED, false) == paused) return;
    global.set(Properties::Sim::PAUSED, paused);
    m_physicsAccumulator = 0.0;
}

bool App::paused() const {
    return PropertyBus::global().get(Properties::Sim::PAUSED, false);
}

void App::quit() {
    PropertyBus::global().set(Properties::Sim::QUIT_REQUESTED, true);
}

void App::updatePhysics(double frameDt) {
    if (paused() || !m_session) {
        m_physicsAccumulator = 0.0;
        return;
    }

    m_physicsAccumulator += frameDt;
    int substeps = 0;
    // Tolerance keeps a frame that is an exact multiple of the step from losing a tick to rounding.
    while (m_physicsAccumulator + 1e-9 >= m_fixedDt) {
        if (substeps >= m_config.maxSubsteps) {
            m_droppedSteps += static_cast<std::uint64_t>(m_physicsAccumulator / m_fixedDt);
            m_physicsAccumulator = 0.0;
            break;
        }
        m_session->fixedUpdate(static_cast<float>(m_fixedDt));
        m_physicsAccumulator -= m_fixedDt;
        m_simTime += m_fixedDt;
        m_ticks++;
        substeps++;

        PropertyBus::global().set(Properties::Sim::TIME, m_simTime);
        m_subsystems.tickAll(m_fixedDt);
    }
    if (m_physicsAccumulator < 0.0) {
        m_physicsAccumulator = 0.0;
    }
}

}
