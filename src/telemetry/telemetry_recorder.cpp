#include "telemetry/telemetry_recorder.hpp"
#include "aircraft/aircraft.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "core/properties/property_paths.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace contrail {

TelemetryRecorder::TelemetryRecorder(Aircraft& aircraft, TelemetryConfig config)
    : m_aircraft(&aircraft)
    , m_config(std::move(config))
{
}

const char* TelemetryRecorder::csvHeader() {
    return "time,x,y,z,airspeed,altitude,aoa_deg,cl,lift,drag,pitch_deg,roll_deg,heading_deg,"
           "throttle,elevator,aileron,rudder,stalled,on_ground";
}

void TelemetryRecorder::init() {
    if (!(m_config.interval > 0.0)) {
        throw std::runtime_error("Telemetry interval must be positive");
    }
    if (!m_config.csvPath.empty()) {
        m_csv.open(m_config.csvPath);
        if (!m_csv.is_open()) {
            throw std::runtime_error("Cannot open telemetry file: " + m_config.csvPath);
        }
        m_csv << csvHeader() << '\n';
        std::cout << "[Telemetry] Recording to " << m_config.csvPath << std::endl;
    }
    m_summary = {};
    m_sinceLastSample = 0.0;
    sample();
}

void TelemetryRecorder::tick(double dt) {
    m_sinceLastSample += dt;
    // Small tolerance so float steps that land on the interval are not skipped.
    if (m_sinceLastSample + 1e-9 >= m_config.interval) {
        // Keep the overshoot so sample times stay on the interval grid. At most
        // one sample per tick; a backlog from dt > interval is dropped.
        m_sinceLastSample = std::max(m_sinceLastSample - m_config.interval, 0.0);
        if (m_sinceLastSample >= m_config.interval) {
            m_sinceLastSample = std::fmod(m_sinceLastSample, m_config.interval);
        }
        sample();
    }
}

void TelemetryRecorder::sample() {
    const Aircraft::Instance* player = m_aircraft->player();
    if (!player) {
        return;
    }

    const PropertyBus& bus = player->properties();
    const AircraftState& state = player->state();
    const ControlInputs& controls = player->controls();

    double time = PropertyBus::global().get(Properties::Sim::TIME, 0.0);
    double airspeed = bus.get(Properties::Velocities::AIRSPEED, 0.0);
    double altitude = bus.get(Properties::Position::ALTITUDE, static_cast<double>(state.position.y));
    double aoaDeg = bus.get(Properties::Aero::AOA, 0.0) * PhysicsConstants::RAD_TO_DEG;
    double cl = bus.get(Properties::Aero::CL, 0.0);
    double lift = bus.get(Properties::Aero::LIFT, 0.0);
    double drag = bus.get(Properties::Aero::DRAG, 0.0);
    bool stalled = bus.get(Properties::Aero::STALLED, false);
    bool onGround = bus.get(Properties::Position::ON_GROUND, false);

    if (m_summary.samples == 0) {
        m_summary.minAltitude = altitude;
        m_summary.maxAltitude = altitude;
    }
    m_summary.samples++;
    m_summary.duration = time;
    m_summary.minAltitude = std::min(m_summary.minAltitude, altitude);
    m_summary.maxAltitude = std::max(m_summary.maxAltitude, altitude);
    m_summary.maxAirspeed = std::max(m_summary.maxAirspeed, airspeed);
    m_summary.maxAoaDeg = std::max(m_summary.maxAoaDeg, std::abs(aoaDeg));
    m_summary.maxLift = std::max(m_summary.maxLift, lift);
    if (stalled) {
        m_summary.stalledSamples++;
    }

    if (!m_csv.is_open()) {
        return;
    }
    m_csv << std::fixed << std::setprecision(3)
          << time << ','
          << state.position.x << ',' << state.position.y << ',' << state.position.z << ','
          << airspeed << ',' << altitude << ',' << aoaDeg << ','
          << std::setprecision(4) << cl << ',' << std::setprecision(1) << lift << ',' << drag << ','
          << std::setprecision(2)
          << bus.get(Properties::Orientation::PITCH_DEG, 0.0) << ','
          << bus.get(Properties::Orientation::ROLL_DEG, 0.0) << ','
          << bus.get(Properties::Orientation::HEADING_DEG, 0.0) << ','
          << std::setprecision(3)
          << controls.throttle << ',' << controls.elevator << ','
          << controls.aileron << ',' << controls.rudder << ','
          << (stalled ? 1 : 0) << ',' << (onGround ? 1 : 0) << '\n';
}

void TelemetryRecorder::shutdown() {
    if (m_csv.is_open()) {
        m_csv.close();
    }
    if (m_config.printSummary) {
        printSummary(std::cout);
    }
}

void TelemetryRecorder::printSummary(std::ostream& out) const {
    out << std::fixed << std::setprecision(1)
        << "[Telemetry] " << m_summary.samples << " samples over " << m_summary.duration << " s\n"
        << "  altitude   " << m_summary.minAltitude << " .. " << m_summary.maxAltitude << " m\n"
        << "  airspeed   max " << m_summary.maxAirspeed << " m/s\n"
        << "  |aoa|      max " << m_summary.maxAoaDeg << " deg\n"
        << "  lift       max " << m_summary.maxLift << " N\n"
        << "  stalled    " << m_summary.stalledSamples << " samples" << std::endl;
}

}
