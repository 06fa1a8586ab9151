#pragma once

#include "aircraft/aircraft_component.hpp"
#include "aircraft/physics/aerodynamic_model.hpp"

namespace contrail {

struct AircraftFrame;

/**
 * @brief Runs the aerodynamic model once per tick and feeds the result to the
 * force accumulator and the aircraft's telemetry bus.
 */
class AerodynamicsSystem : public AircraftComponent {
public:
    AerodynamicsSystem(const AeroConfig& config, AircraftFrame& frame);

    const char* name() const override { return "AerodynamicsSystem"; }
    void init(AircraftState& state, PropertyContext& properties) override;
    void update(float dt) override;

    const AerodynamicModel& model() const { return m_model; }
    const AeroOutput& lastOutput() const { return m_lastOutput; }

private:
    void publish();

    AerodynamicModel m_model;
    AeroOutput m_lastOutput;
    AircraftState* m_acState = nullptr;
    PropertyContext* m_properties = nullptr;
    AircraftFrame* m_frame = nullptr;
};

}
