#pragma once

#include "aircraft/aircraft_component.hpp"

namespace contrail {

class Atmosphere;
class PropertyBus;
struct AircraftFrame;

/**
 * @brief First component of the tick: samples the shared atmosphere at the
 * aircraft's position into the frame so later components see one consistent
 * set of air properties.
 */
class EnvironmentSystem : public AircraftComponent {
public:
    EnvironmentSystem(Atmosphere& atmosphere, AircraftFrame& frame);

    const char* name() const override { return "EnvironmentSystem"; }
    void init(AircraftState& state, PropertyContext& properties) override;
    void update(float dt) override;

    // Density relative to sea level of the last sample.
    float densityRatio() const;

private:
    Atmosphere& m_atmosphere;
    AircraftFrame& m_frame;
    AircraftState* m_state = nullptr;
    PropertyBus* m_telemetry = nullptr;
};

}
