#pragma once

#include "aircraft/aircraft_component.hpp"

namespace contrail {

struct AircraftFrame;

class GravitySystem : public AircraftComponent {
public:
    GravitySystem(float mass, AircraftFrame& frame);

    const char* name() const override { return "GravitySystem"; }
    void init(AircraftState& state, PropertyContext& properties) override;
    void update(float dt) override;

private:
    float m_mass = 0.0f;
    PropertyContext* m_properties = nullptr;
    AircraftFrame* m_frame = nullptr;
};

}
