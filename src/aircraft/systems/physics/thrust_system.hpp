#pragma once

#include "aircraft/aircraft_component.hpp"
#include "aircraft/aircraft_config.hpp"

namespace contrail {

struct AircraftFrame;

// Fixed-pitch propeller stand-in: thrust scales with throttle and air density.
class ThrustSystem : public AircraftComponent {
public:
    ThrustSystem(const ThrustConfig& config, const Vec3& centreOfGravity, AircraftFrame& frame);

    const char* name() const override { return "ThrustSystem"; }
    void init(AircraftState& state, PropertyContext& properties) override;
    void update(float dt) override;

private:
    ThrustConfig m_config;
    Vec3 m_centreOfGravity;
    AircraftState* m_acState = nullptr;
    PropertyContext* m_properties = nullptr;
    AircraftFrame* m_frame = nullptr;
};

}
