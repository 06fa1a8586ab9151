#pragma once

#include "aircraft/aircraft_component.hpp"
#include "aircraft/aircraft_config.hpp"

namespace contrail {

struct AircraftFrame;

/**
 * @brief Semi-implicit Euler rigid-body step with a flat ground plane.
 *
 * Consumes the world-frame force and torque gathered by earlier components.
 * Non-finite loads are discarded for the tick so a bad input never reaches
 * the state.
 */
class PhysicsIntegrator : public AircraftComponent {
public:
    PhysicsIntegrator(const PhysicsConfig& config, AircraftFrame& frame);

    const char* name() const override { return "PhysicsIntegrator"; }
    void init(AircraftState& state, PropertyContext& properties) override;
    void update(float dt) override;

    bool onGround() const { return m_onGround; }

private:
    void integrate(float dt);
    void publish();

    PhysicsConfig m_config;
    AircraftState* m_acState = nullptr;
    PropertyContext* m_properties = nullptr;
    AircraftFrame* m_frame = nullptr;
    bool m_onGround = false;
    bool m_reportedNonFinite = false;
};

}
