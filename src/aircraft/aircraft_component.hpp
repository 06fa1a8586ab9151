#pragma once

namespace contrail {

class PropertyContext;
struct AircraftState;

/**
 * @brief One stage of an aircraft's per-tick pipeline.
 *
 * Components run in insertion order every fixed step. Shared per-tick data
 * (controls, air sample, force accumulator) is handed over at construction.
 */
class AircraftComponent {
public:
    virtual ~AircraftComponent() = default;
    virtual const char* name() const = 0;
    virtual void init(AircraftState& state, PropertyContext& properties) = 0;
    virtual void update(float dt) = 0;
};

}
