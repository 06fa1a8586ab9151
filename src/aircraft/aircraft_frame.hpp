#pragma once

#include "aircraft/aircraft_state.hpp"
#include "aircraft/physics/force_accumulator.hpp"
#include "environment/atmosphere.hpp"

namespace contrail {

/**
 * @brief Scratch data shared by an aircraft's components during one tick.
 *
 * controls are sanitized before the first component runs; forces are
 * cleared at the start of every tick.
 */
struct AircraftFrame {
    ControlInputs controls;
    AtmosphereSample air;
    ForceAccumulator forces;
};

}
