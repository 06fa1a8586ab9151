#pragma once

#include "core/properties/property_id.hpp"
#include "math/vec3.hpp"
#include "math/quat.hpp"

namespace contrail {
namespace Properties {

namespace Controls {
    inline constexpr TypedProperty<double> ELEVATOR("controls/flight/elevator");
    inline constexpr TypedProperty<double> AILERON("controls/flight/aileron");
    inline constexpr TypedProperty<double> RUDDER("controls/flight/rudder");
    inline constexpr TypedProperty<double> THROTTLE("controls/engines/current/throttle");
}

namespace Atmosphere {
    inline constexpr TypedProperty<double> DENSITY("atmosphere/density");
    inline constexpr TypedProperty<double> DENSITY_RATIO("atmosphere/sigma");
    inline constexpr TypedProperty<double> TEMPERATURE("atmosphere/temperature-k");
    inline constexpr TypedProperty<Vec3> WIND("atmosphere/wind");
}

namespace Aero {
    inline constexpr TypedProperty<double> AOA("aero/alpha-rad");
    inline constexpr TypedProperty<double> SIDESLIP("aero/beta-rad");
    inline constexpr TypedProperty<double> CL("aero/cl");
    inline constexpr TypedProperty<double> CD("aero/cd");
    inline constexpr TypedProperty<double> LIFT("aero/lift-n");
    inline constexpr TypedProperty<double> DRAG("aero/drag-n");
    inline constexpr TypedProperty<double> DYNAMIC_PRESSURE("aero/qbar-pa");
    inline constexpr TypedProperty<bool> STALLED("aero/stalled");
}

namespace Forces {
    inline constexpr TypedProperty<Vec3> AERO("forces/aero");
    inline constexpr TypedProperty<Vec3> THRUST("forces/thrust");
    inline constexpr TypedProperty<Vec3> GRAVITY("forces/gravity");
    inline constexpr TypedProperty<Vec3> TOTAL("forces/total");
    inline constexpr TypedProperty<Vec3> TORQUE("forces/torque");
}

namespace Velocities {
    inline constexpr TypedProperty<double> AIRSPEED("velocities/airspeed-mps");
    inline constexpr TypedProperty<double> VERTICAL_SPEED("velocities/vertical-speed-mps");
}

namespace Position {
    inline constexpr TypedProperty<double> ALTITUDE("position/altitude-m");
    inline constexpr TypedProperty<bool> ON_GROUND("position/on-ground");
}

namespace Orientation {
    inline constexpr TypedProperty<double> PITCH_DEG("orientation/pitch-deg");
    inline constexpr TypedProperty<double> ROLL_DEG("orientation/roll-deg");
    inline constexpr TypedProperty<double> HEADING_DEG("orientation/heading-deg");
}

namespace Sim {
    inline constexpr TypedProperty<bool> PAUSED("sim/paused");
    inline constexpr TypedProperty<bool> QUIT_REQUESTED("sim/quit-requested");
    inline constexpr TypedProperty<double> TIME("sim/time");
}

} // namespace Properties
} // namespace contrail
