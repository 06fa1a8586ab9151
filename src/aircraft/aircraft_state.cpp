#include "aircraft/aircraft_state.hpp"
#include <algorithm>
#include <cmath>

namespace contrail {

namespace {
float clampChannel(float value, float lo, float hi) {
    if (!std::isfinite(value)) {
        return 0.0f;
    }
    return std::clamp(value, lo, hi);
}
}

ControlInputs ControlInputs::sanitized() const {
    ControlInputs out;
    out.throttle = clampChannel(throttle, 0.0f, 1.0f);
    out.elevator = clampChannel(elevator, -1.0f, 1.0f);
    out.aileron = clampChannel(aileron, -1.0f, 1.0f);
    out.rudder = clampChannel(rudder, -1.0f, 1.0f);
    return out;
}

}
