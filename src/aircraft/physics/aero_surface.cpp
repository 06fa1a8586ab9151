#include "aircraft/physics/aero_surface.hpp"

namespace contrail {

float AeroSurfaceParams::deflectionSign() const {
    switch (control.channel) {
    case ControlChannel::Aileron:
        // Differential: the right surface goes trailing-edge down for positive input.
        return side == SurfaceSide::Left ? -1.0f : 1.0f;
    case ControlChannel::Elevator:
        return 1.0f;
    case ControlChannel::Rudder:
        // Positive rudder pushes the fin toward -X, swinging the nose toward +X.
        return -1.0f;
    case ControlChannel::None:
        break;
    }
    return 0.0f;
}

const char* toString(SurfaceRole role) {
    switch (role) {
    case SurfaceRole::Wing: return "wing";
    case SurfaceRole::Aileron: return "aileron";
    case SurfaceRole::HorizontalTail: return "horizontal-tail";
    case SurfaceRole::VerticalTail: return "vertical-tail";
    }
    return "unknown";
}

const char* toString(SurfaceSide side) {
    switch (side) {
    case SurfaceSide::Left: return "left";
    case SurfaceSide::Right: return "right";
    case SurfaceSide::Centre: return "centre";
    }
    return "unknown";
}

const char* toString(ControlChannel channel) {
    switch (channel) {
    case ControlChannel::None: return "none";
    case ControlChannel::Aileron: return "aileron";
    case ControlChannel::Elevator: return "elevator";
    case ControlChannel::Rudder: return "rudder";
    }
    return "unknown";
}

}
