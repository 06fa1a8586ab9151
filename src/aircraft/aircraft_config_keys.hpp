#pragma once

namespace contrail {
namespace ConfigKeys {

    // Root
    inline constexpr char NAME[] = "name";
    inline constexpr char PHYSICS[] = "physics";
    inline constexpr char ENGINE[] = "engine";
    inline constexpr char FUSELAGE[] = "fuselage";
    inline constexpr char STABILITY[] = "stability";
    inline constexpr char REFERENCE[] = "reference";
    inline constexpr char SURFACES[] = "surfaces";
    inline constexpr char SPAWN[] = "spawn";

    // Physics
    inline constexpr char MASS[] = "mass";
    inline constexpr char INERTIA[] = "inertia";
    inline constexpr char CENTRE_OF_GRAVITY[] = "centreOfGravity";
    inline constexpr char GROUND_ALTITUDE[] = "groundAltitude";
    inline constexpr char GROUND_FRICTION[] = "groundFriction";

    // Engine
    inline constexpr char MAX_THRUST[] = "maxThrust";
    inline constexpr char THRUST_POINT[] = "thrustPoint";

    // Fuselage
    inline constexpr char FRONTAL_AREA[] = "frontalArea";
    inline constexpr char CD[] = "cd";

    // Reference geometry
    inline constexpr char AREA[] = "area";
    inline constexpr char CHORD[] = "chord";
    inline constexpr char SPAN[] = "span";

    // Surface
    inline constexpr char ROLE[] = "role";
    inline constexpr char SIDE[] = "side";
    inline constexpr char POSITION[] = "position";
    inline constexpr char LIFT[] = "lift";
    inline constexpr char CD0[] = "cd0";
    inline constexpr char INDUCED_DRAG_FACTOR[] = "inducedDragFactor";
    inline constexpr char CD_STALL[] = "cdStall";
    inline constexpr char POST_STALL_SPAN_DEG[] = "postStallSpanDeg";
    inline constexpr char CONTROL[] = "control";

    // Lift curve
    inline constexpr char CL0[] = "cl0";
    inline constexpr char CL_ALPHA[] = "clAlpha";
    inline constexpr char STALL_ALPHA_DEG[] = "stallAlphaDeg";
    inline constexpr char STALL_ALPHA_NEG_DEG[] = "stallAlphaNegDeg";
    inline constexpr char POST_STALL_ALPHA_DEG[] = "postStallAlphaDeg";
    inline constexpr char CL_POST_STALL[] = "clPostStall";
    inline constexpr char CL_POST_STALL_NEG[] = "clPostStallNeg";
    inline constexpr char KNOTS_DEG[] = "knotsDeg";
    inline constexpr char ELEMENTS[] = "elements";

    // Control surface
    inline constexpr char CHANNEL[] = "channel";
    inline constexpr char MAX_DEFLECTION_DEG[] = "maxDeflectionDeg";
    inline constexpr char LIFT_SLOPE[] = "liftSlope";

    // Stability
    inline constexpr char PITCH_STABILITY[] = "pitchStability";
    inline constexpr char YAW_STABILITY[] = "yawStability";
    inline constexpr char ROLL_STABILITY[] = "rollStability";
    inline constexpr char PITCH_DAMPING[] = "pitchDamping";
    inline constexpr char YAW_DAMPING[] = "yawDamping";
    inline constexpr char ROLL_DAMPING[] = "rollDamping";
    inline constexpr char MIN_AIRSPEED[] = "minAirspeed";

    // Spawn
    inline constexpr char AIRSPEED[] = "airspeed";
    inline constexpr char HEADING_DEG[] = "headingDeg";
    inline constexpr char PITCH_DEG[] = "pitchDeg";
    inline constexpr char THROTTLE[] = "throttle";

} // namespace ConfigKeys
} // namespace contrail
