#include "aircraft/aircraft_config.hpp"
#include "aircraft/aircraft_config_keys.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include "utils/config_loader.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <utility>
#include <vector>

namespace contrail {

namespace {

constexpr float kDegToRad = static_cast<float>(PhysicsConstants::DEG_TO_RAD);

LiftCurve wingLiftCurve() {
    return LiftCurve::table({-90.0f, -5.0f, 0.0f, 10.0f, 15.0f, 90.0f},
                            {0.0f, 0.0f, 0.35f, 1.4f, 0.8f, 0.0f});
}

LiftCurve horizontalTailLiftCurve() {
    return LiftCurve::table({-90.0f, -10.0f, 0.0f, 10.0f, 90.0f},
                            {0.0f, -0.15f, 0.10f, 0.15f, 0.0f});
}

LiftCurve verticalTailLiftCurve() {
    return LiftCurve::table({-90.0f, -10.0f, -2.5f, 0.0f, 2.5f, 10.0f, 90.0f},
                            {0.0f, -0.01f, 0.0f, 0.0f, 0.0f, 0.01f, 0.0f});
}

AeroSurfaceParams makeSurface(const char* name, SurfaceRole role, SurfaceSide side,
                              const Vec3& position, float area, LiftCurve lift) {
    AeroSurfaceParams surface;
    surface.name = name;
    surface.role = role;
    surface.side = side;
    surface.position = position;
    surface.area = area;
    surface.lift = std::move(lift);
    return surface;
}

ControlSurfaceParams makeControl(ControlChannel channel, float maxDeflectionDeg, float liftSlope) {
    ControlSurfaceParams control;
    control.channel = channel;
    control.maxDeflection = maxDeflectionDeg * kDegToRad;
    control.liftSlope = liftSlope;
    return control;
}

std::string keyPath(const std::string& parent, const char* key) {
    return configKeyPath(parent, key);
}

// Range is checked on the double so an out-of-range value never reaches the float conversion.
float narrowToFloat(double value, const std::string& path) {
    if (!std::isfinite(value) || std::abs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        throw ConfigError("Value out of range for '" + path + "'");
    }
    return static_cast<float>(value);
}

float readNumberElement(const nlohmann::json& element, const std::string& path) {
    if (!element.is_number()) {
        throw ConfigError("Expected numbers in '" + path + "'");
    }
    return narrowToFloat(element.get<double>(), path);
}

float readFloat(const nlohmann::json& obj, const char* key, float fallback, const std::string& parent) {
    if (!obj.contains(key)) {
        return fallback;
    }
    return narrowToFloat(readConfigNumber(obj, key, fallback, parent), keyPath(parent, key));
}

float readPositive(const nlohmann::json& obj, const char* key, float fallback, const std::string& parent) {
    float value = readFloat(obj, key, fallback, parent);
    if (!(value > 0.0f)) {
        throw ConfigError("'" + keyPath(parent, key) + "' must be positive");
    }
    return value;
}

Vec3 readVec3(const nlohmann::json& obj, const char* key, const Vec3& fallback, const std::string& parent) {
    if (!obj.contains(key)) {
        return fallback;
    }
    const auto& value = obj[key];
    if (!value.is_array() || value.size() != 3) {
        throw ConfigError("Expected [x, y, z] for '" + keyPath(parent, key) + "'");
    }
    const std::string path = keyPath(parent, key);
    return Vec3(readNumberElement(value[0], path),
                readNumberElement(value[1], path),
                readNumberElement(value[2], path));
}

std::vector<float> readFloatArray(const nlohmann::json& obj, const char* key, const std::string& parent) {
    if (!obj.contains(key) || !obj[key].is_array()) {
        throw ConfigError("Expected an array for '" + keyPath(parent, key) + "'");
    }
    std::vector<float> values;
    const std::string path = keyPath(parent, key);
    for (const auto& element : obj[key]) {
        values.push_back(readNumberElement(element, path));
    }
    return values;
}

SurfaceRole parseRole(const std::string& value, const std::string& path) {
    if (value == "wing") return SurfaceRole::Wing;
    if (value == "aileron") return SurfaceRole::Aileron;
    if (value == "horizontal-tail") return SurfaceRole::HorizontalTail;
    if (value == "vertical-tail") return SurfaceRole::VerticalTail;
    throw ConfigError("Unknown surface role '" + value + "' at '" + path + "'");
}

SurfaceSide parseSide(const std::string& value, const std::string& path) {
    if (value == "left") return SurfaceSide::Left;
    if (value == "right") return SurfaceSide::Right;
    if (value == "centre" || value == "center") return SurfaceSide::Centre;
    throw ConfigError("Unknown surface side '" + value + "' at '" + path + "'");
}

ControlChannel parseChannel(const std::string& value, const std::string& path) {
    if (value == "none") return ControlChannel::None;
    if (value == "aileron") return ControlChannel::Aileron;
    if (value == "elevator") return ControlChannel::Elevator;
    if (value == "rudder") return ControlChannel::Rudder;
    throw ConfigError("Unknown control channel '" + value + "' at '" + path + "'");
}

std::string readString(const nlohmann::json& obj, const char* key, const std::string& fallback, const std::string& parent) {
    return readConfigString(obj, key, fallback, parent);
}

LiftCurve parseLiftCurve(const nlohmann::json& lift, const std::string& path) {
    using namespace ConfigKeys;
    if (!lift.is_object()) {
        throw ConfigError("Expected an object for '" + path + "'");
    }

    if (lift.contains(KNOTS_DEG) || lift.contains(ELEMENTS)) {
        try {
            return LiftCurve::table(readFloatArray(lift, KNOTS_DEG, path), readFloatArray(lift, ELEMENTS, path));
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Invalid lift table at '" + path + "': " + e.what());
        }
    }

    LinearLiftParams params;
    params.cl0 = readFloat(lift, CL0, params.cl0, path);
    params.clAlpha = readFloat(lift, CL_ALPHA, params.clAlpha, path);
    params.stallAlpha = readPositive(lift, STALL_ALPHA_DEG, params.stallAlpha / kDegToRad, path) * kDegToRad;
    params.stallAlphaNeg = readFloat(lift, STALL_ALPHA_NEG_DEG, 0.0f, path) * kDegToRad;
    params.postStallAlpha = readFloat(lift, POST_STALL_ALPHA_DEG, 0.0f, path) * kDegToRad;
    params.clPostStall = readFloat(lift, CL_POST_STALL, params.clPostStall, path);
    params.clPostStallNeg = readFloat(lift, CL_POST_STALL_NEG, params.clPostStallNeg, path);
    return LiftCurve::linear(params);
}

AeroSurfaceParams parseSurface(const nlohmann::json& obj, std::size_t index) {
    using namespace ConfigKeys;
    const std::string path = std::string(SURFACES) + "[" + std::to_string(index) + "]";
    if (!obj.is_object()) {
        throw ConfigError("Expected an object for '" + path + "'");
    }

    AeroSurfaceParams surface;
    surface.name = readString(obj, NAME, "surface-" + std::to_string(index), path);
    surface.role = parseRole(readString(obj, ROLE, "wing", path), keyPath(path, ROLE));
    surface.side = parseSide(readString(obj, SIDE, "centre", path), keyPath(path, SIDE));
    surface.position = readVec3(obj, POSITION, surface.position, path);
    surface.area = readPositive(obj, AREA, 0.0f, path);

    if (obj.contains(LIFT)) {
        surface.lift = parseLiftCurve(obj[LIFT], keyPath(path, LIFT));
    } else if (surface.role == SurfaceRole::HorizontalTail) {
        surface.lift = horizontalTailLiftCurve();
    } else if (surface.role == SurfaceRole::VerticalTail) {
        surface.lift = verticalTailLiftCurve();
    } else {
        surface.lift = wingLiftCurve();
    }

    surface.cd0 = readFloat(obj, CD0, surface.cd0, path);
    surface.inducedDragFactor = readFloat(obj, INDUCED_DRAG_FACTOR, surface.inducedDragFactor, path);
    surface.cdStall = readFloat(obj, CD_STALL, surface.cdStall, path);
    surface.postStallSpan = readPositive(obj, POST_STALL_SPAN_DEG, surface.postStallSpan / kDegToRad, path) * kDegToRad;
    if (surface.cd0 < 0.0f || surface.inducedDragFactor < 0.0f || surface.cdStall < 0.0f) {
        throw ConfigError("Drag coefficients at '" + path + "' must not be negative");
    }

    if (obj.contains(CONTROL)) {
        const auto& control = obj[CONTROL];
        const std::string controlPath = keyPath(path, CONTROL);
        if (!control.is_object()) {
            throw ConfigError("Expected an object for '" + controlPath + "'");
        }
        surface.control.channel = parseChannel(readString(control, CHANNEL, "none", controlPath),
                                               keyPath(controlPath, CHANNEL));
        surface.control.maxDeflection =
            readPositive(control, MAX_DEFLECTION_DEG, surface.control.maxDeflection / kDegToRad, controlPath) * kDegToRad;
        surface.control.liftSlope = readFloat(control, LIFT_SLOPE, 0.0f, controlPath);
    }

    return surface;
}

} // namespace

AircraftConfig AircraftConfig::defaults() {
    AircraftConfig config;
    AeroConfig& aero = config.aero;

    aero.referenceArea = 16.5f;
    aero.referenceChord = 1.5f;
    aero.referenceSpan = 11.0f;
    aero.fuselage.frontalArea = 1.2f;
    aero.fuselage.cd = 0.25f;

    aero.stability.pitchDamping = 12.0f;
    aero.stability.yawDamping = 0.1f;
    aero.stability.rollDamping = 0.5f;

    aero.surfaces.push_back(makeSurface("wing-left", SurfaceRole::Wing, SurfaceSide::Left,
                                        {-2.75f, 0.0f, 0.1f}, 8.25f, wingLiftCurve()));
    aero.surfaces.push_back(makeSurface("wing-right", SurfaceRole::Wing, SurfaceSide::Right,
                                        {2.75f, 0.0f, 0.1f}, 8.25f, wingLiftCurve()));

    AeroSurfaceParams aileronLeft = makeSurface("aileron-left", SurfaceRole::Aileron, SurfaceSide::Left,
                                                {-4.5f, 0.0f, -0.1f}, 0.5f, wingLiftCurve());
    aileronLeft.control = makeControl(ControlChannel::Aileron, 20.0f, 3.0f);
    AeroSurfaceParams aileronRight = aileronLeft;
    aileronRight.name = "aileron-right";
    aileronRight.side = SurfaceSide::Right;
    aileronRight.position.x = 4.5f;
    aero.surfaces.push_back(aileronLeft);
    aero.surfaces.push_back(aileronRight);

    AeroSurfaceParams tailLeft = makeSurface("horizontal-tail-left", SurfaceRole::HorizontalTail, SurfaceSide::Left,
                                             {-1.0f, 0.0f, -4.5f}, 2.0f, horizontalTailLiftCurve());
    tailLeft.inducedDragFactor = 0.08f;
    tailLeft.control = makeControl(ControlChannel::Elevator, 25.0f, 3.0f);
    AeroSurfaceParams tailRight = tailLeft;
    tailRight.name = "horizontal-tail-right";
    tailRight.side = SurfaceSide::Right;
    tailRight.position.x = 1.0f;
    aero.surfaces.push_back(tailLeft);
    aero.surfaces.push_back(tailRight);

    AeroSurfaceParams fin = makeSurface("vertical-tail", SurfaceRole::VerticalTail, SurfaceSide::Centre,
                                        {0.0f, 1.0f, -4.5f}, 1.0f, verticalTailLiftCurve());
    fin.inducedDragFactor = 0.08f;
    fin.control = makeControl(ControlChannel::Rudder, 25.0f, 2.5f);
    aero.surfaces.push_back(fin);

    return config;
}

AircraftConfig parseAircraftConfig(const nlohmann::json& json) {
    using namespace ConfigKeys;
    if (!json.is_object()) {
        throw ConfigError("Aircraft config must be a JSON object");
    }

    AircraftConfig config = AircraftConfig::defaults();
    config.name = readString(json, NAME, config.name, "");

    if (const auto* section = findConfigSection(json, PHYSICS)) {
        const auto& physics = *section;
        config.physics.mass = readPositive(physics, MASS, config.physics.mass, PHYSICS);
        config.physics.inertia = readVec3(physics, INERTIA, config.physics.inertia, PHYSICS);
        if (!(config.physics.inertia.x > 0.0f && config.physics.inertia.y > 0.0f && config.physics.inertia.z > 0.0f)) {
            throw ConfigError("'physics.inertia' components must be positive");
        }
        config.aero.centreOfGravity = readVec3(physics, CENTRE_OF_GRAVITY, config.aero.centreOfGravity, PHYSICS);
        config.physics.groundAltitude = readFloat(physics, GROUND_ALTITUDE, config.physics.groundAltitude, PHYSICS);
        config.physics.groundFriction = readFloat(physics, GROUND_FRICTION, config.physics.groundFriction, PHYSICS);
    }

    if (const auto* section = findConfigSection(json, ENGINE)) {
        const auto& engine = *section;
        config.thrust.maxThrust = readFloat(engine, MAX_THRUST, config.thrust.maxThrust, ENGINE);
        if (config.thrust.maxThrust < 0.0f) {
            throw ConfigError("'engine.maxThrust' must not be negative");
        }
        config.thrust.thrustPoint = readVec3(engine, THRUST_POINT, config.thrust.thrustPoint, ENGINE);
    }

    if (const auto* section = findConfigSection(json, FUSELAGE)) {
        const auto& fuselage = *section;
        config.aero.fuselage.frontalArea = readFloat(fuselage, FRONTAL_AREA, config.aero.fuselage.frontalArea, FUSELAGE);
        config.aero.fuselage.cd = readFloat(fuselage, CD, config.aero.fuselage.cd, FUSELAGE);
    }

    if (const auto* section = findConfigSection(json, REFERENCE)) {
        const auto& reference = *section;
        config.aero.referenceArea = readPositive(reference, AREA, config.aero.referenceArea, REFERENCE);
        config.aero.referenceChord = readPositive(reference, CHORD, config.aero.referenceChord, REFERENCE);
        config.aero.referenceSpan = readPositive(reference, SPAN, config.aero.referenceSpan, REFERENCE);
    }

    if (const auto* section = findConfigSection(json, STABILITY)) {
        const auto& stab = *section;
        StabilityConfig& s = config.aero.stability;
        s.pitchStability = readFloat(stab, PITCH_STABILITY, s.pitchStability, STABILITY);
        s.yawStability = readFloat(stab, YAW_STABILITY, s.yawStability, STABILITY);
        s.rollStability = readFloat(stab, ROLL_STABILITY, s.rollStability, STABILITY);
        s.pitchDamping = readFloat(stab, PITCH_DAMPING, s.pitchDamping, STABILITY);
        s.yawDamping = readFloat(stab, YAW_DAMPING, s.yawDamping, STABILITY);
        s.rollDamping = readFloat(stab, ROLL_DAMPING, s.rollDamping, STABILITY);
        s.minAirspeed = readFloat(stab, MIN_AIRSPEED, s.minAirspeed, STABILITY);
    }

    if (json.contains(SURFACES)) {
        const auto& surfaces = json[SURFACES];
        if (!surfaces.is_array() || surfaces.empty()) {
            throw ConfigError("'surfaces' must be a non-empty array");
        }
        config.aero.surfaces.clear();
        for (std::size_t i = 0; i < surfaces.size(); ++i) {
            config.aero.surfaces.push_back(parseSurface(surfaces[i], i));
        }
    }

    if (const auto* section = findConfigSection(json, SPAWN)) {
        const auto& spawn = *section;
        config.spawn.position = readVec3(spawn, POSITION, config.spawn.position, SPAWN);
        config.spawn.airspeed = readFloat(spawn, AIRSPEED, config.spawn.airspeed, SPAWN);
        config.spawn.headingDeg = readFloat(spawn, HEADING_DEG, config.spawn.headingDeg, SPAWN);
        config.spawn.pitchDeg = readFloat(spawn, PITCH_DEG, config.spawn.pitchDeg, SPAWN);
        config.spawn.throttle = readFloat(spawn, THROTTLE, config.spawn.throttle, SPAWN);
    }

    return config;
}

std::optional<AircraftConfig> loadAircraftConfig(const std::string& path) {
    auto jsonOpt = loadJsonConfig(path);
    if (!jsonOpt) {
        std::cerr << "[Aircraft] Failed to load aircraft config: " << path << std::endl;
        return std::nullopt;
    }
    AircraftConfig config = parseAircraftConfig(*jsonOpt);
    std::cout << "[Aircraft] Loaded '" << config.name << "' with " << config.aero.surfaces.size()
              << " surfaces from " << path << std::endl;
    return config;
}

}
