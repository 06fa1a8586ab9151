#include "scripting/control_script.hpp"
#include "core/properties/property_bus.hpp"
#include "core/properties/property_paths.hpp"
#include "utils/config_loader.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace contrail {

namespace {

constexpr const char* KEYFRAMES = "keyframes";
constexpr const char* TIME = "t";

void readChannel(const nlohmann::json& frame, const char* key, double time, std::size_t index,
                 ControlScript::Channel& channel) {
    if (!frame.contains(key)) {
        return;
    }
    const auto& value = frame[key];
    if (!value.is_number() || !std::isfinite(value.get<double>())) {
        throw ConfigError("Expected a finite number for 'keyframes[" + std::to_string(index) + "]." + key + "'");
    }
    channel.keys.push_back({time, value.get<double>()});
}

double lastTime(const ControlScript::Channel& channel) {
    return channel.empty() ? 0.0 : channel.keys.back().time;
}

}

double ControlScript::Channel::sample(double time) const {
    if (keys.empty()) {
        return 0.0;
    }
    if (time <= keys.front().time) {
        return keys.front().value;
    }
    if (time >= keys.back().time) {
        return keys.back().value;
    }
    auto upper = std::upper_bound(keys.begin(), keys.end(), time,
        [](double t, const Key& key) { return t < key.time; });
    const Key& b = *upper;
    const Key& a = *(upper - 1);
    double span = b.time - a.time;
    if (span <= 0.0) {
        return b.value;
    }
    double t = (time - a.time) / span;
    return a.value + (b.value - a.value) * t;
}

ControlScript::ControlScript(PropertyBus& bus)
    : m_bus(&bus)
{
}

ControlScript ControlScript::fromJson(const nlohmann::json& json) {
    const nlohmann::json* frames = &json;
    if (json.is_object()) {
        if (!json.contains(KEYFRAMES)) {
            throw ConfigError("Control script is missing 'keyframes'");
        }
        frames = &json[KEYFRAMES];
    }
    if (!frames->is_array()) {
        throw ConfigError("'keyframes' must be an array");
    }

    ControlScript script;
    for (std::size_t i = 0; i < frames->size(); ++i) {
        const auto& frame = (*frames)[i];
        if (!frame.is_object() || !frame.contains(TIME) || !frame[TIME].is_number()) {
            throw ConfigError("'keyframes[" + std::to_string(i) + "]' needs a numeric 't'");
        }
        double time = frame[TIME].get<double>();
        if (!std::isfinite(time) || time < 0.0) {
            throw ConfigError("'keyframes[" + std::to_string(i) + "].t' must be a non-negative time");
        }
        readChannel(frame, "throttle", time, i, script.m_throttle);
        readChannel(frame, "elevator", time, i, script.m_elevator);
        readChannel(frame, "aileron", time, i, script.m_aileron);
        readChannel(frame, "rudder", time, i, script.m_rudder);
    }
    script.m_keyframeCount = frames->size();

    auto byTime = [](const Key& a, const Key& b) { return a.time < b.time; };
    for (Channel* channel : {&script.m_throttle, &script.m_elevator, &script.m_aileron, &script.m_rudder}) {
        std::stable_sort(channel->keys.begin(), channel->keys.end(), byTime);
    }
    return script;
}

std::optional<ControlScript> ControlScript::load(const std::string& path) {
    auto json = loadJsonConfig(path);
    if (!json) {
        std::cerr << "[ControlScript] Failed to load control script: " << path << std::endl;
        return std::nullopt;
    }
    ControlScript script = fromJson(*json);
    std::cout << "[ControlScript] Loaded " << script.keyframeCount() << " keyframes ("
              << script.duration() << " s) from " << path << std::endl;
    return script;
}

void ControlScript::init() {
    if (!m_bus) {
        throw std::runtime_error("ControlScript has no property bus attached");
    }
    apply(m_bus->get(Properties::Sim::TIME, 0.0));
}

void ControlScript::tick(double dt) {
    (void)dt;
    if (m_bus) {
        apply(m_bus->get(Properties::Sim::TIME, 0.0));
    }
}

void ControlScript::apply(double time) {
    if (!m_bus) {
        return;
    }
    if (!m_throttle.empty()) m_bus->set(Properties::Controls::THROTTLE, m_throttle.sample(time));
    if (!m_elevator.empty()) m_bus->set(Properties::Controls::ELEVATOR, m_elevator.sample(time));
    if (!m_aileron.empty()) m_bus->set(Properties::Controls::AILERON, m_aileron.sample(time));
    if (!m_rudder.empty()) m_bus->set(Properties::Controls::RUDDER, m_rudder.sample(time));
}

double ControlScript::duration() const {
    return std::max({lastTime(m_throttle), lastTime(m_elevator), lastTime(m_aileron), lastTime(m_rudder)});
}

}
