#pragma once

#include "core/subsystem.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace contrail {

class PropertyBus;

/**
 * @brief Timeline of pilot inputs replayed onto the global control properties.
 *
 * Each keyframe sets any subset of throttle, elevator, aileron and rudder at
 * time t. Channels are interpolated linearly between their own keyframes and
 * held flat before the first and after the last one. A channel no keyframe
 * mentions is left untouched on the bus.
 */
class ControlScript : public Subsystem {
public:
    struct Key {
        double time = 0.0;
        double value = 0.0;
    };

    struct Channel {
        std::vector<Key> keys;

        bool empty() const { return keys.empty(); }
        double sample(double time) const;
    };

    ControlScript() = default;
    explicit ControlScript(PropertyBus& bus);

    // Throws ConfigError on malformed keyframes.
    static ControlScript fromJson(const nlohmann::json& json);
    static std::optional<ControlScript> load(const std::string& path);

    void attach(PropertyBus& bus) { m_bus = &bus; }

    void init() override;
    void tick(double dt) override;
    void shutdown() override {}
    std::string name() const override { return "ControlScript"; }

    // Writes every scripted channel for the given time.
    void apply(double time);

    double duration() const;
    std::size_t keyframeCount() const { return m_keyframeCount; }

    const Channel& throttle() const { return m_throttle; }
    const Channel& elevator() const { return m_elevator; }
    const Channel& aileron() const { return m_aileron; }
    const Channel& rudder() const { return m_rudder; }

private:
    PropertyBus* m_bus = nullptr;
    Channel m_throttle;
    Channel m_elevator;
    Channel m_aileron;
    Channel m_rudder;
    std::size_t m_keyframeCount = 0;
};

}
