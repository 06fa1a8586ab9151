#pragma once

#include "core/properties/property_bus.hpp"
#include "core/properties/property_context.hpp"
#include "aircraft/aircraft_component.hpp"
#include "aircraft/aircraft_config.hpp"
#include "aircraft/aircraft_frame.hpp"
#include "aircraft/aircraft_state.hpp"
#include <memory>
#include <string>
#include <vector>

namespace contrail {

class Atmosphere;

class Aircraft {
public:
    class Instance {
    public:
        Instance() = default;
        Instance(const Instance&) = delete;
        Instance& operator=(const Instance&) = delete;

        void init(const AircraftConfig& config, Atmosphere& atmosphere);
        void update(float dt);

        const std::string& name() const { return m_config.name; }
        const AircraftConfig& config() const { return m_config; }

        AircraftState& state() { return m_currentState; }
        const AircraftState& state() const { return m_currentState; }

        // Per-aircraft telemetry bus
        PropertyBus& properties() { return m_properties.telemetry(); }
        const PropertyBus& properties() const { return m_properties.telemetry(); }

        const ControlInputs& controls() const { return m_frame.controls; }
        const ForceAccumulator& forces() const { return m_frame.forces; }

        template<typename T, typename... Args>
        T* addSystem(Args&&... args) {
            auto system = std::make_unique<T>(std::forward<Args>(args)...);
            T* ptr = system.get();
            system->init(m_currentState, m_properties);
            m_systems.push_back(std::move(system));
            return ptr;
        }

        template<typename T>
        T* getSystem() {
            for (auto& system : m_systems) {
                T* typed = dynamic_cast<T*>(system.get());
                if (typed) return typed;
            }
            return nullptr;
        }

        std::size_t systemCount() const { return m_systems.size(); }

    private:
        void readControls();

        AircraftConfig m_config;
        PropertyBus m_bus;
        PropertyContext m_properties;
        AircraftState m_currentState;
        AircraftFrame m_frame;

        std::vector<std::unique_ptr<AircraftComponent>> m_systems;
    };

    void init(Atmosphere& atmosphere);
    void fixedUpdate(float dt);
    void shutdown();

    // Returns nullptr when the file cannot be read; throws ConfigError on invalid content.
    Instance* spawnPlayer(const std::string& configPath);
    Instance* spawnPlayer(const AircraftConfig& config);

    Instance* player() { return m_player; }
    const Instance* player() const { return m_player; }
    const std::vector<std::unique_ptr<Instance>>& all() const { return m_instances; }

    void destroy(Instance* aircraft);
    void destroyAll();

private:
    Atmosphere* m_atmosphere = nullptr;
    std::vector<std::unique_ptr<Instance>> m_instances;
    Instance* m_player = nullptr;
};

}
