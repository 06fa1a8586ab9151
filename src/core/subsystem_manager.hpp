#pragma once

#include "core/subsystem.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <vector>

namespace contrail {

class SubsystemManager {
public:
    void add(std::shared_ptr<Subsystem> subsystem);

    // Validates dependency order, then initializes in insertion order
    void initAll();

    void tickAll(double dt);

    // Shutdown all subsystems in reverse order
    void shutdownAll();

    std::size_t size() const { return m_subsystems.size(); }
    bool initialized() const { return m_initialized; }

    template<typename T>
    std::shared_ptr<T> get() {
        for (auto& sys : m_subsystems) {
            auto casted = std::dynamic_pointer_cast<T>(sys);
            if (casted) return casted;
        }
        return nullptr;
    }

    template<typename T>
    std::shared_ptr<T> getRequired() {
        auto system = get<T>();
        if (!system) {
            throw std::runtime_error(std::string("Required subsystem not found: ") + typeid(T).name());
        }
        return system;
    }

private:
    std::vector<std::shared_ptr<Subsystem>> m_subsystems;
    bool m_initialized = false;
};

}
