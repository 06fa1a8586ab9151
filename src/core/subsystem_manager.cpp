#include "core/subsystem_manager.hpp"
#include <iostream>
#include <unordered_map>

namespace contrail {

void SubsystemManager::add(std::shared_ptr<Subsystem> subsystem) {
    if (!subsystem) {
        throw std::runtime_error("Cannot register a null subsystem");
    }
    const std::string name = subsystem->name();
    for (const auto& existing : m_subsystems) {
        if (existing->name() == name) {
            throw std::runtime_error("Duplicate subsystem name: " + name);
        }
    }
    m_subsystems.push_back(std::move(subsystem));
}

void SubsystemManager::initAll() {
    std::unordered_map<std::string, std::size_t> nameToIndex;
    nameToIndex.reserve(m_subsystems.size());
    for (std::size_t i = 0; i < m_subsystems.size(); ++i) {
        nameToIndex[m_subsystems[i]->name()] = i;
    }

    for (std::size_t i = 0; i < m_subsystems.size(); ++i) {
        const auto& sys = m_subsystems[i];
        for (const auto& dep : sys->dependencies()) {
            auto it = nameToIndex.find(dep);
            if (it == nameToIndex.end()) {
                throw std::runtime_error("Missing dependency for subsystem " + sys->name() + ": " + dep);
            }
            if (it->second > i) {
                throw std::runtime_error("Subsystem " + sys->name() + " must be added after dependency " + dep);
            }
        }
    }

    for (auto& sys : m_subsystems) {
        std::cout << "[SubsystemManager] Initializing " << sys->name() << "..." << std::endl;
        sys->init();
    }
    m_initialized = true;
}

void SubsystemManager::tickAll(double dt) {
    if (!m_initialized) {
        return;
    }
    for (auto& sys : m_subsystems) {
        sys->tick(dt);
    }
}

void SubsystemManager::shutdownAll() {
    for (auto it = m_subsystems.rbegin(); it != m_subsystems.rend(); ++it) {
        std::cout << "[SubsystemManager] Shutting down " << (*it)->name() << "..." << std::endl;
        (*it)->shutdown();
    }
    m_subsystems.clear();
    m_initialized = false;
}

}
