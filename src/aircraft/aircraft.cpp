#include "aircraft/aircraft.hpp"
#include <algorithm>
#include <stdexcept>

namespace contrail {

void Aircraft::init(Atmosphere& atmosphere) {
    m_atmosphere = &atmosphere;
}

void Aircraft::fixedUpdate(float dt) {
    for (auto& ac : m_instances) {
        ac->update(dt);
    }
}

void Aircraft::shutdown() {
    destroyAll();
}

Aircraft::Instance* Aircraft::spawnPlayer(const std::string& configPath) {
    auto config = loadAircraftConfig(configPath);
    if (!config) {
        return nullptr;
    }
    return spawnPlayer(*config);
}

Aircraft::Instance* Aircraft::spawnPlayer(const AircraftConfig& config) {
    if (!m_atmosphere) {
        throw std::runtime_error("Aircraft::spawnPlayer called before init");
    }

    auto aircraft = std::make_unique<Aircraft::Instance>();
    aircraft->init(config, *m_atmosphere);

    m_player = aircraft.get();
    m_instances.push_back(std::move(aircraft));
    return m_player;
}

void Aircraft::destroy(Instance* aircraft) {
    auto it = std::find_if(m_instances.begin(), m_instances.end(),
        [aircraft](const std::unique_ptr<Instance>& ac) { return ac.get() == aircraft; });

    if (it != m_instances.end()) {
        if (m_player == aircraft) {
            m_player = nullptr;
        }
        m_instances.erase(it);
    }
}

void Aircraft::destroyAll() {
    m_instances.clear();
    m_player = nullptr;
}

}
