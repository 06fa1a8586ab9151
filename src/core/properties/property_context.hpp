#pragma once

#include "core/properties/property_bus.hpp"
#include <stdexcept>

namespace contrail {

/**
 * @brief The two buses an aircraft component talks to.
 *
 * shared() is the process-wide bus holding pilot controls and sim flags;
 * telemetry() is the aircraft's own bus that its components publish to.
 */
class PropertyContext {
public:
    PropertyContext() = default;
    PropertyContext(PropertyBus& shared, PropertyBus& telemetry)
        : m_shared(&shared), m_telemetry(&telemetry) {}

    void bind(PropertyBus& shared, PropertyBus& telemetry) {
        m_shared = &shared;
        m_telemetry = &telemetry;
    }

    bool bound() const { return m_shared && m_telemetry; }

    PropertyBus& shared() { return *checked(m_shared); }
    const PropertyBus& shared() const { return *checked(m_shared); }
    PropertyBus& telemetry() { return *checked(m_telemetry); }
    const PropertyBus& telemetry() const { return *checked(m_telemetry); }

private:
    static PropertyBus* checked(PropertyBus* bus) {
        if (!bus) {
            throw std::runtime_error("PropertyContext used before bind()");
        }
        return bus;
    }

    PropertyBus* m_shared = nullptr;
    PropertyBus* m_telemetry = nullptr;
};

}
