#pragma once

#include <string>
#include <vector>

namespace contrail {

/**
 * @brief Simulation-side service driven by the App alongside the aircraft.
 *
 * Subsystems are ticked once per fixed physics step, after the aircraft have
 * been integrated, so they observe a consistent state and the published
 * Sim::TIME of that step.
 */
class Subsystem {
public:
    virtual ~Subsystem() = default;

    virtual void init() = 0;
    virtual void tick(double dt) = 0;
    virtual void shutdown() = 0;

    virtual std::string name() const = 0;

    // Names of subsystems that must be registered (and initialized) first.
    virtual std::vector<std::string> dependencies() const { return {}; }
};

}
