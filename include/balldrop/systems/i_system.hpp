/**
 * @file i_system.hpp
 * @brief Interface for the per-tick simulation passes
 */

#pragma once

#include <entt/entt.hpp>
#include "balldrop/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all passes in the tick pipeline
 * 
 * The simulator owns an ordered list of systems and calls update() on each
 * once per tick. Every pass reads the mutations of the pass before it.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;
    
    /**
     * @brief Runs the pass for one simulation step
     * 
     * The step length is read from the SimulatorState singleton.
     *
     * @param registry EnTT registry holding the bodies
     */
    virtual void update(entt::registry& registry) = 0;
    
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }
    
    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems with tuning beyond the shared SystemConfig
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;
    
public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }
    
    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
