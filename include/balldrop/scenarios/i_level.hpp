/**
 * @file i_level.hpp
 * @brief Declaration of the ILevel interface
 */

#pragma once

#include "balldrop/core/level.hpp"
#include "balldrop/core/system_config.hpp"
#include "balldrop/systems/collision/broad_phase_system.hpp"
#include "balldrop/systems/collision/wall_collision_system.hpp"
#include "balldrop/systems/gate_interaction.hpp"
#include "balldrop/systems/integrator.hpp"

/**
 * @struct LevelSystemConfig
 * @brief Complete configuration for a level, including shared and system-specific parameters
 */
struct LevelSystemConfig {
    // Shared parameters used by all systems
    SystemConfig sharedConfig;

    // System-specific configurations with sensible defaults
    Systems::IntegratorConfig integratorConfig;
    Systems::WallCollisionConfig wallConfig;
    Systems::BroadPhaseConfig broadPhaseConfig;
    Systems::GateConfig gateConfig;
};

/**
 * @brief Abstract base class for a built-in level
 *
 * Each level must provide:
 *  - getSystemsConfig() returning LevelSystemConfig
 *  - buildGeometry() returning the ordered wall and gate records
 */
class ILevel {
public:
    virtual ~ILevel() = default;

    virtual LevelSystemConfig getSystemsConfig() const = 0;

    /**
     * @brief Authoring output handed to the core once per load
     */
    virtual LevelGeometry buildGeometry() const = 0;

    /**
     * @brief Where the level's dropper releases balls
     */
    virtual Position dropOrigin() const = 0;
};
