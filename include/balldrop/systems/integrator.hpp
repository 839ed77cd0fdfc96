/**
 * @file integrator.hpp
 * @brief System advancing awake bodies under gravity and drag
 *
 * This system handles, per awake body and in this order:
 * - Gravity: velocity += gravity * dt
 * - Exponential drag: velocity *= (1 - friction * dt)
 * - Terminal velocity clamp (prevents tunneling through thin walls)
 * - Position advance: position += velocity * dt
 * - Corruption guard: NaN/Inf or far out-of-arena bodies are reset to the
 *   fallback position at rest
 * - Hard clamp into the arena bounds
 * - Sleep evaluation
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Material (friction)
 * - Sleep (skip asleep bodies, put slow bodies to sleep)
 */

#ifndef INTEGRATOR_SYSTEM_HPP
#define INTEGRATOR_SYSTEM_HPP

#include <entt/entt.hpp>
#include "balldrop/systems/i_system.hpp"

namespace Systems {

/**
 * @struct IntegratorConfig
 * @brief Configuration parameters specific to the integrator
 */
struct IntegratorConfig {
    // A body sleeps when |v| < threshold and |v.y| < threshold * this factor
    double verticalSleepFactor = 2.0;

    // Ticks between periodic population summaries at DEBUG_LEVEL_BASIC
    int summaryIntervalTicks = 300;
};

/**
 * @class IntegratorSystem
 * @brief Semi-implicit Euler step for every awake body
 */
class IntegratorSystem : public ConfigurableSystem<IntegratorConfig> {
public:
    IntegratorSystem() = default;
    ~IntegratorSystem() override = default;

    /**
     * @brief Advances all awake bodies by the current step
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry& registry) override;
};

} // namespace Systems

#endif
