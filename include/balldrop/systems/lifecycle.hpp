/**
 * @file lifecycle.hpp
 * @brief Expiry and kill-plane cleanup, and the batched destroy step
 *
 * Runs last in the tick. Balls older than their maxLifetime or below the
 * kill plane are tagged PendingDestroy; every tagged ball (including the
 * ones a goal gate scored earlier in the tick) is then destroyed in one
 * batch after the scan has finished.
 */

#pragma once

#include <cstddef>
#include <entt/entt.hpp>
#include "balldrop/systems/i_system.hpp"

namespace Systems {

class LifecycleSystem : public ISystem {
public:
    explicit LifecycleSystem(entt::dispatcher& dispatcher);
    ~LifecycleSystem() override = default;

    void update(entt::registry& registry) override;

    /**
     * @brief Balls destroyed by the most recent update
     */
    std::size_t lastDestroyedCount() const { return lastDestroyed; }

private:
    entt::dispatcher& dispatcher;
    std::size_t lastDestroyed = 0;
};

} // namespace Systems
