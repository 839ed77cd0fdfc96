#include "balldrop/systems/lifecycle.hpp"

#include <utility>
#include <vector>

#include "balldrop/components/basic.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"

namespace Systems {

LifecycleSystem::LifecycleSystem(entt::dispatcher& dispatcher)
    : dispatcher(dispatcher) {}

void LifecycleSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("LifecycleSystem");

    const auto* state = findSimulatorState(registry);
    double const now = state != nullptr ? state->elapsedTime : 0.0;

    std::vector<std::pair<entt::entity, Components::DestroyReason>> staged;

    auto view = registry.view<Components::Position, Components::Lifetime>(
        entt::exclude<Components::PendingDestroy>);
    for (auto [entity, pos, lifetime] : view.each()) {
        if (now - lifetime.spawnTime > lifetime.maxLifetime) {
            staged.emplace_back(entity, Components::DestroyReason::Expired);
        } else if (pos.y < sysConfig.KillPlaneY) {
            staged.emplace_back(entity, Components::DestroyReason::BelowKillPlane);
        }
    }

    for (const auto& [entity, reason] : staged) {
        registry.emplace<Components::PendingDestroy>(entity, Components::PendingDestroy{reason});
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Lifecycle] staged " << entt::to_integral(entity)
                  << " (" << destroyReasonName(reason) << ")\n");
    }

    lastDestroyed = destroyPendingBodies(registry, dispatcher);
    if (lastDestroyed > 0) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Lifecycle] destroyed " << lastDestroyed << " bodies\n");
    }
}

} // namespace Systems
