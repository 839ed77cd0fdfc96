/**
 * @file integrator.cpp
 * @brief Implementation of the body integrator
 */

#include "balldrop/systems/integrator.hpp"

#include <algorithm>
#include <cmath>

#include "balldrop/components/basic.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"

namespace Systems {

namespace {

bool outsideCorruptionLimit(const Position& p, double limit) {
    return std::fabs(p.x) > limit || std::fabs(p.y) > limit;
}

// Clamps one axis and kills velocity pushing further out. Returns true if clamped.
bool clampAxis(double& pos, double& vel, double lo, double hi) {
    if (pos < lo) {
        pos = lo;
        vel = std::max(vel, 0.0);
        return true;
    }
    if (pos > hi) {
        pos = hi;
        vel = std::min(vel, 0.0);
        return true;
    }
    return false;
}

} // namespace

void IntegratorSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("IntegratorSystem");

    auto* state = findSimulatorState(registry);
    if (state == nullptr) {
        WARN_MSG("Integrator", "no SimulatorState found, skipping update");
        return;
    }

    double const dt = std::clamp(state->lastStep, 0.0, sysConfig.MaxTimeStep);
    const Vector& gravity = sysConfig.Gravity;
    double const terminal = sysConfig.TerminalVelocity;
    double const limit = sysConfig.CorruptionLimit;

    int total = 0;
    int moving = 0;
    std::uint64_t resets = 0;

    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::Material, Components::Sleep>();

    for (auto [entity, pos, vel, material, sleep] : view.each()) {
        ++total;
        if (sleep.asleep) {
            continue;
        }
        ++moving;

        vel += gravity * dt;

        double const drag = std::max(0.0, 1.0 - material.friction * dt);
        vel *= drag;

        vel = vel.clampLength(terminal);

        Position next = pos + vel * dt;

        if (!next.isFinite() || !vel.isFinite() || outsideCorruptionLimit(next, limit)) {
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Integrator] corrupted body at ("
                      << next.x << ", " << next.y << ", " << next.z << ") reset\n");
            next = sysConfig.FallbackPosition;
            vel = Vector();
            ++resets;
        }

        bool clamped = false;
        clamped |= clampAxis(next.x, vel.x, sysConfig.ArenaMin.x, sysConfig.ArenaMax.x);
        clamped |= clampAxis(next.y, vel.y, sysConfig.ArenaMin.y, sysConfig.ArenaMax.y);
        clamped |= clampAxis(next.z, vel.z, sysConfig.ArenaMin.z, sysConfig.ArenaMax.z);
        if (clamped) {
            ++state->stats.boundsClamps;
        }

        pos = next;

        if (vel.length() < sleep.threshold &&
            std::fabs(vel.y) < sleep.threshold * specificConfig.verticalSleepFactor)
        {
            sleep.asleep = true;
            vel = Vector();
        }
    }

    if (resets > 0) {
        state->stats.corruptionResets += resets;
        WARN_MSG("Integrator", "reset " << resets << " corrupted bodies to the fallback position");
    }

    if (specificConfig.summaryIntervalTicks > 0 &&
        state->tickIndex % static_cast<std::uint64_t>(specificConfig.summaryIntervalTicks) == 0 &&
        total > 0)
    {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Integrator] Total:" << total << " Moving:" << moving
                  << " Sleeping:" << (total - moving) << "\n");
    }
}

} // namespace Systems
