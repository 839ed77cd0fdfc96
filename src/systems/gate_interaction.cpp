#include "balldrop/systems/gate_interaction.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "balldrop/components/basic.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"

namespace Systems {

namespace {

struct PendingMultiply {
    int gateInstanceId;
    std::vector<Body> clones;
    std::size_t overCeiling = 0;
};

} // namespace

GateInteractionSystem::GateInteractionSystem(const GateTable& gates, Spawner& spawner,
                                             entt::dispatcher& dispatcher)
    : gates(gates), spawner(spawner), dispatcher(dispatcher), rng(sysConfig.RandomSeed) {}

void GateInteractionSystem::setSystemConfig(const SystemConfig& config) {
    ISystem::setSystemConfig(config);
    rng.seed(config.RandomSeed);
}

std::int64_t GateInteractionSystem::effectiveMultiplier(int gateMultiplier, double boost) const {
    auto const ceiling = static_cast<std::int64_t>(sysConfig.MaxBodies);
    std::int64_t multiplier = gateMultiplier;
    if (specificConfig.applyMultiplierBoost && std::isfinite(boost)) {
        double const extra = std::clamp(std::round(boost), -static_cast<double>(ceiling),
                                        static_cast<double>(ceiling));
        multiplier += static_cast<std::int64_t>(extra);
    }
    return std::clamp<std::int64_t>(multiplier, 1, ceiling + 1);
}

bool GateInteractionSystem::isCheckTick(std::uint64_t tickIndex) const {
    if (specificConfig.checkInterval <= 1) {
        return true;
    }
    return tickIndex % static_cast<std::uint64_t>(specificConfig.checkInterval) == 0;
}

void GateInteractionSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("GateInteractionSystem");

    auto* state = findSimulatorState(registry);
    if (state == nullptr || gates.empty() || !isCheckTick(state->tickIndex)) {
        return;
    }

    std::vector<entt::entity> scored;
    std::vector<PendingMultiply> multiplies;

    // Clones staged earlier in this scan count against the ceiling too
    std::size_t budget = spawner.remainingCapacity();

    auto view = registry.view<Components::Position, Components::GateTracker,
                              Components::BallType, Components::Sleep>(
        entt::exclude<Components::PendingDestroy>);

    for (auto [entity, pos, tracker, ballType, sleep] : view.each()) {
        if (sleep.asleep) {
            continue;
        }

        for (const auto& gate : gates.gates()) {
            auto const bit = static_cast<std::size_t>(gate.instanceId);
            if (tracker.hitGates.test(bit) || !gate.bounds.contains(pos)) {
                continue;
            }
            tracker.hitGates.set(bit);

            if (gate.multiplier == 1) {
                dispatcher.enqueue<ScoreEvent>(ScoreEvent{ballType.type, ballType.pointsMultiplier});
                scored.push_back(entity);
                break;
            }

            std::int64_t const multiplier =
                effectiveMultiplier(gate.multiplier, ballType.multiplierBoost);

            // Snapshot after the bit is set so every clone carries it
            auto source = readBody(registry, entity);
            if (!source) {
                continue;
            }

            PendingMultiply pending;
            pending.gateInstanceId = gate.instanceId;

            double const r = source->radius;
            std::uniform_real_distribution<double> spread(-specificConfig.cloneSpread * r,
                                                          specificConfig.cloneSpread * r);
            auto const wanted = static_cast<std::size_t>(multiplier - 1);
            std::size_t const built = std::min(wanted, budget);
            budget -= built;
            pending.overCeiling = wanted - built;
            pending.clones.reserve(built);
            for (std::size_t i = 0; i < built; ++i) {
                Body clone = *source;
                double const xOffset = spread(rng);
                clone.position = source->position +
                    Vector(xOffset, specificConfig.cloneStackSpacing * r * static_cast<double>(i + 1), 0.0);
                clone.velocity = Vector(xOffset * specificConfig.cloneVelocityScale, 0.0, 0.0);
                clone.asleep = false;
                pending.clones.push_back(clone);
            }
            multiplies.push_back(std::move(pending));
        }
    }

    for (auto entity : scored) {
        registry.emplace_or_replace<Components::PendingDestroy>(
            entity, Components::PendingDestroy{Components::DestroyReason::Scored});
    }
    state->stats.scored += scored.size();

    for (const auto& pending : multiplies) {
        int spawned = 0;
        for (const auto& clone : pending.clones) {
            if (spawner.spawnClone(clone).ok()) {
                ++spawned;
            }
        }
        if (pending.overCeiling > 0) {
            spawner.dropClones(pending.overCeiling);
        }
        ++state->stats.multiplications;
        dispatcher.enqueue<MultiplyEvent>(MultiplyEvent{pending.gateInstanceId, spawned});
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Gate] gate " << pending.gateInstanceId << " spawned "
                  << spawned << " of " << pending.clones.size() + pending.overCeiling << " clones\n");
    }
}

} // namespace Systems
