#include "balldrop/systems/collision/broad_phase_system.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "balldrop/components/basic.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"

namespace Systems {

namespace {

struct BodySnapshot {
    entt::entity entity;
    Position position;
    Vector velocity;
    double radius;
};

struct BodyResult {
    Vector push;
    Vector velocityDelta;
    bool touched = false;
};

constexpr double kCoincidentDistance = 1e-9;

} // namespace

void BroadPhaseSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("BroadPhaseSystem");

    std::vector<BodySnapshot> awake;
    std::vector<BodySnapshot> sleeping;
    double maxRadius = 0.0;

    {
        PROFILE_SCOPE("BroadPhaseSystem::snapshot");
        auto view = registry.view<Components::Position, Components::Velocity,
                                  Components::Radius, Components::Sleep>();
        for (auto [entity, pos, vel, radius, sleep] : view.each()) {
            if (sleep.asleep) {
                sleeping.push_back({entity, pos, vel, radius.value});
            } else {
                awake.push_back({entity, pos, vel, radius.value});
                maxRadius = std::max(maxRadius, radius.value);
            }
        }
    }

    grid.reset(std::max(specificConfig.cellSize, 2.0 * maxRadius));
    if (awake.empty()) {
        return;
    }

    for (std::size_t i = 0; i < awake.size(); ++i) {
        grid.insert(i, awake[i].position);
    }

    std::uint64_t contacts = 0;
    std::vector<std::size_t> neighbours;

    // Resolves @p self against every awake body near it. Writes only to @p out.
    auto resolve = [&](const BodySnapshot& self, bool selfAwake, BodyResult& out) {
        neighbours.clear();
        grid.queryNeighbourhood(self.position, neighbours);

        for (std::size_t j : neighbours) {
            const BodySnapshot& other = awake[j];
            if (other.entity == self.entity) {
                continue;
            }

            Vector const delta = self.position - other.position;
            double const dist = delta.length();
            double const minDist = self.radius + other.radius;
            if (dist >= minDist) {
                continue;
            }

            Vector normal;
            if (dist > kCoincidentDistance) {
                normal = delta / dist;
            } else {
                // Stacked exactly: separate along y by handle order
                bool const below = entt::to_integral(self.entity) < entt::to_integral(other.entity);
                normal = Vector(0.0, below ? -1.0 : 1.0, 0.0);
            }

            double const overlap = minDist - dist;
            double const push = std::min(overlap * specificConfig.penetrationFraction,
                                         self.radius * specificConfig.maxPushFraction);
            out.push += normal * (push * specificConfig.overshoot);

            double const approach = (self.velocity - other.velocity).dotProduct(normal);
            if (approach < 0.0) {
                out.velocityDelta -= normal * (approach * specificConfig.velocitySoftness);
            }

            out.touched = true;

            // Each awake pair is seen from both sides; count it once
            if (!selfAwake || entt::to_integral(self.entity) < entt::to_integral(other.entity)) {
                ++contacts;
            }
        }
    };

    std::vector<BodyResult> awakeResults(awake.size());
    std::vector<BodyResult> sleepingResults(sleeping.size());

    {
        PROFILE_SCOPE("BroadPhaseSystem::resolve");
        for (std::size_t i = 0; i < awake.size(); ++i) {
            resolve(awake[i], true, awakeResults[i]);
        }
        for (std::size_t i = 0; i < sleeping.size(); ++i) {
            resolve(sleeping[i], false, sleepingResults[i]);
        }
    }

    auto apply = [&registry](const BodySnapshot& snap, const BodyResult& result) {
        if (!result.touched) {
            return;
        }
        registry.get<Components::Position>(snap.entity) += result.push;
        registry.get<Components::Velocity>(snap.entity) += result.velocityDelta;
        registry.get<Components::Sleep>(snap.entity).asleep = false;
    };

    int woken = 0;
    for (std::size_t i = 0; i < awake.size(); ++i) {
        apply(awake[i], awakeResults[i]);
    }
    for (std::size_t i = 0; i < sleeping.size(); ++i) {
        if (sleepingResults[i].touched) {
            ++woken;
        }
        apply(sleeping[i], sleepingResults[i]);
    }

    if (auto* state = findSimulatorState(registry)) {
        state->stats.pairContacts += contacts;
    }
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[BroadPhase] awake:" << awake.size() << " cell:"
              << grid.getCellSize() << " contacts:" << contacts << " woken:" << woken << "\n");
}

} // namespace Systems
