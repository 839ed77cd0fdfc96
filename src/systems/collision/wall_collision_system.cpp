#include "balldrop/systems/collision/wall_collision_system.hpp"

#include <algorithm>
#include <cmath>

#include "balldrop/components/basic.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"

namespace Systems {

namespace {

constexpr double kMinNormalLength = 1e-4;

/**
 * @brief Outward normal of the face nearest to a point inside the box
 */
Vector nearestFaceNormal(const Vector& local, const Vector& half, double& depth) {
    double const dx = half.x - std::fabs(local.x);
    double const dy = half.y - std::fabs(local.y);
    double const dz = half.z - std::fabs(local.z);

    // Ties prefer y so a body sunk into a floor leaves through the top
    if (dy <= dx && dy <= dz) {
        depth = dy;
        return Vector(0.0, local.y >= 0.0 ? 1.0 : -1.0, 0.0);
    }
    if (dx <= dz) {
        depth = dx;
        return Vector(local.x >= 0.0 ? 1.0 : -1.0, 0.0, 0.0);
    }
    depth = dz;
    return Vector(0.0, 0.0, local.z >= 0.0 ? 1.0 : -1.0);
}

} // namespace

WallCollisionSystem::WallCollisionSystem(const ObstacleCache& obstacles)
    : obstacles(obstacles) {}

WallContact WallCollisionSystem::testSphere(const CachedObstacle& obstacle,
                                            const Position& center, double radius) {
    WallContact contact;

    Vector const local = obstacle.toLocal(center);
    Vector const& half = obstacle.halfExtents;
    Vector const closest = local.clamp(-half, half);
    Vector const delta = local - closest;
    double const distance = delta.length();

    if (distance >= radius) {
        return contact;
    }

    Vector localNormal;
    if (distance > kMinNormalLength) {
        localNormal = delta / distance;
    } else {
        double depth = 0.0;
        localNormal = nearestFaceNormal(local, half, depth);
    }

    contact.touching = true;
    contact.penetration = radius - distance;
    contact.worldNormal = obstacle.toWorld(localNormal);
    return contact;
}

double WallCollisionSystem::surfaceDistance(const CachedObstacle& obstacle,
                                            const Position& center, double radius) {
    Vector const local = obstacle.toLocal(center);
    Vector const& half = obstacle.halfExtents;
    Vector const closest = local.clamp(-half, half);
    double const distance = (local - closest).length();

    if (distance > 0.0) {
        return distance - radius;
    }
    double depth = 0.0;
    nearestFaceNormal(local, half, depth);
    return -depth - radius;
}

void WallCollisionSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("WallCollisionSystem");

    if (obstacles.empty()) {
        return;
    }

    std::uint64_t contacts = 0;

    auto view = registry.view<Components::Position, Components::Velocity, Components::Radius,
                              Components::Material, Components::Sleep>();

    for (auto [entity, pos, vel, radius, material, sleep] : view.each()) {
        if (sleep.asleep) {
            continue;
        }

        double const r = radius.value;

        for (const auto& obstacle : obstacles.obstacles()) {
            WallContact const contact = testSphere(obstacle, pos, r);
            if (!contact.touching) {
                continue;
            }
            ++contacts;

            const Vector& n = contact.worldNormal;
            double const push = std::min(contact.penetration, r * specificConfig.maxCorrectionFraction);
            pos += n * (push * specificConfig.correctionOvershoot);

            double const normalVelocity = vel.dotProduct(n);
            if (normalVelocity < 0.0) {
                vel -= n * (normalVelocity * (1.0 + obstacle.restitution));

                if (contact.penetration > r * specificConfig.deepPenetrationFraction) {
                    vel *= specificConfig.embeddedVelocityScale;
                }

                Vector const tangent = vel - n * vel.dotProduct(n);
                vel -= tangent * (specificConfig.tangentialFrictionScale * material.friction);
            }

            sleep.asleep = false;
        }
    }

    if (auto* state = findSimulatorState(registry)) {
        state->stats.wallContacts += contacts;
    }
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[WallCollision] " << contacts << " contacts against "
              << obstacles.size() << " walls\n");
}

} // namespace Systems
