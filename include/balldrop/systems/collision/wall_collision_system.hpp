/**
 * @file wall_collision_system.hpp
 * @brief Sphere versus oriented-box collision against the level's walls
 *
 * Each awake body is tested against every cached obstacle in list order.
 * The body center is moved into the obstacle's local frame, clamped to the
 * half extents to find the closest point, and a penetration is resolved
 * immediately before the next obstacle is tested. Corrections are applied
 * in sequence and never averaged across obstacles.
 */

#ifndef WALL_COLLISION_SYSTEM_HPP
#define WALL_COLLISION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "balldrop/core/level.hpp"
#include "balldrop/systems/i_system.hpp"

namespace Systems {

struct WallCollisionConfig {
    // Push-out per obstacle is capped at this fraction of the radius
    double maxCorrectionFraction = 0.5;

    // Overshoot applied to the capped push-out
    double correctionOvershoot = 1.1;

    // Penetration deeper than this fraction of the radius counts as embedded
    double deepPenetrationFraction = 0.5;

    // Velocity scale applied to embedded bodies
    double embeddedVelocityScale = 0.5;

    // Fraction of the body's friction removed from tangential velocity per contact
    double tangentialFrictionScale = 0.02;
};

/**
 * @brief Result of testing one sphere against one oriented box
 */
struct WallContact {
    bool touching = false;
    double penetration = 0.0;   // radius - distance, positive when overlapping
    Vector worldNormal;         // points from the box toward the sphere
};

class WallCollisionSystem : public ConfigurableSystem<WallCollisionConfig> {
public:
    /**
     * @param obstacles Cache shared with the simulator; must outlive this system
     */
    explicit WallCollisionSystem(const ObstacleCache& obstacles);
    ~WallCollisionSystem() override = default;

    void update(entt::registry& registry) override;

    /**
     * @brief Closest-point test of a sphere against an oriented box
     */
    static WallContact testSphere(const CachedObstacle& obstacle,
                                  const Position& center, double radius);

    /**
     * @brief Signed distance from the sphere surface to the box
     *
     * Negative when the sphere overlaps the box. A center inside the box is
     * measured from the nearest face.
     */
    static double surfaceDistance(const CachedObstacle& obstacle,
                                  const Position& center, double radius);

private:
    const ObstacleCache& obstacles;
};

} // namespace Systems

#endif
