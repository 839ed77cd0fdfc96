/**
 * @file level.hpp
 * @brief Static level geometry: oriented obstacles and trigger gates
 *
 * Level authoring produces plain records once per load. The core turns them
 * into read-only tables that the collision and gate passes iterate in list
 * order. Nothing here is mutated while the level is live, so the tables can
 * be shared by worker threads without locking.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "balldrop/math/aabb.hpp"
#include "balldrop/math/quaternion.hpp"
#include "balldrop/math/vector_math.hpp"

/**
 * @brief One static collider as authored: a box of @p halfExtents, rotated about its center
 */
struct ObstacleRecord {
    Position center;
    Vector halfExtents;
    Quaternion rotation;
    double restitution = 0.3;
};

/**
 * @brief One trigger volume as authored
 *
 * multiplier >= 2 multiplies balls passing through; multiplier == 1 is a goal
 * gate that scores and destroys them.
 */
struct GateRecord {
    AABB bounds;
    int multiplier = 2;
    int instanceId = 0;
};

/**
 * @brief Ordered input handed to the core at level load
 */
struct LevelGeometry {
    std::vector<ObstacleRecord> obstacles;
    std::vector<GateRecord> gates;
};

/**
 * @brief Obstacle with its inverse rotation precomputed for local-space tests
 */
struct CachedObstacle {
    Position center;
    Vector halfExtents;
    Quaternion rotation;
    Quaternion inverseRotation;
    double restitution;

    /** @brief World point to the obstacle's local frame */
    Vector toLocal(const Position& p) const {
        return inverseRotation.rotate(p - center);
    }

    /** @brief Local direction to world direction */
    Vector toWorld(const Vector& localDir) const {
        return rotation.rotate(localDir);
    }
};

/**
 * @class ObstacleCache
 * @brief Read-only list of oriented boxes built once per level
 */
class ObstacleCache {
public:
    ObstacleCache() = default;

    /**
     * @brief Validates and caches the records, preserving order
     * @throws std::invalid_argument on non-finite values or non-positive extents
     */
    explicit ObstacleCache(const std::vector<ObstacleRecord>& records);

    const std::vector<CachedObstacle>& obstacles() const { return cached; }
    std::size_t size() const { return cached.size(); }
    bool empty() const { return cached.empty(); }

private:
    std::vector<CachedObstacle> cached;
};

/**
 * @class GateTable
 * @brief Read-only list of gates built once per level
 */
class GateTable {
public:
    GateTable() = default;

    /**
     * @brief Validates and stores the records, preserving order
     * @param maxMultiplier Largest accepted multiplier, normally the body ceiling
     * @throws std::invalid_argument on invalid bounds, a multiplier outside
     *         [1, maxMultiplier], instanceId outside [0, Components::MaxGates)
     *         or duplicated
     */
    GateTable(const std::vector<GateRecord>& records, std::size_t maxMultiplier);

    const std::vector<GateRecord>& gates() const { return table; }
    std::size_t size() const { return table.size(); }
    bool empty() const { return table.empty(); }

private:
    std::vector<GateRecord> table;
};
