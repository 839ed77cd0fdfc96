#pragma once

#include "balldrop/math/vector_math.hpp"

/**
 * @brief Axis-aligned box given by its min and max corners
 *
 * Containment is inclusive on every face.
 */
struct AABB {
    Position min;
    Position max;

    AABB() = default;
    AABB(const Position& lo, const Position& hi) : min(lo), max(hi) {}

    static AABB fromCenterExtents(const Position& center, const Vector& halfExtents) {
        return AABB(center - halfExtents, center + halfExtents);
    }

    bool contains(const Position& p) const {
        return p.x >= min.x && p.x <= max.x
            && p.y >= min.y && p.y <= max.y
            && p.z >= min.z && p.z <= max.z;
    }

    bool isValid() const {
        return min.isFinite() && max.isFinite()
            && min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }
};
