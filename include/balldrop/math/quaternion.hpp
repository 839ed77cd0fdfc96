/**
 * @file quaternion.hpp
 * @brief Unit quaternion for obstacle orientation
 *
 * Obstacles are oriented boxes; their rotation is stored as a unit
 * quaternion and used to move points between world and local frames.
 */

#ifndef BALLDROP_QUATERNION_HPP
#define BALLDROP_QUATERNION_HPP

#include "balldrop/math/vector_math.hpp"

class Quaternion {
public:
    double w;
    double x;
    double y;
    double z;

    /** @brief Identity rotation */
    Quaternion();
    Quaternion(double w, double x, double y, double z);

    /**
     * @brief Rotation of @p angle radians about @p axis
     * @param axis Rotation axis, need not be normalized
     * @param angle Angle in radians
     */
    static Quaternion fromAxisAngle(const Vector& axis, double angle);

    /** @brief Rotation of @p degrees about +z, the usual ramp tilt */
    static Quaternion fromRollDegrees(double degrees);

    double norm() const;

    /** @brief Returns unit quaternion; a degenerate one becomes identity */
    Quaternion normalized() const;

    /** @brief Inverse rotation of a unit quaternion */
    Quaternion conjugate() const;

    /**
     * @brief Rotates a vector by this quaternion
     *
     * Assumes the quaternion is normalized.
     */
    Vector rotate(const Vector& v) const;

    bool isFinite() const;
};

#endif // BALLDROP_QUATERNION_HPP
