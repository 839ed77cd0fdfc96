/**
 * @file vector_math.hpp
 * @brief 3D vector and position mathematics library
 *
 * This file provides the geometric primitives used by the ball simulation:
 * - Vector class for direction and magnitude calculations
 * - Position class for point locations in the 2.5D arena
 * - Geometric operations (dot product, cross product, clamping)
 * - Utility functions for common mathematical operations
 */

#ifndef BALLDROP_VECTOR_MATH_HPP
#define BALLDROP_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Represents a point in the arena
 * 
 * Position class is used for absolute locations. y is up; z is the shallow
 * depth axis of the 2.5D arena.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate (up)
    double z;  ///< Z coordinate (depth)

    /** @brief Constructs a Position at (0,0,0) */
    Position();
    
    /**
     * @brief Constructs a Position at specified coordinates
     */
    Position(double x, double y, double z = 0.0);
    
    /** @brief Converts Position to Vector */
    explicit operator Vector() const;

    Position operator+(const Vector& v) const;
    Position operator-(const Vector& v) const;

    /**
     * @brief Displacement from another position to this one
     * @param p Origin position
     * @return Vector pointing from p to this
     */
    Vector operator-(const Position& p) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);

    /** @brief True if no coordinate is NaN or infinite */
    bool isFinite() const;
};

/**
 * @brief Represents a 3D vector with direction and magnitude
 * 
 * Vector class provides the vector operations needed by the
 * integrator and the collision passes.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component
    double z;  ///< Z component

    /** @brief Constructs a zero vector */
    Vector();
    
    /**
     * @brief Constructs a vector with given components
     */
    Vector(double x, double y, double z = 0.0);
    
    /** @brief Converts Vector to Position */
    explicit operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;
    
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    
    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(double scalar) const;
    
    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     */
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the square root */
    double lengthSquared() const;
    
    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;
    
    /**
     * @brief Calculates cross product with another vector
     * @param other Other vector
     * @return Cross product vector
     */
    Vector cross(const Vector &other) const;
    
    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A vector shorter than EPSILON normalizes to @p fallback.
     */
    Vector normalized(const Vector& fallback = Vector(0.0, 1.0, 0.0)) const;

    /**
     * @brief Scales vector so its length does not exceed maxLength
     * @param maxLength Upper bound on the magnitude
     * @return Clamped vector
     */
    Vector clampLength(double maxLength) const;

    /** @brief Component-wise clamp into [lo, hi] */
    Vector clamp(const Vector& lo, const Vector& hi) const;

    /** @brief True if no component is NaN or infinite */
    bool isFinite() const;
};

Vector operator*(double scalar, const Vector& v);

#endif // BALLDROP_VECTOR_MATH_HPP
