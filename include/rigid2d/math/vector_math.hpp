/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics for rigid body dynamics
 *
 * This file provides the geometric primitives used throughout the engine:
 * - Vector class for directions, velocities, offsets and normals
 * - Position class for world locations of body centers of mass
 * - Helpers for the planar cross products that appear in impulse and
 *   contact force equations
 */

#ifndef RIGID2D_VECTOR_MATH_HPP
#define RIGID2D_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Represents a 2D point in world space
 *
 * Used for the world location of a body's center of mass.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    Position operator+(const Vector& v) const;
    Position operator-(const Vector& v) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;
    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoiding the square root */
    double lengthSquared() const;

    /**
     * @brief Distance between the points this vector and another one describe
     */
    double distanceTo(const Vector& p) const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector &other) const;

    /** @brief Returns perpendicular vector (rotated 90 degrees counter-clockwise) */
    Vector perp() const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A zero-length vector normalizes to (1,0).
     */
    Vector normalized() const;

    /**
     * @brief Rotates vector by specified angle
     * @param angle Rotation angle in radians, counter-clockwise
     * @return Rotated vector
     */
    Vector rotateByAngle(double angle) const;

    /** @brief True when both components are finite numbers */
    bool isFinite() const;
};

/**
 * @brief Velocity of a point at offset r on a body spinning at angular velocity w
 *
 * Equivalent to the 3D cross product (0,0,w) x (r.x, r.y, 0).
 */
Vector angularCross(double w, const Vector &r);

#endif
