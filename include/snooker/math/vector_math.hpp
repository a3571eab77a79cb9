/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics for the table plane
 *
 * This file provides the geometric primitives shared by every system:
 * - Position class for points on the table surface
 * - Vector class for velocities, directions and normals
 * - Reflection about a surface normal for cushion bounces
 * - Helpers for floating point comparison and linear remapping
 */

#ifndef SNOOKER_VECTOR_MATH_HPP
#define SNOOKER_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Linearly remaps a value from one range onto another
 *
 * Values outside [inMin, inMax] extrapolate. A degenerate input range
 * returns outMin.
 */
double remap(double value, double inMin, double inMax, double outMin, double outMax);

/**
 * @brief Represents a 2D point on the table
 *
 * Position class is used for absolute locations (ball centres, pockets,
 * obstacle centres). Supports basic arithmetic and conversion to/from Vector.
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

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Vector& offset) const;
    Position operator-(const Vector& offset) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /**
     * @brief Calculates the offset vector pointing from another position to this one
     * @param from Origin of the offset
     */
    Vector offsetFrom(const Position& from) const;
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
     * @brief Builds a vector of given length pointing at an angle
     * @param angle Direction in radians, measured from +x towards +y
     * @param length Resulting magnitude
     */
    static Vector fromAngle(double angle, double length = 1.0);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /** @brief Returns normalized vector (length = 1), or zero for a zero vector */
    Vector normalized() const;

    /**
     * @brief Returns the same direction with a new length
     *
     * A zero vector stays zero.
     */
    Vector withLength(double length) const;

    /**
     * @brief Direction of the vector in radians (atan2 convention)
     */
    double angle() const;

    /**
     * @brief Reflects this vector about a unit surface normal
     *
     * Computes v' = v - 2 (v . n) n. The normal is expected to be unit length.
     *
     * @param normal Unit normal of the reflecting surface
     * @return Reflected vector
     */
    Vector reflect(const Vector& normal) const;

    /**
     * @brief Limits the magnitude to a maximum, preserving direction
     * @param maxLength Largest allowed magnitude
     */
    Vector clampedLength(double maxLength) const;
};

#endif // SNOOKER_VECTOR_MATH_HPP
