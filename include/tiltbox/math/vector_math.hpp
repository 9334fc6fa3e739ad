/**
 * @file vector_math.hpp
 * @brief 2D vector and point mathematics
 *
 * This file provides the geometric kernel used by every other part of the engine:
 * - Vector class, used both for positions on the plane and for displacements
 * - Geometric operations (dot product, cross product, rotations, triple product)
 * - Epsilon-tolerant comparisons that absorb floating point noise in GJK/EPA
 */

#ifndef TILTBOX_VECTOR_MATH_HPP
#define TILTBOX_VECTOR_MATH_HPP

/**
 * @brief Threshold for floating-point equality tests of coordinates
 */
constexpr double EPSILON = 1e-7;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a 2D vector or a point on the plane
 *
 * The same type serves as an absolute position and as a displacement. The alias
 * Point is used where a value should be read as a position.
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

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    /**
     * @brief Adds two vectors
     * @param b Vector to add
     * @return Sum vector
     */
    Vector operator+(const Vector& b) const;

    /**
     * @brief Subtracts two vectors
     * @param b Vector to subtract
     * @return Difference vector
     */
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

    /**
     * @brief Epsilon-tolerant equality, see isCloseTo()
     */
    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const;

    /**
     * @brief Vector from this point to another point
     * @param other Target point
     * @return other - this
     */
    Vector to(const Vector& other) const;

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
    double cross(const Vector& other) const;

    /**
     * @brief Returns the vector rotated 90 degrees clockwise, (x, y) -> (y, -x)
     */
    Vector perpendicular() const;

    /**
     * @brief Rotates vector by specified angle
     * @param angle Rotation angle in radians, counter-clockwise
     * @return Rotated vector
     */
    Vector rotateByAngle(double angle) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Returns the vector scaled to length 1
     *
     * The caller is responsible for not normalizing a zero vector.
     */
    Vector unit() const;

    /**
     * @brief Signed angle from this vector to another vector
     *
     * The magnitude comes from the dot product of the unit vectors, the sign
     * from the cross product (positive when other is counter-clockwise).
     *
     * @param other Other vector
     * @return Angle in radians in [-pi, pi]
     */
    double angleTo(const Vector& other) const;

    /**
     * @brief Vector from the line through other (along this - other) towards the origin
     *
     * With s = this - other the result is -other * (s.s) - s * (s.(-other)),
     * i.e. (s x -other) x s. GJK uses it as the next search direction, the
     * impulse formulas use it for the rotational correction terms.
     *
     * @param other Second point defining the line
     * @return Direction perpendicular to the line, scaled by |s|^2
     */
    Vector tripleProduct(const Vector& other) const;

    /**
     * @brief Component-wise comparison within EPSILON
     * @param other Other vector
     * @return true if both components differ by less than EPSILON
     */
    bool isCloseTo(const Vector& other) const;

    /** @brief true if neither component is NaN or infinite */
    bool isFinite() const;
};

/**
 * @brief Used instead of Vector where a value is a position on the plane
 */
using Point = Vector;

/** @brief Scalar on the left, for readability of physics formulas */
Vector operator*(double scalar, const Vector& v);

#endif // TILTBOX_VECTOR_MATH_HPP
