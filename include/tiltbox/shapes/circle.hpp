#ifndef TILTBOX_CIRCLE_HPP
#define TILTBOX_CIRCLE_HPP

#include "tiltbox/math/vector_math.hpp"
#include "tiltbox/shapes/collision_data.hpp"

namespace Shapes {

/**
 * @brief A solid disk of uniform density
 *
 * The centre is the centroid of the collision data. Rotation only accumulates
 * an angle, which point references use as their reference axis.
 */
class Circle {
public:
    Circle(const Point& center, double radius);

    /**
     * @brief Furthest point of the circle in a direction
     * @param direction Any non-zero direction, the centre is returned for zero
     */
    Point supportVector(const Vector& direction) const;

    /** @brief true if the point lies inside or on the circle */
    bool includes(const Point& point) const;

    void rotate(double angle);
    void translate(const Vector& translation);

    CollisionData& collisionData() { return m_data; }
    const CollisionData& collisionData() const { return m_data; }

    /**
     * @brief World position of an anchor
     *
     * The anchor is stored relative to the radius vector (radius, 0) rotated
     * by the accumulated angle.
     */
    Point resolvePointReference(const PointOnShape& ref) const;
    PointOnShape createPointReference(const Point& point) const;

    const Point& center() const { return m_data.centroid; }
    double radius() const { return m_radius; }
    double angle() const { return m_angle; }

private:
    double m_radius;
    double m_angle = 0.0;
    CollisionData m_data;
};

} // namespace Shapes

#endif // TILTBOX_CIRCLE_HPP
