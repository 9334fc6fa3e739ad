#ifndef TILTBOX_COLLISION_DATA_HPP
#define TILTBOX_COLLISION_DATA_HPP

#include <cmath>
#include <limits>

#include "tiltbox/math/vector_math.hpp"

namespace Shapes {

/**
 * @brief Physical state of a shape
 *
 * Static bodies carry infinite mass and inertia. Dividing an impulse by them
 * yields no velocity change, so they never move while still colliding.
 */
struct CollisionData {
    Point centroid;
    double mass = 0.0;
    double inertia = 0.0;
    Vector velocity;
    double angularVelocity = 0.0;

    bool isStatic() const { return std::isinf(mass) && std::isinf(inertia); }

    void makeStatic() {
        mass = std::numeric_limits<double>::infinity();
        inertia = std::numeric_limits<double>::infinity();
    }
};

/**
 * @brief An anchor on a shape, relative to the shape's own reference axis
 *
 * Survives rotation and translation of the shape. The reference axis and
 * length depend on the shape kind, see Circle and Polygon.
 */
struct PointOnShape {
    double angleOffset = 0.0;
    double lengthScale = 0.0;
};

} // namespace Shapes

#endif // TILTBOX_COLLISION_DATA_HPP
