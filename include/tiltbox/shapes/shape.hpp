/**
 * @file shape.hpp
 * @brief Closed tagged union over the convex shape kinds
 *
 * Shape holds either a Circle or a Polygon by value and forwards every
 * capability operation to the active alternative:
 * - Bounded: supportVector(), includes()
 * - Collidable: rotate(), translate(), collisionData(), point references and
 *   the shared updatePosition() integration step
 *
 * Values of this type are stored directly as registry components.
 */

#ifndef TILTBOX_SHAPE_HPP
#define TILTBOX_SHAPE_HPP

#include <cstdint>
#include <variant>

#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/circle.hpp"
#include "tiltbox/shapes/collision_data.hpp"
#include "tiltbox/shapes/polygon.hpp"

namespace Shapes {

enum class ShapeType {
    Circle,
    Polygon
};

class Shape {
public:
    Shape(Circle circle);
    Shape(Polygon polygon);

    ShapeType type() const;

    Point supportVector(const Vector& direction) const;
    bool includes(const Point& point) const;

    void rotate(double angle);
    void translate(const Vector& translation);

    CollisionData& collisionData();
    const CollisionData& collisionData() const;

    Point resolvePointReference(const PointOnShape& ref) const;
    PointOnShape createPointReference(const Point& point) const;

    /**
     * @brief Advances the shape by one time step
     *
     * Gravity, rotated into the current "down" direction, is added to the
     * velocity; the velocities from before that update are integrated into a
     * rotation and a translation.
     *
     * @param timeStepMicros Elapsed time in microseconds
     * @param ambientAngle Rotation of the gravity direction in radians
     * @param config Coupling coefficients
     */
    void updatePosition(std::int64_t timeStepMicros, double ambientAngle, const EngineConfig& config);

    const Circle* asCircle() const { return std::get_if<Circle>(&m_body); }
    const Polygon* asPolygon() const { return std::get_if<Polygon>(&m_body); }

private:
    std::variant<Circle, Polygon> m_body;
};

} // namespace Shapes

#endif // TILTBOX_SHAPE_HPP
