#include "tiltbox/shapes/circle.hpp"

#include "tiltbox/core/constants.hpp"

namespace Shapes {

Circle::Circle(const Point& center, double radius)
    : m_radius(radius)
{
    m_data.centroid = center;
    m_data.mass = SimulatorConstants::Pi * radius * radius;
    m_data.inertia = m_data.mass * radius * radius / 2.0;
}

Point Circle::supportVector(const Vector& direction) const {
    double const len = direction.length();
    if (len < 1e-12) {
        return m_data.centroid;
    }
    return m_data.centroid + direction / len * m_radius;
}

bool Circle::includes(const Point& point) const {
    return m_data.centroid.to(point).length() <= m_radius;
}

void Circle::rotate(double angle) {
    m_angle += angle;
}

void Circle::translate(const Vector& translation) {
    m_data.centroid += translation;
}

Point Circle::resolvePointReference(const PointOnShape& ref) const {
    return Vector(m_radius, 0.0).rotateByAngle(ref.angleOffset + m_angle) * ref.lengthScale
           + m_data.centroid;
}

PointOnShape Circle::createPointReference(const Point& point) const {
    Vector const toPoint = m_data.centroid.to(point);
    double const distance = toPoint.length();
    if (distance < EPSILON) {
        // the centre itself, any angle resolves to it
        return PointOnShape{0.0, 0.0};
    }
    return PointOnShape{
        Vector(1.0, 0.0).rotateByAngle(m_angle).angleTo(toPoint),
        distance / m_radius
    };
}

} // namespace Shapes
