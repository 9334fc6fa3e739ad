#include "tiltbox/shapes/polygon.hpp"

#include <utility>

namespace Shapes {

Polygon::Polygon(std::vector<Point> vertices)
    : m_vertices(std::move(vertices))
{
    m_data.centroid = computeCentroid(m_vertices);
    MassProperties const props = computeMassProperties(m_data.centroid, m_vertices);
    m_data.mass = props.mass;
    m_data.inertia = props.inertia;
}

Point Polygon::supportVector(const Vector& direction) const {
    double bestProj = direction.dotProduct(m_vertices.front());
    Point best = m_vertices.front();
    for (auto const& v : m_vertices) {
        double const proj = direction.dotProduct(v);
        if (proj > bestProj) {
            bestProj = proj;
            best = v;
        }
    }
    return best;
}

bool Polygon::includes(const Point& point) const {
    double last = 0.0;
    std::size_t const count = m_vertices.size();
    for (std::size_t i = 0; i < count; ++i) {
        Point const& p1 = m_vertices[i];
        Point const& p2 = m_vertices[(i + 1) % count];
        double const next = p1.to(p2).perpendicular().dotProduct(p1.to(point));
        if (last * next < 0.0) {
            return false;
        }
        last = next;
    }
    return true;
}

void Polygon::rotate(double angle) {
    for (auto& v : m_vertices) {
        v = m_data.centroid.to(v).rotateByAngle(angle) + m_data.centroid;
    }
    m_angle += angle;
}

void Polygon::translate(const Vector& translation) {
    for (auto& v : m_vertices) {
        v += translation;
    }
    m_data.centroid += translation;
}

Point Polygon::resolvePointReference(const PointOnShape& ref) const {
    return m_data.centroid.to(m_vertices.front()).rotateByAngle(ref.angleOffset) * ref.lengthScale
           + m_data.centroid;
}

PointOnShape Polygon::createPointReference(const Point& point) const {
    Vector const toFirstVertex = m_data.centroid.to(m_vertices.front());
    Vector const toPoint = m_data.centroid.to(point);
    if (toPoint.length() < EPSILON) {
        return PointOnShape{0.0, 0.0};
    }
    return PointOnShape{
        toFirstVertex.angleTo(toPoint),
        toPoint.length() / toFirstVertex.length()
    };
}

} // namespace Shapes
