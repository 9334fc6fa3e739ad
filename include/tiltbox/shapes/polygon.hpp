/**
 * @file polygon.hpp
 * @brief Convex polygon body
 *
 * Vertices are stored in world space. Centroid, mass and inertia are computed
 * once at construction from the vertex ring; afterwards rotation turns the
 * vertices about the cached centroid and translation moves both.
 */

#ifndef TILTBOX_POLYGON_SHAPE_HPP
#define TILTBOX_POLYGON_SHAPE_HPP

#include <vector>

#include "tiltbox/core/constants.hpp"
#include "tiltbox/math/polygon.hpp"
#include "tiltbox/math/vector_math.hpp"
#include "tiltbox/shapes/collision_data.hpp"

namespace Shapes {

class Polygon {
public:
    /**
     * @brief Builds a polygon from a convex vertex ring
     * @param vertices At least three vertices, either winding
     */
    explicit Polygon(std::vector<Point> vertices);

    /**
     * @brief Vertex maximising the dot product with a direction
     */
    Point supportVector(const Vector& direction) const;

    /**
     * @brief Point containment test
     *
     * The sign of the perpendicular-cross test must stay the same over every
     * edge; the test stops at the first sign flip. Points on an edge count as
     * inside.
     */
    bool includes(const Point& point) const;

    void rotate(double angle);
    void translate(const Vector& translation);

    CollisionData& collisionData() { return m_data; }
    const CollisionData& collisionData() const { return m_data; }

    /**
     * @brief World position of an anchor
     *
     * The reference axis and length are given by the vector from the centroid
     * to the first vertex, which rotates with the polygon.
     */
    Point resolvePointReference(const PointOnShape& ref) const;
    PointOnShape createPointReference(const Point& point) const;

    const std::vector<Point>& vertices() const { return m_vertices; }
    const Point& centroid() const { return m_data.centroid; }
    double angle() const { return m_angle; }

private:
    std::vector<Point> m_vertices;
    CollisionData m_data;
    double m_angle = 0.0;
};

/**
 * @brief Convex polygon around a freehand set of points, see hullVertices()
 */
template <std::size_t N>
Polygon hull(const std::vector<Point>& points) {
    return Polygon(hullVertices<N>(points));
}

} // namespace Shapes

#endif // TILTBOX_POLYGON_SHAPE_HPP
