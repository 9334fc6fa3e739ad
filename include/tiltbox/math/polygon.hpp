/**
 * @file polygon.hpp
 * @brief Geometric properties of polygon vertex rings
 *
 * Pure functions over a closed ring of vertices (the last vertex connects back
 * to the first):
 * - Centroid of the enclosed area
 * - Area (used as mass) and second moment of area about the centroid
 * - An N-direction hull used to turn freehand drawings into convex polygons
 */

#ifndef TILTBOX_POLYGON_MATH_HPP
#define TILTBOX_POLYGON_MATH_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "tiltbox/core/constants.hpp"
#include "tiltbox/math/vector_math.hpp"

/**
 * @brief Mass and rotational inertia of a uniform density shape
 */
struct MassProperties {
    double mass;
    double inertia;
};

/**
 * @brief Centroid of the area enclosed by a vertex ring (shoelace formula)
 *
 * @param vertices Vertex ring, either winding
 * @return Point Area centroid
 */
Point computeCentroid(const std::vector<Point>& vertices);

/**
 * @brief Area and second moment of area about the centroid
 *
 * Both values are returned as absolute values so the winding does not matter.
 *
 * @param centroid Centroid of the ring, see computeCentroid()
 * @param vertices Vertex ring
 * @return MassProperties with unit density
 */
MassProperties computeMassProperties(const Point& centroid, const std::vector<Point>& vertices);

/**
 * @brief Wraps an at most N vertex convex hull around a set of points
 *
 * For N directions spread evenly over the full circle the point reaching
 * furthest in that direction is kept. Points within EPSILON of the previously
 * kept point are dropped, including the wrap from the last back to the first,
 * so no two returned vertices coincide.
 *
 * @tparam N Number of sampling directions
 * @param points Input points, must not be empty
 * @return Vertices of the hull in counter-clockwise order
 * @throws std::invalid_argument if points is empty
 */
template <std::size_t N>
std::vector<Point> hullVertices(const std::vector<Point>& points) {
    static_assert(N >= 3, "a hull needs at least three directions");
    if (points.empty()) {
        throw std::invalid_argument("cannot create a hull from an empty set of vertices");
    }

    std::array<Vector, N> directions;
    std::array<Point, N> extended;
    std::array<double, N> extendedDots;

    Point const& first = points.front();
    for (std::size_t i = 0; i < N; ++i) {
        directions[i] = Vector(1.0, 0.0).rotateByAngle(
            2.0 * static_cast<double>(i) * SimulatorConstants::Pi / static_cast<double>(N));
        extended[i] = first;
        extendedDots[i] = first.dotProduct(directions[i]);
    }

    for (std::size_t p = 1; p < points.size(); ++p) {
        for (std::size_t i = 0; i < N; ++i) {
            double const dot = points[p].dotProduct(directions[i]);
            if (dot > extendedDots[i]) {
                extended[i] = points[p];
                extendedDots[i] = dot;
            }
        }
    }

    std::vector<Point> vertices;
    vertices.reserve(N);
    for (auto const& point : extended) {
        if (vertices.empty() || !vertices.back().isCloseTo(point)) {
            vertices.push_back(point);
        }
    }
    while (vertices.size() > 1 && vertices.back().isCloseTo(vertices.front())) {
        vertices.pop_back();
    }
    return vertices;
}

#endif // TILTBOX_POLYGON_MATH_HPP
