#include "tiltbox/math/polygon.hpp"

#include <cmath>

Point computeCentroid(const std::vector<Point>& vertices) {
    Point weighted;
    double doubledArea = 0.0;

    std::size_t const count = vertices.size();
    for (std::size_t i = 0; i < count; ++i) {
        Point const& a = vertices[i];
        Point const& b = vertices[(i + 1) % count];
        double const cross = a.cross(b);
        weighted += (a + b) * cross;
        doubledArea += cross;
    }

    return weighted / (3.0 * doubledArea);
}

MassProperties computeMassProperties(const Point& centroid, const std::vector<Point>& vertices) {
    double const centroidSquared = centroid.dotProduct(centroid);
    double inertiaSum = 0.0;
    double massSum = 0.0;

    std::size_t const count = vertices.size();
    for (std::size_t i = 0; i < count; ++i) {
        Point const& p1 = vertices[i];
        Point const& p2 = vertices[(i + 1) % count];

        // twice the area of the triangle (centroid, p1, p2)
        double const doubledMass = centroid.to(p1).cross(centroid.to(p2));

        inertiaSum += (3.0 * centroidSquared
                       + p1.dotProduct(p1) + p2.dotProduct(p2) + p1.dotProduct(p2)
                       - 3.0 * p1.dotProduct(centroid)
                       - 3.0 * p2.dotProduct(centroid)) * doubledMass;
        massSum += doubledMass;
    }

    return MassProperties{std::fabs(massSum / 2.0), std::fabs(inertiaSum / 12.0)};
}
