#include "tiltbox/algo/epa.hpp"

#include <cmath>
#include <limits>

#include "tiltbox/core/constants.hpp"

namespace Collision {

namespace {

enum class Axis { X, Y };

std::optional<SupportVertex> tryInterpolate(const Edge& edge, const Point& closest, Axis axis) {
    double const start = axis == Axis::X ? edge.first.point.x : edge.first.point.y;
    double const middle = axis == Axis::X ? closest.x : closest.y;
    double const end = axis == Axis::X ? edge.second.point.x : edge.second.point.y;

    double const distance = end - start;
    if (std::abs(distance) <= EPSILON) {
        return std::nullopt;
    }

    double const fact = (middle - start) / distance;
    return SupportVertex{closest,
                         edge.first.fromA * (1.0 - fact) + edge.second.fromA * fact,
                         edge.first.fromB * (1.0 - fact) + edge.second.fromB * fact};
}

} // namespace

std::optional<SupportVertex> closestPointOf(EdgeQueue edges, const MinkowskiDifference& difference) {
    constexpr double far = std::numeric_limits<double>::max();
    Point previous(far, far);

    for (int iteration = 0; !edges.empty(); ++iteration) {
        Edge const edge = edges.top();
        edges.pop();
        Point const closest = edge.towardsSegment * edge.distanceToOrigin;

        if (closest.isCloseTo(previous) || iteration > SimulatorConstants::EpaMaxIterations) {
            if (auto vertex = tryInterpolate(edge, closest, Axis::X)) {
                return vertex;
            }
            if (auto vertex = tryInterpolate(edge, closest, Axis::Y)) {
                return vertex;
            }
            return edge.first;
        }

        SupportVertex const added = difference.supportVector(edge.towardsSegment);
        auto towardsFirst = Edge::tryNew(edge.first, added);
        auto towardsSecond = Edge::tryNew(added, edge.second);
        if (!towardsFirst || !towardsSecond) {
            return std::nullopt;
        }
        edges.push(*towardsFirst);
        edges.push(*towardsSecond);

        previous = closest;
    }

    return std::nullopt;
}

} // namespace Collision
