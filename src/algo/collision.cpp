#include "tiltbox/algo/collision.hpp"

#include "tiltbox/algo/epa.hpp"
#include "tiltbox/algo/gjk.hpp"

#include <utility>

namespace Collision {

std::optional<SupportVertex> collision(const Shapes::Shape& first, const Shapes::Shape& second) {
    MinkowskiDifference const difference(first, second);
    auto edges = enclosingSimplex(Vector(0.0, 1.0), difference);
    if (!edges) {
        return std::nullopt;
    }

    auto closest = closestPointOf(std::move(*edges), difference);
    if (!closest || !closest->point.isFinite() || !closest->fromA.isFinite() || !closest->fromB.isFinite()) {
        return std::nullopt;
    }
    return closest;
}

} // namespace Collision
