#ifndef TILTBOX_EPA_HPP
#define TILTBOX_EPA_HPP

#include <optional>

#include "tiltbox/algo/minkowski.hpp"
#include "tiltbox/algo/simplex.hpp"

namespace Collision {

/**
 * @brief Expanding polytope: finds the point of the difference closest to the origin
 *
 * Repeatedly splits the edge nearest to the origin at the support point in
 * its direction until the closest point stops moving (or the iteration cap is
 * hit). The returned vertex carries the minimum translation vector as its
 * point, and contact points on both shapes interpolated along the final edge.
 *
 * @param edges Edges of a simplex enclosing the origin, as produced by GJK
 * @param difference Minkowski difference the simplex was sampled from
 * @return Closest point, or nothing if the polytope produced a non-finite edge
 */
std::optional<SupportVertex> closestPointOf(EdgeQueue edges, const MinkowskiDifference& difference);

} // namespace Collision

#endif // TILTBOX_EPA_HPP
