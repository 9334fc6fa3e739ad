#ifndef TILTBOX_GJK_HPP
#define TILTBOX_GJK_HPP

#include <optional>

#include "tiltbox/algo/minkowski.hpp"
#include "tiltbox/algo/simplex.hpp"

namespace Collision {

/**
 * @brief 2D GJK: searches for a simplex of the difference enclosing the origin
 *
 * Samples the Minkowski difference starting along initialDirection. When the
 * samples enclose the origin the shapes collide and the edges of the
 * enclosing triangle (or of a line simplex expanded to a quadrilateral) are
 * returned, ready for EPA.
 *
 * @param initialDirection First search direction
 * @param difference Minkowski difference of the two shapes
 * @return Enclosing edges, or nothing if the shapes do not collide, the search
 *         exceeded its iteration cap, or a non-finite value appeared
 */
std::optional<EdgeQueue> enclosingSimplex(const Vector& initialDirection,
                                          const MinkowskiDifference& difference);

} // namespace Collision

#endif // TILTBOX_GJK_HPP
