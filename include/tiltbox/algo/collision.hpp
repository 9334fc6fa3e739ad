#ifndef TILTBOX_COLLISION_HPP
#define TILTBOX_COLLISION_HPP

#include <optional>

#include "tiltbox/algo/minkowski.hpp"
#include "tiltbox/shapes/shape.hpp"

namespace Collision {

/**
 * @brief Narrow phase test between two shapes
 *
 * Runs GJK from direction (0, 1) and, on overlap, EPA on the enclosing
 * simplex. Any non-finite intermediate value is treated as "no collision".
 *
 * @return Minimum translation vector (with contact points on each shape), or
 *         nothing if the shapes do not overlap
 */
std::optional<SupportVertex> collision(const Shapes::Shape& first, const Shapes::Shape& second);

} // namespace Collision

#endif // TILTBOX_COLLISION_HPP
