#ifndef TILTBOX_MINKOWSKI_HPP
#define TILTBOX_MINKOWSKI_HPP

#include "tiltbox/math/vector_math.hpp"
#include "tiltbox/shapes/shape.hpp"

namespace Collision {

/**
 * @brief A sampled point of the Minkowski difference A - B
 *
 * Remembers the two real points that produced it, so that the contact point
 * on each shape can be recovered after EPA.
 */
struct SupportVertex {
    Point point;   ///< fromA - fromB
    Point fromA;   ///< support point on the first shape
    Point fromB;   ///< support point on the second shape
};

/**
 * @brief Implicit Minkowski difference of two shapes
 *
 * The origin lies inside the difference iff the two shapes overlap. The
 * difference only borrows the shapes.
 */
class MinkowskiDifference {
public:
    MinkowskiDifference(const Shapes::Shape& first, const Shapes::Shape& second)
        : m_first(first), m_second(second) {}

    /**
     * @brief Furthest point of A - B in a direction
     * @param direction Search direction
     * @return A.support(direction) - B.support(-direction), with its sources
     */
    SupportVertex supportVector(const Vector& direction) const {
        Point const a = m_first.supportVector(direction);
        Point const b = m_second.supportVector(-direction);
        return SupportVertex{a - b, a, b};
    }

private:
    const Shapes::Shape& m_first;
    const Shapes::Shape& m_second;
};

} // namespace Collision

#endif // TILTBOX_MINKOWSKI_HPP
