/**
 * @file simplex.hpp
 * @brief Simplex bookkeeping shared by the GJK and EPA implementations
 *
 * - PartialSimplex: the one or two points GJK keeps between samples, and the
 *   closure rules deciding the next search direction
 * - Edge: a segment of the expanding polytope annotated with its distance to
 *   the origin
 */

#ifndef TILTBOX_SIMPLEX_HPP
#define TILTBOX_SIMPLEX_HPP

#include <array>
#include <optional>
#include <queue>
#include <vector>

#include "tiltbox/algo/minkowski.hpp"
#include "tiltbox/math/vector_math.hpp"

namespace Collision {

/**
 * @brief A point, line or triangle of Minkowski samples
 */
struct Simplex {
    int count = 0;
    std::array<SupportVertex, 3> vertices;
};

/**
 * @brief Outcome of adding one sample to a partial simplex
 */
struct ClosureResult {
    enum class Kind {
        NextDirection,   ///< keep sampling along direction
        ExcludesOrigin,  ///< the sample did not get past the origin
        IncludesOrigin   ///< simplex encloses the origin
    };

    Kind kind;
    Vector direction;
    Simplex simplex;
};

class PartialSimplex {
public:
    explicit PartialSimplex(const SupportVertex& initial);

    /**
     * @brief Adds a new sample and reduces the simplex
     *
     * Mutates the partial simplex to the subset of points still relevant for
     * the next search direction.
     */
    ClosureResult tryToEnclose(const SupportVertex& added);

    int size() const { return m_count; }

private:
    ClosureResult closeFromPoint(const SupportVertex& added);
    ClosureResult closeFromLine(const SupportVertex& added);

    std::array<SupportVertex, 2> m_vertices;
    int m_count = 1;
};

/**
 * @brief Polytope edge annotated with its closest approach to the origin
 */
struct Edge {
    double distanceToOrigin;
    Vector towardsSegment;  ///< unit direction from the origin towards the edge
    SupportVertex first;
    SupportVertex second;

    /**
     * @brief Builds an edge, or nothing if its distance is not finite
     *
     * When the closest point of the segment is one of its endpoints the edge
     * degenerates to that endpoint, which is stored first.
     */
    static std::optional<Edge> tryNew(const SupportVertex& first, const SupportVertex& second);
};

/**
 * @brief Orders edges so that the one nearest to the origin is on top
 */
struct FurtherFromOrigin {
    bool operator()(const Edge& a, const Edge& b) const {
        return a.distanceToOrigin > b.distanceToOrigin;
    }
};

using EdgeQueue = std::priority_queue<Edge, std::vector<Edge>, FurtherFromOrigin>;

} // namespace Collision

#endif // TILTBOX_SIMPLEX_HPP
