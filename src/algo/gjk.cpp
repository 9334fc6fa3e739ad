#include "tiltbox/algo/gjk.hpp"

#include <initializer_list>
#include <utility>

#include "tiltbox/core/constants.hpp"
#include "tiltbox/core/debug.hpp"

namespace Collision {

static std::optional<EdgeQueue> edgesOf(std::initializer_list<std::pair<SupportVertex, SupportVertex>> segments) {
    EdgeQueue edges;
    for (auto const& segment : segments) {
        auto edge = Edge::tryNew(segment.first, segment.second);
        if (!edge) {
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[GJK] non-finite edge distance, assuming no collision\n");
            return std::nullopt;
        }
        edges.push(*edge);
    }
    return edges;
}

std::optional<EdgeQueue> enclosingSimplex(const Vector& initialDirection,
                                          const MinkowskiDifference& difference) {
    SupportVertex const initial = difference.supportVector(initialDirection);
    if (!initial.point.isFinite()) {
        return std::nullopt;
    }

    PartialSimplex simplex(initial);
    Vector searchDirection = -initial.point;

    for (int iteration = 0; iteration <= SimulatorConstants::GjkMaxIterations + 1; ++iteration) {
        SupportVertex const sample = difference.supportVector(searchDirection);
        if (!sample.point.isFinite()) {
            return std::nullopt;
        }
        // the furthest point along the search direction falls short of the origin
        if (sample.point.dotProduct(searchDirection) < 0.0) {
            return std::nullopt;
        }

        ClosureResult const result = simplex.tryToEnclose(sample);
        switch (result.kind) {
            case ClosureResult::Kind::NextDirection:
                if (!result.direction.isFinite()) {
                    return std::nullopt;
                }
                searchDirection = result.direction;
                break;

            case ClosureResult::Kind::ExcludesOrigin:
                return std::nullopt;

            case ClosureResult::Kind::IncludesOrigin: {
                Simplex const& s = result.simplex;
                if (s.count == 3) {
                    return edgesOf({{s.vertices[0], s.vertices[1]},
                                    {s.vertices[1], s.vertices[2]},
                                    {s.vertices[2], s.vertices[0]}});
                }
                if (s.count == 2) {
                    // expand the line into a quadrilateral around the origin
                    Vector const direction = s.vertices[0].point.to(s.vertices[1].point).perpendicular();
                    SupportVertex const third = difference.supportVector(direction);
                    SupportVertex const fourth = difference.supportVector(-direction);
                    return edgesOf({{s.vertices[0], third},
                                    {third, s.vertices[1]},
                                    {s.vertices[1], fourth},
                                    {fourth, s.vertices[0]}});
                }
                // touching in a single point, nothing to resolve
                return std::nullopt;
            }
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "Warning: GJK exceeded max iterations. Assuming no collision.\n");
    return std::nullopt;
}

} // namespace Collision
