#include "tiltbox/algo/simplex.hpp"

#include <cmath>
#include <initializer_list>
#include <utility>

namespace Collision {

namespace {

ClosureResult nextDirection(const Vector& direction) {
    return ClosureResult{ClosureResult::Kind::NextDirection, direction, Simplex{}};
}

ClosureResult excludesOrigin() {
    return ClosureResult{ClosureResult::Kind::ExcludesOrigin, Vector(), Simplex{}};
}

ClosureResult includesOrigin(std::initializer_list<SupportVertex> vertices) {
    Simplex simplex;
    for (auto const& v : vertices) {
        simplex.vertices[simplex.count++] = v;
    }
    return ClosureResult{ClosureResult::Kind::IncludesOrigin, Vector(), simplex};
}

} // namespace

PartialSimplex::PartialSimplex(const SupportVertex& initial) {
    m_vertices[0] = initial;
}

ClosureResult PartialSimplex::tryToEnclose(const SupportVertex& added) {
    if (added.point.isCloseTo(Point())) {
        return includesOrigin({added});
    }
    return m_count == 1 ? closeFromPoint(added) : closeFromLine(added);
}

ClosureResult PartialSimplex::closeFromPoint(const SupportVertex& added) {
    SupportVertex const old = m_vertices[0];

    if (old.point.isCloseTo(added.point)) {
        return excludesOrigin();
    }

    // the old point lies further towards the origin, it is of no use anymore
    if (added.point.dotProduct(added.point.to(old.point)) > 0.0) {
        m_vertices[0] = added;
        return nextDirection(-added.point);
    }

    m_vertices[0] = added;
    m_vertices[1] = old;
    m_count = 2;

    Vector const direction = old.point.tripleProduct(added.point);
    if (direction.x == 0.0 && direction.y == 0.0) {
        // origin lies on the line
        return includesOrigin({old, added});
    }
    return nextDirection(direction);
}

ClosureResult PartialSimplex::closeFromLine(const SupportVertex& added) {
    SupportVertex& one = m_vertices[0];
    SupportVertex& two = m_vertices[1];

    if (one.point.isCloseTo(added.point) || two.point.isCloseTo(added.point)) {
        return excludesOrigin();
    }

    Vector const firstArm = added.point.to(one.point);
    Vector const secondArm = added.point.to(two.point);
    bool const firstRedundant = added.point.dotProduct(firstArm) > 0.0;
    bool const secondRedundant = added.point.dotProduct(secondArm) > 0.0;

    if (firstRedundant && secondRedundant) {
        m_vertices[0] = added;
        m_count = 1;
        return nextDirection(-added.point);
    }

    if (!firstRedundant && !secondRedundant) {
        double const firstCross = added.point.cross(firstArm);
        double const secondCross = added.point.cross(secondArm);
        if (firstCross * secondCross < 0.0) {
            return includesOrigin({one, two, added});
        }

        bool const replaceFirst = std::fabs(firstCross) > std::fabs(secondCross);
        SupportVertex& redundant = replaceFirst ? one : two;
        SupportVertex const& other = replaceFirst ? two : one;
        redundant = added;
        return nextDirection(other.point.tripleProduct(added.point));
    }

    SupportVertex& redundant = firstRedundant ? one : two;
    SupportVertex const& other = firstRedundant ? two : one;
    redundant = added;
    return nextDirection(other.point.tripleProduct(added.point));
}

std::optional<Edge> Edge::tryNew(const SupportVertex& first, const SupportVertex& second) {
    auto endpoint = [](const SupportVertex& primary, const SupportVertex& other) {
        double const distance = primary.point.length();
        Vector const towards = distance > 0.0 ? primary.point / distance : primary.point;
        return Edge{distance, towards, primary, other};
    };

    std::optional<Edge> edge;
    if (first.point.to(second.point).dotProduct(-first.point) <= 0.0) {
        edge = endpoint(first, second);
    } else if (second.point.to(first.point).dotProduct(-second.point) <= 0.0) {
        edge = endpoint(second, first);
    } else {
        Vector const toOrigin = first.point.tripleProduct(second.point).unit();
        edge = Edge{-first.point.dotProduct(toOrigin), -toOrigin, first, second};
    }

    if (!std::isfinite(edge->distanceToOrigin) || !edge->towardsSegment.isFinite()) {
        return std::nullopt;
    }
    return edge;
}

} // namespace Collision
