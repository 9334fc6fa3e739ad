#include "tiltbox/systems/binding.hpp"

#include "tiltbox/algo/minkowski.hpp"
#include "tiltbox/core/constants.hpp"
#include "tiltbox/systems/collision_response.hpp"

namespace Bindings {

Unbound Unbound::hinge(const Shapes::Shape& shape, const Point& at) {
    return Unbound{Kind::Hinge, shape.createPointReference(at)};
}

Unbound Unbound::rigid(const Shapes::Shape& shape, const Point& at) {
    return Unbound{Kind::Rigid, shape.createPointReference(at)};
}

Binding Binding::makeHinge(PointOnShape first, PointOnShape second) {
    return Binding(Kind::Hinge, {first, first}, {second, second});
}

Binding Binding::makeRigid(std::pair<PointOnShape, PointOnShape> first,
                           std::pair<PointOnShape, PointOnShape> second) {
    return Binding(Kind::Rigid, first, second);
}

std::optional<Binding> Binding::tryBind(const Shapes::Shape& shape1,
                                        const Unbound& unbound,
                                        const Shapes::Shape& shape2) {
    Point const point = shape1.resolvePointReference(unbound.anchor);
    if (!shape2.includes(point)) {
        return std::nullopt;
    }

    if (unbound.kind == Unbound::Kind::Hinge) {
        return makeHinge(unbound.anchor, shape2.createPointReference(point));
    }

    Vector const span(SimulatorConstants::RigidHalfSpan, 0.0);
    return makeRigid({shape1.createPointReference(point + span), shape1.createPointReference(point - span)},
                     {shape2.createPointReference(point + span), shape2.createPointReference(point - span)});
}

static void enforceHinge(Shapes::Shape& shape1, const PointOnShape& anchor1,
                         Shapes::Shape& shape2, const PointOnShape& anchor2,
                         std::int64_t timeStepMicros, const EngineConfig& config) {
    Point const point1 = shape1.resolvePointReference(anchor1);
    Point const point2 = shape2.resolvePointReference(anchor2);
    Vector const translation = point2.to(point1);
    if (translation.isCloseTo(Vector())) {
        return;
    }
    RigidBodyCollision::resolveCollision(shape1, shape2,
                                         Collision::SupportVertex{translation, point1, point2},
                                         timeStepMicros, config);
}

void Binding::enforce(Shapes::Shape& shape1,
                      Shapes::Shape& shape2,
                      std::int64_t timeStepMicros,
                      const EngineConfig& config) const {
    enforceHinge(shape1, m_first.first, shape2, m_second.first, timeStepMicros, config);
    if (m_kind == Kind::Rigid) {
        enforceHinge(shape1, m_first.second, shape2, m_second.second, timeStepMicros, config);
    }
}

} // namespace Bindings
