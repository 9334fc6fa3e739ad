#include "tiltbox/shapes/shape.hpp"

#include <utility>

namespace Shapes {

Shape::Shape(Circle circle) : m_body(std::move(circle)) {}
Shape::Shape(Polygon polygon) : m_body(std::move(polygon)) {}

ShapeType Shape::type() const {
    return std::holds_alternative<Circle>(m_body) ? ShapeType::Circle : ShapeType::Polygon;
}

Point Shape::supportVector(const Vector& direction) const {
    return std::visit([&](auto const& body) { return body.supportVector(direction); }, m_body);
}

bool Shape::includes(const Point& point) const {
    return std::visit([&](auto const& body) { return body.includes(point); }, m_body);
}

void Shape::rotate(double angle) {
    std::visit([&](auto& body) { body.rotate(angle); }, m_body);
}

void Shape::translate(const Vector& translation) {
    std::visit([&](auto& body) { body.translate(translation); }, m_body);
}

CollisionData& Shape::collisionData() {
    return std::visit([](auto& body) -> CollisionData& { return body.collisionData(); }, m_body);
}

const CollisionData& Shape::collisionData() const {
    return std::visit([](auto const& body) -> const CollisionData& { return body.collisionData(); },
                      m_body);
}

Point Shape::resolvePointReference(const PointOnShape& ref) const {
    return std::visit([&](auto const& body) { return body.resolvePointReference(ref); }, m_body);
}

PointOnShape Shape::createPointReference(const Point& point) const {
    return std::visit([&](auto const& body) { return body.createPointReference(point); }, m_body);
}

void Shape::updatePosition(std::int64_t timeStepMicros, double ambientAngle, const EngineConfig& config) {
    auto const dt = static_cast<double>(timeStepMicros);
    CollisionData& data = collisionData();

    Vector const velocity = data.velocity;
    double const angularVelocity = data.angularVelocity;

    data.velocity += Vector(0.0, config.GravityCoefficient * dt).rotateByAngle(ambientAngle);
    rotate(angularVelocity * config.MovementCoefficient * dt);
    translate(velocity * config.MovementCoefficient * dt);
}

} // namespace Shapes
