/**
 * @file collision_response.cpp
 * @brief Normal and friction impulses plus positional correction
 */

#include "tiltbox/systems/collision_response.hpp"

#include <algorithm>
#include <cmath>

#include "tiltbox/algo/collision.hpp"
#include "tiltbox/core/debug.hpp"

namespace RigidBodyCollision {

double computeImpulse(const Shapes::CollisionData& first,
                      const Shapes::CollisionData& second,
                      const Vector& firstOffset,
                      const Vector& secondOffset,
                      const Vector& normal,
                      const Vector& relativeVelocity,
                      double reflectionFactor) {
    Vector const angularTerm = firstOffset.tripleProduct(normal) / first.inertia
                             + secondOffset.tripleProduct(normal) / second.inertia;
    double const denominator = 1.0 / first.mass + 1.0 / second.mass - normal.dotProduct(angularTerm);
    return -normal.dotProduct(relativeVelocity * reflectionFactor) / denominator;
}

static void applyImpulse(Shapes::CollisionData& first,
                         Shapes::CollisionData& second,
                         const Vector& firstOffset,
                         const Vector& secondOffset,
                         const Vector& direction,
                         double impulse) {
    first.velocity -= direction * (impulse / first.mass);
    first.angularVelocity -= impulse * firstOffset.cross(direction) / first.inertia;

    second.velocity += direction * (impulse / second.mass);
    second.angularVelocity += impulse * secondOffset.cross(direction) / second.inertia;
}

double resolveCollision(Shapes::Shape& first,
                        Shapes::Shape& second,
                        const Collision::SupportVertex& contact,
                        std::int64_t timeStepMicros,
                        const EngineConfig& config) {
    Shapes::CollisionData& a = first.collisionData();
    Shapes::CollisionData& b = second.collisionData();

    Vector const firstOffset = a.centroid.to(contact.fromA);
    Vector const secondOffset = b.centroid.to(contact.fromB);
    Vector const normal = contact.point.unit();

    Vector const firstVelocity = a.velocity - (firstOffset * a.angularVelocity).perpendicular();
    Vector const secondVelocity = b.velocity - (secondOffset * b.angularVelocity).perpendicular();
    Vector const relativeVelocity = secondVelocity - firstVelocity;

    double impulse = computeImpulse(a, b, firstOffset, secondOffset, normal, relativeVelocity,
                                    config.CollisionCoeffRestitution + 1.0);

    if (impulse > 0.0) {
        Vector const frictionNormal = -normal.perpendicular();

        double const staticFriction = computeImpulse(a, b, firstOffset, secondOffset,
                                                     frictionNormal, relativeVelocity, 1.0);

        double frictionImpulse = 0.0;
        if (staticFriction > impulse * config.StaticFrictionThreshold) {
            double const factor = std::min(config.FrictionDepthGain * contact.point.length(),
                                           config.MaxFrictionFactor);
            frictionImpulse = computeImpulse(a, b, firstOffset, secondOffset,
                                             frictionNormal, relativeVelocity, factor);
        }

        applyImpulse(a, b, firstOffset, secondOffset, normal, impulse);
        applyImpulse(a, b, firstOffset, secondOffset, frictionNormal, frictionImpulse);
    } else {
        impulse = 0.0;
    }

    if (std::isfinite(a.mass) || std::isfinite(b.mass)) {
        double const depth = std::min(contact.point.length(),
                                      config.PositionCorrectionPerMicro * static_cast<double>(timeStepMicros));
        Vector const translation = normal * depth;
        double const inverseFirst = 1.0 / a.mass;
        double const inverseSecond = 1.0 / b.mass;
        double const inverseSum = inverseFirst + inverseSecond;

        first.translate(-translation * (inverseFirst / inverseSum));
        second.translate(translation * (inverseSecond / inverseSum));
    }

    return impulse;
}

CollisionType collide(Shapes::Shape& first,
                      Shapes::Shape& second,
                      std::int64_t timeStepMicros,
                      const EngineConfig& config) {
    auto const contact = Collision::collision(first, second);
    if (!contact || contact->point.isCloseTo(Vector())) {
        return CollisionType::None;
    }

    double const impulse = resolveCollision(first, second, *contact, timeStepMicros, config);

    double const velocityChange = impulse * (1.0 / first.collisionData().mass + 1.0 / second.collisionData().mass);
    if (velocityChange > config.StrongCollisionVelocity) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Collision] strong hit, velocity change " << velocityChange << "\n");
        return CollisionType::Strong;
    }
    return CollisionType::Weak;
}

} // namespace RigidBodyCollision
