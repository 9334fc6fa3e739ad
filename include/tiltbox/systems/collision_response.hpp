/**
 * @file collision_response.hpp
 * @brief Impulse based resolution of a single contact between two shapes
 *
 * The contact comes from the collision kernel (or from a violated binding
 * anchor) as a SupportVertex whose point is the minimum translation vector and
 * whose source points are the contact points on each shape. Resolution:
 * 1. Normal impulse with restitution
 * 2. Friction impulse along the tangent, engaged above a threshold
 * 3. Positional correction split by inverse mass
 */

#ifndef TILTBOX_COLLISION_RESPONSE_HPP
#define TILTBOX_COLLISION_RESPONSE_HPP

#include <cstdint>

#include "tiltbox/algo/minkowski.hpp"
#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/shape.hpp"

namespace RigidBodyCollision {

/**
 * @brief Severity of a collision, used for fragile bodies
 */
enum class CollisionType {
    None,
    Weak,
    Strong
};

/**
 * @brief Scalar impulse along a direction for a contact between two bodies
 *
 * @param first Physical state of the first body
 * @param second Physical state of the second body
 * @param firstOffset Vector from the first centroid to the contact point
 * @param secondOffset Vector from the second centroid to the contact point
 * @param normal Unit direction the impulse acts along
 * @param relativeVelocity Contact velocity of second minus first
 * @param reflectionFactor 1 + restitution for normal impulses
 */
double computeImpulse(const Shapes::CollisionData& first,
                      const Shapes::CollisionData& second,
                      const Vector& firstOffset,
                      const Vector& secondOffset,
                      const Vector& normal,
                      const Vector& relativeVelocity,
                      double reflectionFactor);

/**
 * @brief Applies normal impulse, friction and positional correction
 *
 * @param first Shape the contact point fromA lies on; pushed against the normal
 * @param second Shape the contact point fromB lies on; pushed along the normal
 * @param contact Minimum translation vector with its contact points
 * @param timeStepMicros Length of the current step
 * @param config Restitution, friction and correction coefficients
 * @return The normal impulse applied (zero if the bodies were separating)
 */
double resolveCollision(Shapes::Shape& first,
                        Shapes::Shape& second,
                        const Collision::SupportVertex& contact,
                        std::int64_t timeStepMicros,
                        const EngineConfig& config);

/**
 * @brief Detects and resolves a collision between two shapes
 * @return None when the shapes do not (meaningfully) overlap, Strong when the
 *         velocity change exceeds config.StrongCollisionVelocity, else Weak
 */
CollisionType collide(Shapes::Shape& first,
                      Shapes::Shape& second,
                      std::int64_t timeStepMicros,
                      const EngineConfig& config);

} // namespace RigidBodyCollision

#endif // TILTBOX_COLLISION_RESPONSE_HPP
