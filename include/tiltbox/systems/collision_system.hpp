/**
 * @file collision_system.hpp
 * @brief All-pairs collision pass over the bodies of the world
 *
 * Pairs are visited in declaration order with the earlier entity as the first
 * operand. Pairs of two static bodies are skipped. Fragile bodies struck by a
 * strong collision are destroyed once the pass is over.
 *
 * Required components:
 * - Body (to modify)
 * - EntityFlags (to read)
 */

#ifndef TILTBOX_COLLISION_SYSTEM_HPP
#define TILTBOX_COLLISION_SYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include <entt/entt.hpp>

#include "tiltbox/core/engine_config.hpp"

namespace Systems {

/**
 * @brief What the pass observed about the primary ball (order[0])
 */
struct CollisionReport {
    bool primaryHitDeadly = false;
    bool primaryTouchedSafe = false;  ///< touched a non-deadly body, refills jumps
    std::size_t fragileRemoved = 0;
};

class CollisionSystem {
public:
    /**
     * @brief Collides every unordered pair once
     * @param registry EnTT registry containing entities and components
     * @param order Entities in declaration order, kept in sync on removal
     * @param timeStepMicros Elapsed time
     * @param config Collision response coefficients
     */
    static CollisionReport update(entt::registry &registry,
                                  std::vector<entt::entity> &order,
                                  std::int64_t timeStepMicros,
                                  const EngineConfig &config);
};

} // namespace Systems

#endif // TILTBOX_COLLISION_SYSTEM_HPP
