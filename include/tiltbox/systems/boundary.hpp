/**
 * @file boundary.hpp
 * @brief System for removing entities that fell out of the world
 *
 * The primary ball (first in declaration order) is never pruned here; the
 * engine re-centres it instead.
 */

#ifndef TILTBOX_BOUNDARY_SYSTEM_HPP
#define TILTBOX_BOUNDARY_SYSTEM_HPP

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "tiltbox/core/engine_config.hpp"

namespace Systems {

class BoundarySystem {
public:
    /**
     * @brief Destroys every entity whose centroid is below the world floor
     * @param registry EnTT registry containing entities and components
     * @param order Entities in declaration order, kept in sync
     * @param config Supplies WorldFloor
     * @return Number of entities removed
     */
    static std::size_t update(entt::registry &registry,
                              std::vector<entt::entity> &order,
                              const EngineConfig &config);
};

} // namespace Systems

#endif // TILTBOX_BOUNDARY_SYSTEM_HPP
