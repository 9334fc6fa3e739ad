/**
 * @file binding_system.hpp
 * @brief Creates and enforces bindings between entities
 *
 * Bindings live on the earlier of the two entities and name the later one by
 * handle. A handle that is no longer valid in the registry means the partner
 * was destroyed; such bindings are dropped when next enforced.
 *
 * Required components:
 * - Body
 * - BindingSet, PendingAnchors (optional)
 */

#ifndef TILTBOX_BINDING_SYSTEM_HPP
#define TILTBOX_BINDING_SYSTEM_HPP

#include <cstdint>
#include <vector>

#include <entt/entt.hpp>

#include "tiltbox/core/engine_config.hpp"

namespace Systems {

class BindingSystem {
public:
    /**
     * @brief Enforces every live binding in declaration order
     */
    static void update(entt::registry &registry,
                       const std::vector<entt::entity> &order,
                       std::int64_t timeStepMicros,
                       const EngineConfig &config);

    /**
     * @brief Offers a newly created entity to every pending anchor
     *
     * Called before the newcomer is appended to order, so every binding
     * created here points to a later entity.
     *
     * @return Number of bindings created
     */
    static std::size_t attachPending(entt::registry &registry,
                                     const std::vector<entt::entity> &order,
                                     entt::entity newcomer);
};

} // namespace Systems

#endif // TILTBOX_BINDING_SYSTEM_HPP
