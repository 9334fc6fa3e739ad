#include "tiltbox/systems/boundary.hpp"

#include <algorithm>

#include "tiltbox/components/basic.hpp"
#include "tiltbox/core/debug.hpp"
#include "tiltbox/core/profile.hpp"

namespace Systems {

std::size_t BoundarySystem::update(entt::registry &registry,
                                   std::vector<entt::entity> &order,
                                   const EngineConfig &config) {
    PROFILE_SCOPE("BoundarySystem");

    if (order.size() < 2) {
        return 0;
    }

    auto const fallen = std::stable_partition(order.begin() + 1, order.end(), [&](entt::entity entity) {
        return registry.get<Components::Body>(entity).collisionData().centroid.y > config.WorldFloor;
    });

    std::size_t const removed = static_cast<std::size_t>(std::distance(fallen, order.end()));
    for (auto it = fallen; it != order.end(); ++it) {
        registry.destroy(*it);
    }
    order.erase(fallen, order.end());

    if (removed > 0) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Boundary] pruned " << removed << " entities\n");
    }
    return removed;
}

} // namespace Systems
