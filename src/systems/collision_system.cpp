#include "tiltbox/systems/collision_system.hpp"

#include <algorithm>
#include <functional>

#include "tiltbox/components/basic.hpp"
#include "tiltbox/core/debug.hpp"
#include "tiltbox/core/profile.hpp"
#include "tiltbox/systems/collision_response.hpp"

namespace Systems {

CollisionReport CollisionSystem::update(entt::registry &registry,
                                        std::vector<entt::entity> &order,
                                        std::int64_t timeStepMicros,
                                        const EngineConfig &config) {
    PROFILE_SCOPE("CollisionSystem");
    using RigidBodyCollision::CollisionType;

    CollisionReport report;
    std::vector<std::size_t> toRemove;
    DebugStats::reset();

    for (std::size_t i = 0; i < order.size(); ++i) {
        auto &first = registry.get<Components::Body>(order[i]);
        auto const &firstFlags = registry.get<Components::EntityFlags>(order[i]);

        for (std::size_t j = i + 1; j < order.size(); ++j) {
            auto const &secondFlags = registry.get<Components::EntityFlags>(order[j]);
            if (firstFlags.isStatic && secondFlags.isStatic) {
                continue;
            }

            auto &second = registry.get<Components::Body>(order[j]);
            CollisionType const collision = RigidBodyCollision::collide(first, second, timeStepMicros, config);
            DebugStats::recordNarrowPhase(collision != CollisionType::None, collision == CollisionType::Strong);

            if (collision == CollisionType::Strong) {
                if (firstFlags.fragile) {
                    toRemove.push_back(i);
                }
                if (secondFlags.fragile) {
                    toRemove.push_back(j);
                }
            }

            if (i == 0 && collision != CollisionType::None) {
                if (secondFlags.deadly) {
                    report.primaryHitDeadly = true;
                } else {
                    report.primaryTouchedSafe = true;
                }
            }
        }
    }
    DebugStats::printCollisionStats();

    std::sort(toRemove.begin(), toRemove.end(), std::greater<>());
    toRemove.erase(std::unique(toRemove.begin(), toRemove.end()), toRemove.end());
    for (std::size_t const index : toRemove) {
        registry.destroy(order[index]);
        order.erase(order.begin() + static_cast<std::ptrdiff_t>(index));
    }
    report.fragileRemoved = toRemove.size();

    return report;
}

} // namespace Systems
