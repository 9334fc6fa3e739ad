#include "tiltbox/systems/movement.hpp"

#include "tiltbox/components/basic.hpp"
#include "tiltbox/core/profile.hpp"

namespace Systems {

void MovementSystem::update(entt::registry &registry,
                            std::int64_t timeStepMicros,
                            double ambientAngle,
                            const EngineConfig &config) {
    PROFILE_SCOPE("MovementSystem");

    auto view = registry.view<Components::Body, Components::EntityFlags>();
    for (auto [entity, body, flags] : view.each()) {
        if (flags.isStatic) {
            continue;
        }
        body.updatePosition(timeStepMicros, ambientAngle, config);
    }
}

} // namespace Systems
