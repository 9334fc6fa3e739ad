#include "tiltbox/systems/beam.hpp"

#include <algorithm>
#include <cmath>

#include "tiltbox/components/basic.hpp"
#include "tiltbox/core/profile.hpp"

namespace Systems {

Shapes::Polygon BeamSystem::trace(const entt::registry &registry,
                                  const std::vector<entt::entity> &bodies,
                                  const Point &origin,
                                  const Vector &direction,
                                  const EngineConfig &config) {
    Vector const unitDirection = direction.unit();
    Vector const delta = unitDirection * config.BeamStep;
    auto const maxSteps = static_cast<int>(std::ceil(config.BeamMaxLength / config.BeamStep));

    auto struck = [&](const Point &sample) {
        return std::any_of(bodies.begin(), bodies.end(), [&](entt::entity entity) {
            return registry.get<Components::Body>(entity).includes(sample);
        });
    };

    Point end = origin + delta;
    for (int step = 1; step < maxSteps && !struck(end); ++step) {
        end += delta;
    }

    Vector const offset = unitDirection.perpendicular() * config.BeamWidth;
    return Shapes::Polygon({origin, end, end + offset, origin + offset});
}

void BeamSystem::update(entt::registry &registry,
                        const std::vector<entt::entity> &bodies,
                        std::int64_t timeStepMicros,
                        const EngineConfig &config) {
    PROFILE_SCOPE("BeamSystem");

    double const seconds = static_cast<double>(timeStepMicros) * 1e-6;

    auto view = registry.view<Components::Beam>();
    for (auto [entity, beam] : view.each()) {
        beam.quad = trace(registry, bodies, beam.origin, beam.direction, config);

        double const turn = beam.change * seconds;
        beam.direction = beam.direction.rotateByAngle(turn);
        beam.sweep += turn;
        // reverse only while still heading outwards, so a beam never sticks at the limit
        if ((beam.sweep > beam.range && beam.change > 0.0) ||
            (beam.sweep < -beam.range && beam.change < 0.0)) {
            beam.change = -beam.change;
        }
    }
}

} // namespace Systems
