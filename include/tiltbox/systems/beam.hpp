/**
 * @file beam.hpp
 * @brief System for the rotating hazard beams
 *
 * Each beam is ray-marched from its origin until a body contains the sample
 * point, which yields a thin quad the primary ball must not touch. The
 * direction then sweeps back and forth.
 *
 * Required components:
 * - Beam (to modify)
 */

#ifndef TILTBOX_BEAM_SYSTEM_HPP
#define TILTBOX_BEAM_SYSTEM_HPP

#include <cstdint>
#include <vector>

#include <entt/entt.hpp>

#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/polygon.hpp"

namespace Systems {

class BeamSystem {
public:
    /**
     * @brief Rebuilds every beam quad, then advances the sweep
     * @param registry EnTT registry containing entities and components
     * @param bodies Entities the beam can strike
     * @param timeStepMicros Elapsed time
     * @param config BeamStep, BeamWidth and BeamMaxLength
     */
    static void update(entt::registry &registry,
                       const std::vector<entt::entity> &bodies,
                       std::int64_t timeStepMicros,
                       const EngineConfig &config);

    /**
     * @brief Quad from origin to the first sample inside a body
     *
     * Marching stops after BeamMaxLength if nothing is struck.
     */
    static Shapes::Polygon trace(const entt::registry &registry,
                                 const std::vector<entt::entity> &bodies,
                                 const Point &origin,
                                 const Vector &direction,
                                 const EngineConfig &config);
};

} // namespace Systems

#endif // TILTBOX_BEAM_SYSTEM_HPP
