/**
 * @file movement.hpp
 * @brief System for integrating positions and rotations
 *
 * Required components:
 * - Body (to modify)
 * - EntityFlags (static entities are skipped)
 */

#ifndef TILTBOX_MOVEMENT_SYSTEM_HPP
#define TILTBOX_MOVEMENT_SYSTEM_HPP

#include <cstdint>

#include <entt/entt.hpp>

#include "tiltbox/core/engine_config.hpp"

namespace Systems {

class MovementSystem {
public:
    /**
     * @brief Advances every non-static body by one time step
     * @param registry EnTT registry containing entities and components
     * @param timeStepMicros Elapsed time
     * @param ambientAngle Rotation applied to the gravity direction
     * @param config Gravity and movement coefficients
     */
    static void update(entt::registry &registry,
                       std::int64_t timeStepMicros,
                       double ambientAngle,
                       const EngineConfig &config);
};

} // namespace Systems

#endif // TILTBOX_MOVEMENT_SYSTEM_HPP
