#pragma once

#include <cstdint>

/**
 * @struct EngineConfig
 * @brief Holds all tuned parameters of the simulation.
 *
 * Time is measured in microseconds of wall clock. The coupling coefficients
 * and the collision response constants were tuned for feel, not derived.
 */
struct EngineConfig {
    // Integration
    double GravityCoefficient = -0.000002;   ///< velocity change per microsecond
    double MovementCoefficient = 0.0000004;  ///< distance per velocity unit per microsecond
    std::int64_t MaxTimeStepMicros = 50000;  ///< cap for a single tick after stalls

    // Collision response
    double CollisionCoeffRestitution = 0.2;
    double StaticFrictionThreshold = 1e-4;   ///< friction / normal impulse ratio to engage friction
    double FrictionDepthGain = 50.0;         ///< friction factor = min(gain * depth, MaxFrictionFactor)
    double MaxFrictionFactor = 1.0;
    double PositionCorrectionPerMicro = 1e-6;
    double StrongCollisionVelocity = 1.5;    ///< velocity change above which a hit breaks fragile bodies

    // World
    double WorldFloor = -5.0;                ///< entities below this height are pruned
    double WorldHalfWidth = 5.0;             ///< primary ball is re-centred beyond |x|
    double PlayerRadius = 0.07;

    // Player
    int MaxJumps = 2;
    double JumpSpeed = 1.0;

    // Hazard beams
    double BeamStep = 0.1;
    double BeamWidth = 0.02;
    double BeamMaxLength = 20.0;
};
