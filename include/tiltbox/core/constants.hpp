#ifndef TILTBOX_SIMULATOR_CONSTANTS_HPP
#define TILTBOX_SIMULATOR_CONSTANTS_HPP

#include <cstddef>

namespace SimulatorConstants {

    // Truly global constants
    constexpr double Pi = 3.14159265358979323846;

    // Iteration caps of the collision kernel. Hitting either cap is treated
    // as "no collision" (GJK) or "good enough" (EPA).
    constexpr int GjkMaxIterations = 40;
    constexpr int EpaMaxIterations = 40;

    // Number of sampling directions used to hull freehand drawings
    constexpr std::size_t DrawnHullDirections = 24;

    // Half distance between the two hinges of a rigid binding, along world x
    constexpr double RigidHalfSpan = 0.2;

    // Side of the square marker built around each goal flag position
    constexpr double FlagSize = 0.1;

} // namespace SimulatorConstants

#endif // TILTBOX_SIMULATOR_CONSTANTS_HPP
