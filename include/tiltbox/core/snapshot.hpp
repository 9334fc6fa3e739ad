/**
 * @file snapshot.hpp
 * @brief Renderable copy of the world published once per consumed frame
 *
 * Plain data only: every geometric item has already been rotated by the aim
 * angle, so the consumer can draw it as is.
 */

#ifndef TILTBOX_SNAPSHOT_HPP
#define TILTBOX_SNAPSHOT_HPP

#include <cstddef>
#include <vector>

#include "tiltbox/components/basic.hpp"
#include "tiltbox/math/vector_math.hpp"

struct ColoredPolygon {
    std::vector<Point> vertices;
    Components::Color color;
};

struct ColoredCircle {
    Point center;
    double radius = 0.0;
    double angle = 0.0;  ///< accumulated rotation, for drawing a spoke
    Components::Color color;
};

struct Snapshot {
    std::vector<ColoredPolygon> polygons;  ///< scene, drawn and beam polygons
    std::vector<ColoredCircle> circles;    ///< primary ball first
    std::vector<std::vector<Point>> flags;
    std::vector<std::vector<Point>> doors;

    std::vector<Point> hinges;
    std::vector<Point> rigidBindings;      ///< midpoint of the two anchors on the owning shape
    std::vector<Point> pendingHinges;
    std::vector<Point> pendingRigidBindings;

    std::size_t levelIndex = 0;
    int remainingJumps = 0;
    bool gameComplete = false;
};

#endif // TILTBOX_SNAPSHOT_HPP
