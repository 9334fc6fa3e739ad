/**
 * @file tilt_yard.cpp
 * @brief First level: a walled yard with a plank to bind, a fragile block,
 *        a spike, two flags and a door down into the beam cavern
 */

#include "tiltbox/scenes/tilt_yard.hpp"

#include "tiltbox/scenes/scene_catalog.hpp"

namespace {

// Axis-aligned box as a counter-clockwise vertex ring
std::vector<Point> box(double x1, double y1, double x2, double y2) {
    return {Point(x1, y1), Point(x2, y1), Point(x2, y2), Point(x1, y2)};
}

SceneEntityFlags wall() {
    return SceneEntityFlags{};
}

} // namespace

std::string TiltYardScene::getName() const {
    return "Tilt Yard";
}

SceneDescriptor TiltYardScene::describe() const {
    SceneDescriptor scene;
    scene.name = getName();
    scene.initialBallPosition = Point(-0.6, -0.5);

    // floor and walls
    scene.polygons.push_back(PolygonDef{box(-0.95, -0.85, 0.95, -0.75), wall()});
    scene.polygons.push_back(PolygonDef{box(-0.95, -0.75, -0.85, 0.9), wall()});
    scene.polygons.push_back(PolygonDef{box(0.85, -0.75, 0.95, 0.9), wall()});

    // ledge holding the upper flag
    scene.polygons.push_back(PolygonDef{box(-0.85, 0.25, -0.45, 0.3), wall()});

    SceneEntityFlags plank;
    plank.isStatic = false;
    plank.bindable = true;
    scene.polygons.push_back(PolygonDef{box(-0.3, -0.45, 0.2, -0.4), plank});

    SceneEntityFlags fragile;
    fragile.fragile = true;
    scene.polygons.push_back(PolygonDef{box(0.3, -0.75, 0.45, -0.55), fragile});

    SceneEntityFlags deadly;
    deadly.deadly = true;
    scene.polygons.push_back(PolygonDef{{Point(-0.1, -0.75), Point(0.0, -0.62), Point(0.1, -0.75)}, deadly});

    SceneEntityFlags peg;
    peg.bindable = true;
    scene.circles.push_back(CircleDef{Point(0.55, 0.1), 0.05, peg});

    scene.doors.push_back(DoorDef{box(0.7, -0.75, 0.82, -0.6),
                                  static_cast<std::size_t>(BuiltinLevel::BeamCavern)});

    scene.flagPositions = {Point(-0.7, 0.32), Point(0.6, -0.7)};
    return scene;
}
