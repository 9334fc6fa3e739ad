/**
 * @file beam_cavern.cpp
 * @brief Nested level entered through the yard door: a sweeping beam guards
 *        the only flag; collecting it returns to the yard
 */

#include "tiltbox/scenes/beam_cavern.hpp"

std::string BeamCavernScene::getName() const {
    return "Beam Cavern";
}

SceneDescriptor BeamCavernScene::describe() const {
    SceneDescriptor scene;
    scene.name = getName();
    scene.initialBallPosition = Point(-0.7, -0.6);

    SceneEntityFlags rock;

    scene.polygons.push_back(PolygonDef{{Point(-0.95, -0.85), Point(0.95, -0.85),
                                         Point(0.95, -0.75), Point(-0.95, -0.75)}, rock});
    scene.polygons.push_back(PolygonDef{{Point(-0.95, 0.8), Point(0.95, 0.8),
                                         Point(0.95, 0.9), Point(-0.95, 0.9)}, rock});
    scene.polygons.push_back(PolygonDef{{Point(-0.95, -0.75), Point(-0.85, -0.75),
                                         Point(-0.85, 0.8), Point(-0.95, 0.8)}, rock});
    scene.polygons.push_back(PolygonDef{{Point(0.85, -0.75), Point(0.95, -0.75),
                                         Point(0.95, 0.8), Point(0.85, 0.8)}, rock});

    // stepping stones
    scene.polygons.push_back(PolygonDef{{Point(-0.4, -0.45), Point(-0.1, -0.45),
                                         Point(-0.1, -0.4), Point(-0.4, -0.4)}, rock});
    scene.polygons.push_back(PolygonDef{{Point(0.2, -0.15), Point(0.6, -0.15),
                                         Point(0.6, -0.1), Point(0.2, -0.1)}, rock});

    SceneEntityFlags boulder;
    boulder.isStatic = false;
    boulder.bindable = true;
    scene.circles.push_back(CircleDef{Point(0.0, 0.3), 0.08, boulder});

    // hangs from the ceiling and sweeps +-0.6 rad
    scene.beams.push_back(BeamDef{Point(0.1, 0.79), Vector(0.0, -1.0), 0.5, 0.6});

    scene.flagPositions = {Point(0.45, -0.05)};
    return scene;
}
