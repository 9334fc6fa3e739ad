#include "tiltbox/scenes/sandbox.hpp"

std::string SandboxScene::getName() const {
    return "Sandbox";
}

// Open floor for drawing and edit mode; no flags, so it never completes
SceneDescriptor SandboxScene::describe() const {
    SceneDescriptor scene;
    scene.name = getName();
    scene.initialBallPosition = Point(0.0, 0.0);

    SceneEntityFlags ground;
    scene.polygons.push_back(PolygonDef{{Point(-0.9, -0.8), Point(0.9, -0.8),
                                         Point(0.9, -0.7), Point(-0.9, -0.7)}, ground});
    return scene;
}
