#include "tiltbox/scenes/scene_catalog.hpp"

#include "tiltbox/scenes/beam_cavern.hpp"
#include "tiltbox/scenes/sandbox.hpp"
#include "tiltbox/scenes/tilt_yard.hpp"

#include <utility>

SceneCatalog::SceneCatalog() {
    // order must match BuiltinLevel
    scenes.push_back(std::make_unique<TiltYardScene>());
    scenes.push_back(std::make_unique<BeamCavernScene>());
    scenes.push_back(std::make_unique<SandboxScene>());
}

std::vector<std::string> SceneCatalog::getSceneNames() const {
    std::vector<std::string> names;
    names.reserve(scenes.size());
    for (auto const& scene : scenes) {
        names.push_back(scene->getName());
    }
    return names;
}

SceneLibrary SceneCatalog::buildLibrary() const {
    std::vector<SceneDescriptor> descriptors;
    descriptors.reserve(scenes.size());
    for (auto const& scene : scenes) {
        descriptors.push_back(scene->describe());
    }
    return SceneLibrary(std::move(descriptors));
}
