/**
 * @file scene_catalog.hpp
 * @brief Catalog of the built-in levels
 */

#ifndef TILTBOX_SCENE_CATALOG_HPP
#define TILTBOX_SCENE_CATALOG_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "tiltbox/core/scene.hpp"
#include "tiltbox/scenes/i_scene.hpp"

/**
 * @brief Level indices of the built-in scenes, as used by doors
 */
enum class BuiltinLevel : std::size_t {
    TiltYard = 0,
    BeamCavern = 1,
    Sandbox = 2
};

class SceneCatalog {
public:
    SceneCatalog();

    /**
     * @brief Names of the scenes in level index order
     */
    std::vector<std::string> getSceneNames() const;

    /**
     * @brief Describes every scene into a library the engine can load
     */
    SceneLibrary buildLibrary() const;

private:
    std::vector<std::unique_ptr<IScene>> scenes;
};

#endif // TILTBOX_SCENE_CATALOG_HPP
