#ifndef TILTBOX_I_SCENE_HPP
#define TILTBOX_I_SCENE_HPP

#include <string>

#include "tiltbox/core/scene.hpp"

/**
 * @brief Abstract base class for a built-in level
 *
 * Each scene must provide:
 *  - getName() for menus and logs
 *  - describe() returning the declarative level layout
 */
class IScene {
public:
    virtual ~IScene() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Level layout, door destinations are indices in the scene catalog
     */
    virtual SceneDescriptor describe() const = 0;
};

#endif // TILTBOX_I_SCENE_HPP
