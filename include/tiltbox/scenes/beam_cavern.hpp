#pragma once

#include "tiltbox/scenes/i_scene.hpp"

class BeamCavernScene : public IScene {
public:
    BeamCavernScene() = default;
    ~BeamCavernScene() override = default;

    std::string getName() const override;
    SceneDescriptor describe() const override;
};
