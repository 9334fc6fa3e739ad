#pragma once

#include "tiltbox/scenes/i_scene.hpp"

class SandboxScene : public IScene {
public:
    SandboxScene() = default;
    ~SandboxScene() override = default;

    std::string getName() const override;
    SceneDescriptor describe() const override;
};
