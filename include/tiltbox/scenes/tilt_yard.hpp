#pragma once

#include "tiltbox/scenes/i_scene.hpp"

class TiltYardScene : public IScene {
public:
    TiltYardScene() = default;
    ~TiltYardScene() override = default;

    std::string getName() const override;
    SceneDescriptor describe() const override;
};
