#include "tiltbox/core/scene.hpp"

#include <stdexcept>
#include <string>
#include <utility>

SceneLibrary::SceneLibrary(std::vector<SceneDescriptor> scenes)
    : m_scenes(std::move(scenes))
{
    if (m_scenes.empty()) {
        throw std::invalid_argument("SceneLibrary: at least one scene is required");
    }
}

const SceneDescriptor& SceneLibrary::at(std::size_t index) const {
    if (index >= m_scenes.size()) {
        throw std::out_of_range("SceneLibrary: no scene with index " + std::to_string(index));
    }
    return m_scenes[index];
}

SceneDescriptor& SceneLibrary::at(std::size_t index) {
    return const_cast<SceneDescriptor&>(static_cast<const SceneLibrary&>(*this).at(index));
}
