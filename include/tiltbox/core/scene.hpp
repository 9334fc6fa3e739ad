/**
 * @file scene.hpp
 * @brief Declarative description of a level
 *
 * A SceneDescriptor is read once when a level is (re)loaded. Levels are
 * addressed by their index in a SceneLibrary; doors name their destination
 * by that index.
 */

#ifndef TILTBOX_SCENE_HPP
#define TILTBOX_SCENE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "tiltbox/math/vector_math.hpp"

struct SceneEntityFlags {
    bool isStatic = true;
    bool bindable = false;
    bool deadly = false;
    bool fragile = false;
};

struct PolygonDef {
    std::vector<Point> vertices;
    SceneEntityFlags flags;
};

struct CircleDef {
    Point center;
    double radius = 0.0;
    SceneEntityFlags flags;
};

/**
 * @brief Rotating hazard ray
 *
 * The direction sweeps at change radians per second and reverses once the
 * accumulated sweep leaves [-range, range].
 */
struct BeamDef {
    Point origin;
    Vector direction;
    double change = 0.0;
    double range = 0.0;
};

struct DoorDef {
    std::vector<Point> trigger;
    std::size_t destination = 0;
};

struct SceneDescriptor {
    std::string name;
    Point initialBallPosition;
    std::vector<PolygonDef> polygons;
    std::vector<CircleDef> circles;
    std::vector<BeamDef> beams;
    std::vector<DoorDef> doors;
    std::vector<Point> flagPositions;
};

/**
 * @brief Indexed collection of levels
 */
class SceneLibrary {
public:
    /**
     * @throws std::invalid_argument if scenes is empty
     */
    explicit SceneLibrary(std::vector<SceneDescriptor> scenes);

    std::size_t size() const { return m_scenes.size(); }

    /**
     * @throws std::out_of_range for an unknown index
     */
    const SceneDescriptor& at(std::size_t index) const;
    SceneDescriptor& at(std::size_t index);

private:
    std::vector<SceneDescriptor> m_scenes;
};

#endif // TILTBOX_SCENE_HPP
