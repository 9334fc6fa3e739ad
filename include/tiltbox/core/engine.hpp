/**
 * @file engine.hpp
 * @brief Aggregate root of the simulation: world, level progress and player
 *
 * The engine owns an ECS registry of bodies and an ordered list of their
 * handles. Declaration order matters: the primary ball is always first, the
 * collision pass treats the earlier entity as the first operand, and bindings
 * only ever point to later entities.
 *
 * One runIteration() is one tick:
 * 1. measure elapsed time
 * 2. integrate non-static bodies, prune those below the world floor
 * 3. ray-march hazard beams
 * 4. primary ball checks (bounds, beams, flags, doors)
 * 5. all-pairs collision, fragile removal
 * 6. binding enforcement
 * 7. snapshot publishing, only if the previous one was consumed
 * 8. deferred jump refill, level reset or level transition
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "tiltbox/components/basic.hpp"
#include "tiltbox/core/channel.hpp"
#include "tiltbox/core/commands.hpp"
#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/core/scene.hpp"
#include "tiltbox/core/snapshot.hpp"
#include "tiltbox/shapes/shape.hpp"

/**
 * @brief Outcome of a single tick
 */
enum class TickResult {
    Published,    ///< a new snapshot was enqueued
    Skipped,      ///< the consumer had not drained the previous snapshot
    Disconnected  ///< the snapshot receiver is gone
};

class PhysicsEngine {
public:
    /**
     * @brief Loads the starting level and publishes an initial snapshot
     *
     * @param snapshots Sending side of the (capacity one) snapshot channel
     * @param library Levels; the engine keeps its own copy for edit mode
     * @param startLevel Index of the first level
     * @param config Tuned constants
     * @throws std::out_of_range if startLevel or a door destination is unknown
     * @throws std::invalid_argument if a beam has no direction
     */
    PhysicsEngine(Channel::Sender<Snapshot> snapshots,
                  SceneLibrary library,
                  std::size_t startLevel = 0,
                  EngineConfig config = EngineConfig());

    /**
     * @brief Runs one tick with the wall time elapsed since the previous one
     */
    TickResult runIteration();

    /**
     * @brief Runs one tick of a given length (clamped to [0, MaxTimeStepMicros])
     */
    TickResult runIteration(std::chrono::microseconds timeStep);

    /**
     * @brief Applies a front end command; points are rotated into world space
     */
    void handleCommand(const Command& command);

    // World space operations

    /// Removes the first erasable entity including point
    bool eraseAt(const Point& point);
    /// Places a pending hinge anchor on the first bindable entity including point
    bool addHinge(const Point& point);
    /// Places a pending rigid anchor on the first bindable entity including point
    bool addRigid(const Point& point);
    /// Hulls a freehand stroke into a dynamic polygon; degenerate strokes are rejected
    std::optional<entt::entity> addPolygon(const std::vector<Point>& stroke);
    std::optional<entt::entity> addCircle(const Point& center, double radius);
    void setAimAngle(double angle) { m_angle = angle; }
    /// Pushes the ball "up" if a jump is left
    bool jump();
    /// Edit mode: static rectangle, also recorded in the current scene
    std::optional<entt::entity> createLevelShape(const Point& corner1,
                                                 const Point& corner2,
                                                 const Commands::EditFlags& flags);
    bool removeLastLevelShape();

    /**
     * @brief Renderable copy of the world rotated into view space
     */
    Snapshot makeSnapshot() const;

    const entt::registry& registry() const { return m_registry; }
    const std::vector<entt::entity>& entities() const { return m_entities; }
    entt::entity primaryBall() const { return m_entities.front(); }

    std::size_t currentLevel() const { return m_levelStack.back(); }
    const std::vector<std::size_t>& levelStack() const { return m_levelStack; }
    const SceneDescriptor& currentScene() const { return m_library.at(currentLevel()); }
    std::size_t remainingFlags() const { return m_flags.size(); }
    bool isGameComplete() const { return m_gameComplete; }
    int remainingJumps() const { return m_remainingJumps; }
    double aimAngle() const { return m_angle; }
    const EngineConfig& config() const { return m_config; }

private:
    struct Door {
        Shapes::Shape trigger;
        std::size_t destination;
    };

    struct DeferredOutcome {
        bool refillJumps = false;
        bool resetLevel = false;
        bool levelFinished = false;
        std::optional<std::size_t> enterLevel;
    };

    void validateLibrary() const;
    void loadLevel(std::size_t index);

    entt::entity addEntity(Shapes::Shape shape,
                           const Components::EntityFlags& flags,
                           const Components::Color& color);
    void removeEntity(entt::entity entity);

    /// First entity in declaration order including point and satisfying the predicate
    template <typename Predicate>
    std::optional<entt::entity> firstEntityAt(const Point& point, Predicate predicate) const;

    void checkPrimaryBall(DeferredOutcome& outcome);
    TickResult publishSnapshot();
    void applyOutcome(const DeferredOutcome& outcome);

    Point toWorld(const Point& viewPoint) const { return viewPoint.rotateByAngle(-m_angle); }
    Point toView(const Point& worldPoint) const { return worldPoint.rotateByAngle(m_angle); }
    Components::Color randomColor();

    EngineConfig m_config;
    Channel::Sender<Snapshot> m_snapshots;
    SceneLibrary m_library;
    std::vector<std::size_t> m_pristinePolygonCounts;  // per level, before any editing

    entt::registry m_registry;
    std::vector<entt::entity> m_entities;

    std::vector<Shapes::Shape> m_flags;
    std::vector<Door> m_doors;
    Point m_ballStart;

    std::vector<std::size_t> m_levelStack;
    bool m_gameComplete = false;
    int m_remainingJumps = 0;
    double m_angle = 0.0;

    std::chrono::steady_clock::time_point m_lastIteration;
    std::mt19937 m_rng;
};
