/**
 * @file engine.cpp
 * @brief Implementation of PhysicsEngine
 */

#include "tiltbox/core/engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "tiltbox/algo/collision.hpp"
#include "tiltbox/core/constants.hpp"
#include "tiltbox/core/debug.hpp"
#include "tiltbox/core/profile.hpp"
#include "tiltbox/systems/beam.hpp"
#include "tiltbox/systems/binding.hpp"
#include "tiltbox/systems/binding_system.hpp"
#include "tiltbox/systems/boundary.hpp"
#include "tiltbox/systems/collision_system.hpp"
#include "tiltbox/systems/movement.hpp"

namespace {

const Components::Color DeadlyColor(255, 0, 0);
const Components::Color FragileColor(178, 178, 178);
const Components::Color SceneryColor(76, 51, 51);
const Components::Color BeamColor(0, 0, 204);
const Components::Color PlayerColor(235, 200, 60);

Components::Color sceneColor(bool deadly, bool fragile) {
    if (deadly) {
        return DeadlyColor;
    }
    return fragile ? FragileColor : SceneryColor;
}

Components::EntityFlags sceneFlags(const SceneEntityFlags& flags) {
    Components::EntityFlags result;
    result.erasable = false;
    result.bindable = flags.bindable;
    result.isStatic = flags.isStatic;
    result.deadly = flags.deadly;
    result.fragile = flags.fragile;
    return result;
}

std::vector<Point> squareAt(const Point& corner, double side) {
    return {corner,
            corner + Vector(side, 0.0),
            corner + Vector(side, side),
            corner + Vector(0.0, side)};
}

bool isUsablePolygon(const Shapes::Polygon& polygon) {
    auto const& data = polygon.collisionData();
    return polygon.vertices().size() >= 3 && data.mass > EPSILON && std::isfinite(data.mass)
        && data.centroid.isFinite();
}

} // namespace

PhysicsEngine::PhysicsEngine(Channel::Sender<Snapshot> snapshots,
                             SceneLibrary library,
                             std::size_t startLevel,
                             EngineConfig config)
    : m_config(config)
    , m_snapshots(std::move(snapshots))
    , m_library(std::move(library))
    , m_lastIteration(std::chrono::steady_clock::now())
    , m_rng(std::random_device{}())
{
    if (startLevel >= m_library.size()) {
        throw std::out_of_range("no level with index " + std::to_string(startLevel));
    }
    validateLibrary();

    for (std::size_t i = 0; i < m_library.size(); ++i) {
        m_pristinePolygonCounts.push_back(m_library.at(i).polygons.size());
    }

    m_levelStack.push_back(startLevel);
    loadLevel(startLevel);

    if (publishSnapshot() == TickResult::Disconnected) {
        std::cerr << "Warning: snapshot receiver already gone when the engine started." << std::endl;
    }
}

void PhysicsEngine::validateLibrary() const {
    for (std::size_t i = 0; i < m_library.size(); ++i) {
        SceneDescriptor const& scene = m_library.at(i);
        for (auto const& door : scene.doors) {
            if (door.destination >= m_library.size()) {
                throw std::out_of_range("scene '" + scene.name + "': door leads to unknown level "
                                        + std::to_string(door.destination));
            }
            if (door.trigger.size() < 3) {
                throw std::invalid_argument("scene '" + scene.name + "': door trigger needs three vertices");
            }
        }
        for (auto const& beam : scene.beams) {
            if (beam.direction.isCloseTo(Vector()) || !beam.direction.isFinite()) {
                throw std::invalid_argument("scene '" + scene.name + "': beam without a direction");
            }
        }
        for (auto const& polygon : scene.polygons) {
            if (polygon.vertices.size() < 3) {
                throw std::invalid_argument("scene '" + scene.name + "': polygon needs three vertices");
            }
        }
        for (auto const& circle : scene.circles) {
            if (!(circle.radius > 0.0)) {
                throw std::invalid_argument("scene '" + scene.name + "': circle needs a positive radius");
            }
        }
    }
}

void PhysicsEngine::loadLevel(std::size_t index) {
    PROFILE_SCOPE("LoadLevel");
    SceneDescriptor const& scene = m_library.at(index);
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Engine] loading level " << index << " (" << scene.name << ")\n");

    m_registry.clear();
    m_entities.clear();
    m_flags.clear();
    m_doors.clear();
    m_remainingJumps = m_config.MaxJumps;
    m_ballStart = scene.initialBallPosition;

    Components::EntityFlags ballFlags;
    ballFlags.erasable = false;
    ballFlags.bindable = false;
    auto const ball = addEntity(Shapes::Circle(scene.initialBallPosition, m_config.PlayerRadius),
                                ballFlags, PlayerColor);
    m_registry.emplace<Components::PrimaryBall>(ball);

    for (std::size_t i = 0; i < scene.polygons.size(); ++i) {
        PolygonDef const& def = scene.polygons[i];
        auto const entity = addEntity(Shapes::Polygon(def.vertices), sceneFlags(def.flags),
                                      sceneColor(def.flags.deadly, def.flags.fragile));
        if (i >= m_pristinePolygonCounts[index]) {
            m_registry.emplace<Components::LevelShape>(entity, static_cast<std::uint64_t>(i));
        }
    }

    for (CircleDef const& def : scene.circles) {
        addEntity(Shapes::Circle(def.center, def.radius), sceneFlags(def.flags),
                  sceneColor(def.flags.deadly, def.flags.fragile));
    }

    for (BeamDef const& def : scene.beams) {
        auto const beam = m_registry.create();
        m_registry.emplace<Components::Beam>(beam, def.origin, def.direction.unit(), def.change, def.range);
    }
    Systems::BeamSystem::update(m_registry, m_entities, 0, m_config);

    for (DoorDef const& def : scene.doors) {
        m_doors.push_back(Door{Shapes::Polygon(def.trigger), def.destination});
    }

    for (Point const& position : scene.flagPositions) {
        m_flags.emplace_back(Shapes::Polygon(squareAt(position, SimulatorConstants::FlagSize)));
    }
}

entt::entity PhysicsEngine::addEntity(Shapes::Shape shape,
                                      const Components::EntityFlags& flags,
                                      const Components::Color& color) {
    if (flags.isStatic) {
        shape.collisionData().makeStatic();
    }

    auto const entity = m_registry.create();
    m_registry.emplace<Components::Body>(entity, std::move(shape));
    m_registry.emplace<Components::EntityFlags>(entity, flags);
    m_registry.emplace<Components::Color>(entity, color);

    Systems::BindingSystem::attachPending(m_registry, m_entities, entity);
    m_entities.push_back(entity);
    return entity;
}

void PhysicsEngine::removeEntity(entt::entity entity) {
    m_entities.erase(std::remove(m_entities.begin(), m_entities.end(), entity), m_entities.end());
    m_registry.destroy(entity);
}

template <typename Predicate>
std::optional<entt::entity> PhysicsEngine::firstEntityAt(const Point& point, Predicate predicate) const {
    for (entt::entity const entity : m_entities) {
        if (m_registry.get<Components::Body>(entity).includes(point) && predicate(entity)) {
            return entity;
        }
    }
    return std::nullopt;
}

TickResult PhysicsEngine::runIteration() {
    using namespace std::chrono;

    auto const now = steady_clock::now();
    auto const elapsed = duration_cast<microseconds>(now - m_lastIteration);
    auto const cap = microseconds(m_config.MaxTimeStepMicros);

    // only whole microseconds are consumed, the remainder carries over
    if (elapsed > cap) {
        m_lastIteration = now;
        return runIteration(cap);
    }
    m_lastIteration += elapsed;
    return runIteration(elapsed);
}

TickResult PhysicsEngine::runIteration(std::chrono::microseconds timeStep) {
    PROFILE_SCOPE("Tick");

    std::int64_t const dt = std::clamp<std::int64_t>(timeStep.count(), 0, m_config.MaxTimeStepMicros);
    DeferredOutcome outcome;

    Systems::MovementSystem::update(m_registry, dt, -m_angle, m_config);
    Systems::BoundarySystem::update(m_registry, m_entities, m_config);

    Systems::BeamSystem::update(m_registry, m_entities, dt, m_config);

    checkPrimaryBall(outcome);

    Systems::CollisionReport const report = Systems::CollisionSystem::update(m_registry, m_entities, dt, m_config);
    if (report.primaryHitDeadly) {
        outcome.resetLevel = true;
    }
    if (report.primaryTouchedSafe) {
        outcome.refillJumps = true;
    }

    Systems::BindingSystem::update(m_registry, m_entities, dt, m_config);

    TickResult result = TickResult::Skipped;
    if (m_snapshots.isEmpty()) {
        result = publishSnapshot();
    }

    applyOutcome(outcome);
    return result;
}

void PhysicsEngine::checkPrimaryBall(DeferredOutcome& outcome) {
    PROFILE_SCOPE("PrimaryBall");

    auto& ball = m_registry.get<Components::Body>(primaryBall());
    Point const centre = ball.collisionData().centroid;

    if (!centre.isFinite() || std::abs(centre.x) > m_config.WorldHalfWidth || centre.y < m_config.WorldFloor) {
        ball = Shapes::Circle(m_ballStart, m_config.PlayerRadius);
    }

    auto beams = m_registry.view<Components::Beam>();
    for (auto [entity, beam] : beams.each()) {
        if (beam.quad && Collision::collision(ball, Shapes::Shape(*beam.quad))) {
            outcome.resetLevel = true;
        }
    }

    std::size_t const flagsBefore = m_flags.size();
    m_flags.erase(std::remove_if(m_flags.begin(), m_flags.end(), [&](const Shapes::Shape& flag) {
        return Collision::collision(ball, flag).has_value();
    }), m_flags.end());
    if (flagsBefore > 0 && m_flags.empty()) {
        outcome.levelFinished = true;
    }

    for (Door const& door : m_doors) {
        if (Collision::collision(ball, door.trigger)) {
            outcome.enterLevel = door.destination;
            break;
        }
    }
}

void PhysicsEngine::applyOutcome(const DeferredOutcome& outcome) {
    if (outcome.refillJumps) {
        m_remainingJumps = m_config.MaxJumps;
    }

    if (outcome.resetLevel) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Engine] level " << currentLevel() << " reset\n");
        loadLevel(currentLevel());
        return;
    }

    if (outcome.enterLevel) {
        m_levelStack.push_back(*outcome.enterLevel);
        loadLevel(*outcome.enterLevel);
        return;
    }

    if (outcome.levelFinished) {
        if (m_levelStack.size() > 1) {
            m_levelStack.pop_back();
            loadLevel(currentLevel());
        } else {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Engine] all flags collected, game complete\n");
            m_gameComplete = true;
        }
    }
}

TickResult PhysicsEngine::publishSnapshot() {
    PROFILE_SCOPE("Publish");
    switch (m_snapshots.trySend(makeSnapshot())) {
        case Channel::TrySendResult::Sent:
            return TickResult::Published;
        case Channel::TrySendResult::Full:
            return TickResult::Skipped;
        case Channel::TrySendResult::Disconnected:
            break;
    }
    return TickResult::Disconnected;
}

Snapshot PhysicsEngine::makeSnapshot() const {
    Snapshot snapshot;
    snapshot.levelIndex = currentLevel();
    snapshot.remainingJumps = m_remainingJumps;
    snapshot.gameComplete = m_gameComplete;

    auto toViewRing = [this](const std::vector<Point>& ring) {
        std::vector<Point> rotated;
        rotated.reserve(ring.size());
        for (Point const& p : ring) {
            rotated.push_back(toView(p));
        }
        return rotated;
    };

    for (entt::entity const entity : m_entities) {
        auto const& body = m_registry.get<Components::Body>(entity);
        auto const& color = m_registry.get<Components::Color>(entity);

        if (auto const* circle = body.asCircle()) {
            snapshot.circles.push_back(ColoredCircle{toView(circle->center()), circle->radius(),
                                                     circle->angle() + m_angle, color});
        } else if (auto const* polygon = body.asPolygon()) {
            snapshot.polygons.push_back(ColoredPolygon{toViewRing(polygon->vertices()), color});
        }

        if (auto const* set = m_registry.try_get<Components::BindingSet>(entity)) {
            for (auto const& entry : set->bound) {
                if (!m_registry.valid(entry.partner)) {
                    continue;
                }
                auto const& anchors = entry.binding.first();
                if (entry.binding.kind() == Bindings::Binding::Kind::Hinge) {
                    snapshot.hinges.push_back(toView(body.resolvePointReference(anchors.first)));
                } else {
                    Point const midpoint = (body.resolvePointReference(anchors.first)
                                            + body.resolvePointReference(anchors.second)) * 0.5;
                    snapshot.rigidBindings.push_back(toView(midpoint));
                }
            }
        }

        if (auto const* pending = m_registry.try_get<Components::PendingAnchors>(entity)) {
            for (auto const& anchor : pending->anchors) {
                Point const at = toView(body.resolvePointReference(anchor.anchor));
                if (anchor.kind == Bindings::Unbound::Kind::Hinge) {
                    snapshot.pendingHinges.push_back(at);
                } else {
                    snapshot.pendingRigidBindings.push_back(at);
                }
            }
        }
    }

    auto beams = m_registry.view<Components::Beam>();
    for (auto [entity, beam] : beams.each()) {
        if (beam.quad) {
            snapshot.polygons.push_back(ColoredPolygon{toViewRing(beam.quad->vertices()), BeamColor});
        }
    }

    for (auto const& flag : m_flags) {
        if (auto const* polygon = flag.asPolygon()) {
            snapshot.flags.push_back(toViewRing(polygon->vertices()));
        }
    }
    for (auto const& door : m_doors) {
        if (auto const* polygon = door.trigger.asPolygon()) {
            snapshot.doors.push_back(toViewRing(polygon->vertices()));
        }
    }

    return snapshot;
}

void PhysicsEngine::handleCommand(const Command& command) {
    std::visit([this](auto const& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, Commands::EraseAt>) {
            eraseAt(toWorld(cmd.point));
        } else if constexpr (std::is_same_v<T, Commands::AddRigidAnchor>) {
            addRigid(toWorld(cmd.point));
        } else if constexpr (std::is_same_v<T, Commands::AddHingeAnchor>) {
            addHinge(toWorld(cmd.point));
        } else if constexpr (std::is_same_v<T, Commands::AddPolygon>) {
            std::vector<Point> stroke;
            stroke.reserve(cmd.vertices.size());
            for (Point const& p : cmd.vertices) {
                stroke.push_back(toWorld(p));
            }
            addPolygon(stroke);
        } else if constexpr (std::is_same_v<T, Commands::AddCircle>) {
            addCircle(toWorld(cmd.center), cmd.radius);
        } else if constexpr (std::is_same_v<T, Commands::SetAimAngle>) {
            setAimAngle(cmd.angle);
        } else if constexpr (std::is_same_v<T, Commands::Jump>) {
            jump();
        } else if constexpr (std::is_same_v<T, Commands::CreateLevelShape>) {
            createLevelShape(toWorld(cmd.corner1), toWorld(cmd.corner2), cmd.flags);
        } else if constexpr (std::is_same_v<T, Commands::RemoveLastLevelShape>) {
            removeLastLevelShape();
        }
    }, command);
}

bool PhysicsEngine::eraseAt(const Point& point) {
    auto const target = firstEntityAt(point, [this](entt::entity entity) {
        return m_registry.get<Components::EntityFlags>(entity).erasable;
    });
    if (!target) {
        return false;
    }
    removeEntity(*target);
    return true;
}

bool PhysicsEngine::addHinge(const Point& point) {
    auto const target = firstEntityAt(point, [this](entt::entity entity) {
        return m_registry.get<Components::EntityFlags>(entity).bindable;
    });
    if (!target) {
        return false;
    }
    auto const& body = m_registry.get<Components::Body>(*target);
    m_registry.get_or_emplace<Components::PendingAnchors>(*target).anchors.push_back(
        Bindings::Unbound::hinge(body, point));
    return true;
}

bool PhysicsEngine::addRigid(const Point& point) {
    auto const target = firstEntityAt(point, [this](entt::entity entity) {
        return m_registry.get<Components::EntityFlags>(entity).bindable;
    });
    if (!target) {
        return false;
    }
    auto const& body = m_registry.get<Components::Body>(*target);
    m_registry.get_or_emplace<Components::PendingAnchors>(*target).anchors.push_back(
        Bindings::Unbound::rigid(body, point));
    return true;
}

std::optional<entt::entity> PhysicsEngine::addPolygon(const std::vector<Point>& stroke) {
    if (stroke.empty()) {
        std::cerr << "Warning: ignoring empty polygon stroke." << std::endl;
        return std::nullopt;
    }

    Shapes::Polygon polygon = Shapes::hull<SimulatorConstants::DrawnHullDirections>(stroke);
    if (!isUsablePolygon(polygon)) {
        std::cerr << "Warning: ignoring degenerate polygon with " << polygon.vertices().size()
                  << " hull vertices." << std::endl;
        return std::nullopt;
    }
    return addEntity(std::move(polygon), Components::EntityFlags(), randomColor());
}

std::optional<entt::entity> PhysicsEngine::addCircle(const Point& center, double radius) {
    if (!(radius > 0.0) || !std::isfinite(radius) || !center.isFinite()) {
        std::cerr << "Warning: ignoring circle with radius " << radius << "." << std::endl;
        return std::nullopt;
    }
    return addEntity(Shapes::Circle(center, radius), Components::EntityFlags(), randomColor());
}

bool PhysicsEngine::jump() {
    if (m_remainingJumps <= 0) {
        return false;
    }
    auto& data = m_registry.get<Components::Body>(primaryBall()).collisionData();
    data.velocity += Vector(0.0, m_config.JumpSpeed).rotateByAngle(-m_angle);
    --m_remainingJumps;
    return true;
}

std::optional<entt::entity> PhysicsEngine::createLevelShape(const Point& corner1,
                                                            const Point& corner2,
                                                            const Commands::EditFlags& flags) {
    std::vector<Point> vertices{corner1,
                                Point(corner1.x, corner2.y),
                                corner2,
                                Point(corner2.x, corner1.y)};
    Shapes::Polygon polygon(vertices);
    if (!isUsablePolygon(polygon)) {
        std::cerr << "Warning: ignoring level shape with zero area." << std::endl;
        return std::nullopt;
    }

    SceneEntityFlags sceneEntityFlags;
    sceneEntityFlags.deadly = flags.deadly;
    sceneEntityFlags.fragile = flags.fragile;

    auto& scene = m_library.at(currentLevel());
    scene.polygons.push_back(PolygonDef{std::move(vertices), sceneEntityFlags});

    auto const entity = addEntity(std::move(polygon), sceneFlags(sceneEntityFlags),
                                  sceneColor(flags.deadly, flags.fragile));
    m_registry.emplace<Components::LevelShape>(entity, static_cast<std::uint64_t>(scene.polygons.size() - 1));
    return entity;
}

bool PhysicsEngine::removeLastLevelShape() {
    auto& scene = m_library.at(currentLevel());
    if (scene.polygons.size() <= m_pristinePolygonCounts[currentLevel()]) {
        return false;
    }

    auto const index = static_cast<std::uint64_t>(scene.polygons.size() - 1);
    scene.polygons.pop_back();

    // the shape may already be gone (fragile, or fallen), then only the scene changes
    std::optional<entt::entity> removed;
    auto view = m_registry.view<Components::LevelShape>();
    for (auto [entity, tag] : view.each()) {
        if (tag.sequence == index) {
            removed = entity;
        }
    }
    if (removed) {
        removeEntity(*removed);
    }
    return true;
}

Components::Color PhysicsEngine::randomColor() {
    std::uniform_int_distribution<int> channel(0, 255);
    return Components::Color(static_cast<uint8_t>(channel(m_rng)),
                             static_cast<uint8_t>(channel(m_rng)),
                             static_cast<uint8_t>(channel(m_rng)));
}
