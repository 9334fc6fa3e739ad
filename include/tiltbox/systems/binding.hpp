/**
 * @file binding.hpp
 * @brief User created joints between two shapes
 *
 * Anchors are stored as PointOnShape references so they follow their shape
 * through rotation and translation. A binding is enforced by treating the gap
 * between its two anchors as a collision and resolving it with the regular
 * collision response.
 */

#ifndef TILTBOX_BINDING_HPP
#define TILTBOX_BINDING_HPP

#include <cstdint>
#include <optional>
#include <utility>

#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/collision_data.hpp"
#include "tiltbox/shapes/shape.hpp"

namespace Bindings {

using Shapes::PointOnShape;

/**
 * @brief An anchor placed on a shape that is still waiting for a partner
 */
struct Unbound {
    enum class Kind {
        Hinge,
        Rigid
    };

    Kind kind;
    PointOnShape anchor;

    static Unbound hinge(const Shapes::Shape& shape, const Point& at);
    static Unbound rigid(const Shapes::Shape& shape, const Point& at);
};

/**
 * @brief A constraint between two shapes
 *
 * Hinge: one anchor per shape, kept coincident. Rigid: two hinges side by side
 * (at +-SimulatorConstants::RigidHalfSpan along x from the placement point),
 * which also locks the relative rotation.
 */
class Binding {
public:
    enum class Kind {
        Hinge,
        Rigid
    };

    static Binding makeHinge(PointOnShape first, PointOnShape second);
    static Binding makeRigid(std::pair<PointOnShape, PointOnShape> first,
                             std::pair<PointOnShape, PointOnShape> second);

    /**
     * @brief Attempts to attach a pending anchor of shape1 to shape2
     *
     * Succeeds only if shape2 contains the anchor's current world position.
     */
    static std::optional<Binding> tryBind(const Shapes::Shape& shape1,
                                          const Unbound& unbound,
                                          const Shapes::Shape& shape2);

    /**
     * @brief Pulls both shapes back towards satisfying the constraint
     */
    void enforce(Shapes::Shape& shape1,
                 Shapes::Shape& shape2,
                 std::int64_t timeStepMicros,
                 const EngineConfig& config) const;

    Kind kind() const { return m_kind; }

    /// Anchor(s) on the first shape; for a hinge both entries are equal
    const std::pair<PointOnShape, PointOnShape>& first() const { return m_first; }
    const std::pair<PointOnShape, PointOnShape>& second() const { return m_second; }

private:
    Binding(Kind kind, std::pair<PointOnShape, PointOnShape> first, std::pair<PointOnShape, PointOnShape> second)
        : m_kind(kind), m_first(first), m_second(second) {}

    Kind m_kind;
    std::pair<PointOnShape, PointOnShape> m_first;
    std::pair<PointOnShape, PointOnShape> m_second;
};

} // namespace Bindings

#endif // TILTBOX_BINDING_HPP
