#ifndef TILTBOX_COMPONENTS_BASIC_HPP
#define TILTBOX_COMPONENTS_BASIC_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "tiltbox/shapes/shape.hpp"
#include "tiltbox/systems/binding.hpp"

namespace Components {

    // Every entity carries exactly one convex body
    using Body = Shapes::Shape;

    struct EntityFlags {
        bool erasable = true;
        bool bindable = true;
        bool isStatic = false;
        bool deadly = false;
        bool fragile = false;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

    // A binding owned by this entity; the partner always comes later in
    // declaration order and may have been destroyed since
    struct BoundPartner {
        Bindings::Binding binding;
        entt::entity partner;
    };

    struct BindingSet {
        std::vector<BoundPartner> bound;
    };

    struct PendingAnchors {
        std::vector<Bindings::Unbound> anchors;
    };

    // Rotating hazard ray; direction sweeps at change rad/s within [-range, range]
    struct Beam {
        Point origin;
        Vector direction;
        double change = 0.0;
        double range = 0.0;
        double sweep = 0.0;
        std::optional<Shapes::Polygon> quad;  ///< geometry of the current tick
    };

    // Marks the player controlled ball
    struct PrimaryBall {};

    // Marks shapes created in edit mode, in creation order
    struct LevelShape {
        std::uint64_t sequence = 0;
    };

} // namespace Components

#endif // TILTBOX_COMPONENTS_BASIC_HPP
