/**
 * @file commands.hpp
 * @brief Messages sent from the front end to the simulation thread
 *
 * Every point is given in view space (the space of the rotated snapshot) and
 * is rotated into world space by the engine.
 */

#ifndef TILTBOX_COMMANDS_HPP
#define TILTBOX_COMMANDS_HPP

#include <variant>
#include <vector>

#include "tiltbox/math/vector_math.hpp"

namespace Commands {

/// Remove the first erasable entity containing the point
struct EraseAt {
    Point point;
};

/// Place a pending rigid anchor on the first bindable entity containing the point
struct AddRigidAnchor {
    Point point;
};

/// Place a pending hinge anchor on the first bindable entity containing the point
struct AddHingeAnchor {
    Point point;
};

/// Free-form stroke, wrapped in a convex hull
struct AddPolygon {
    std::vector<Point> vertices;
};

struct AddCircle {
    Point center;
    double radius = 0.0;
};

/// Absolute aim angle in radians; gravity points along (0, -1) rotated by -angle
struct SetAimAngle {
    double angle = 0.0;
};

struct Jump {};

struct EditFlags {
    bool deadly = false;
    bool fragile = false;
};

/// Edit mode: static axis-aligned rectangle spanned by two corners
struct CreateLevelShape {
    Point corner1;
    Point corner2;
    EditFlags flags;
};

/// Edit mode: undo the most recent CreateLevelShape
struct RemoveLastLevelShape {};

} // namespace Commands

using Command = std::variant<Commands::EraseAt,
                             Commands::AddRigidAnchor,
                             Commands::AddHingeAnchor,
                             Commands::AddPolygon,
                             Commands::AddCircle,
                             Commands::SetAimAngle,
                             Commands::Jump,
                             Commands::CreateLevelShape,
                             Commands::RemoveLastLevelShape>;

#endif // TILTBOX_COMMANDS_HPP
