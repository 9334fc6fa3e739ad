#include <gtest/gtest.h>

#include "tiltbox/core/constants.hpp"
#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/shape.hpp"
#include "tiltbox/systems/binding.hpp"

using Bindings::Binding;
using Bindings::Unbound;

namespace {

Shapes::Shape box(double x0, double y0, double x1, double y1) {
    return Shapes::Polygon({Point(x0, y0), Point(x1, y0), Point(x1, y1), Point(x0, y1)});
}

} // namespace

TEST(BindingTest, HingeBindsWhenPartnerContainsAnchor) {
    Shapes::Shape plank = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape peg = Shapes::Circle(Point(0.5, 0.5), 0.3);

    Unbound pending = Unbound::hinge(plank, Point(0.5, 0.6));
    auto binding = Binding::tryBind(plank, pending, peg);

    ASSERT_TRUE(binding.has_value());
    EXPECT_EQ(binding->kind(), Binding::Kind::Hinge);
    EXPECT_EQ(plank.resolvePointReference(binding->first().first), Point(0.5, 0.6));
    EXPECT_EQ(peg.resolvePointReference(binding->second().first), Point(0.5, 0.6));
}

TEST(BindingTest, NoBindingOutsidePartner) {
    Shapes::Shape plank = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape peg = Shapes::Circle(Point(0.5, 0.5), 0.1);

    EXPECT_FALSE(Binding::tryBind(plank, Unbound::hinge(plank, Point(0.9, 0.9)), peg).has_value());
    EXPECT_FALSE(Binding::tryBind(plank, Unbound::rigid(plank, Point(0.9, 0.9)), peg).has_value());
}

TEST(BindingTest, RigidAnchorsAreOffsetAlongX) {
    Shapes::Shape plank = box(-1.0, -1.0, 1.0, 1.0);
    Shapes::Shape block = box(-0.5, -0.5, 0.5, 0.5);
    Point const at(0.1, 0.1);
    double const span = SimulatorConstants::RigidHalfSpan;

    auto binding = Binding::tryBind(plank, Unbound::rigid(plank, at), block);
    ASSERT_TRUE(binding.has_value());
    EXPECT_EQ(binding->kind(), Binding::Kind::Rigid);

    EXPECT_EQ(plank.resolvePointReference(binding->first().first), at + Vector(span, 0.0));
    EXPECT_EQ(plank.resolvePointReference(binding->first().second), at - Vector(span, 0.0));
    EXPECT_EQ(block.resolvePointReference(binding->second().first), at + Vector(span, 0.0));
    EXPECT_EQ(block.resolvePointReference(binding->second().second), at - Vector(span, 0.0));
}

TEST(BindingTest, AnchorsFollowTheirShape) {
    Shapes::Shape plank = box(0.0, 0.0, 1.0, 1.0);
    Unbound pending = Unbound::hinge(plank, Point(0.25, 0.5));

    plank.translate(Vector(2.0, 0.0));
    EXPECT_EQ(plank.resolvePointReference(pending.anchor), Point(2.25, 0.5));

    // the anchor moved out of a peg at its old position
    Shapes::Shape peg = Shapes::Circle(Point(0.25, 0.5), 0.1);
    EXPECT_FALSE(Binding::tryBind(plank, pending, peg).has_value());
}

TEST(BindingTest, EnforcePullsAnchorsTogether) {
    EngineConfig config;
    Shapes::Shape plank = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape peg = Shapes::Circle(Point(0.5, 0.5), 0.3);

    auto binding = Binding::tryBind(plank, Unbound::hinge(plank, Point(0.5, 0.5)), peg);
    ASSERT_TRUE(binding.has_value());

    peg.translate(Vector(0.1, 0.0));
    auto gap = [&]() {
        return plank.resolvePointReference(binding->first().first)
            .to(peg.resolvePointReference(binding->second().first))
            .length();
    };
    double const before = gap();

    binding->enforce(plank, peg, 1000, config);
    EXPECT_LT(gap(), before);
}

TEST(BindingTest, SatisfiedBindingIsLeftAlone) {
    EngineConfig config;
    Shapes::Shape plank = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape peg = Shapes::Circle(Point(0.5, 0.5), 0.3);

    auto binding = Binding::tryBind(plank, Unbound::rigid(plank, Point(0.5, 0.5)), peg);
    ASSERT_TRUE(binding.has_value());

    binding->enforce(plank, peg, 1000, config);
    EXPECT_EQ(plank.collisionData().centroid, Point(0.5, 0.5));
    EXPECT_EQ(peg.collisionData().centroid, Point(0.5, 0.5));
    EXPECT_DOUBLE_EQ(peg.collisionData().velocity.length(), 0.0);
}
