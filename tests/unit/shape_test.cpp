#include <gtest/gtest.h>

#include <cmath>

#include "tiltbox/core/constants.hpp"
#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/shape.hpp"

using SimulatorConstants::Pi;

namespace {

Shapes::Shape square(double x, double y, double side) {
    return Shapes::Polygon({Point(x, y), Point(x + side, y), Point(x + side, y + side), Point(x, y + side)});
}

} // namespace

TEST(CircleTest, DiskMassAndInertia) {
    Shapes::Circle circle(Point(1.0, 2.0), 0.5);
    EXPECT_NEAR(circle.collisionData().mass, Pi * 0.25, EPSILON);
    EXPECT_NEAR(circle.collisionData().inertia, Pi * 0.25 * 0.25 / 2.0, EPSILON);
}

TEST(CircleTest, SupportAndIncludes) {
    Shapes::Circle circle(Point(0.0, 0.0), 2.0);
    EXPECT_EQ(circle.supportVector(Vector(0.0, 5.0)), Point(0.0, 2.0));
    EXPECT_TRUE(circle.includes(Point(1.0, 1.0)));
    EXPECT_TRUE(circle.includes(Point(2.0, 0.0)));
    EXPECT_FALSE(circle.includes(Point(1.5, 1.5)));
}

TEST(ShapeTest, DispatchesToActiveAlternative) {
    Shapes::Shape circle = Shapes::Circle(Point(0.0, 0.0), 1.0);
    Shapes::Shape polygon = square(0.0, 0.0, 1.0);

    EXPECT_EQ(circle.type(), Shapes::ShapeType::Circle);
    EXPECT_EQ(polygon.type(), Shapes::ShapeType::Polygon);
    EXPECT_NE(circle.asCircle(), nullptr);
    EXPECT_EQ(circle.asPolygon(), nullptr);
    EXPECT_NE(polygon.asPolygon(), nullptr);

    EXPECT_TRUE(polygon.includes(Point(0.5, 0.5)));
    EXPECT_FALSE(circle.includes(Point(1.0, 1.0)));
}

TEST(ShapeTest, PointReferenceFollowsPolygon) {
    Shapes::Shape shape = square(0.0, 0.0, 1.0);
    Point const anchor(0.75, 0.25);
    auto ref = shape.createPointReference(anchor);
    EXPECT_EQ(shape.resolvePointReference(ref), anchor);

    shape.translate(Vector(1.0, 1.0));
    EXPECT_EQ(shape.resolvePointReference(ref), Point(1.75, 1.25));

    shape.rotate(Pi);
    // half a turn about the centroid (1.5, 1.5)
    EXPECT_EQ(shape.resolvePointReference(ref), Point(1.25, 1.75));
}

TEST(ShapeTest, PointReferenceFollowsCircle) {
    Shapes::Shape shape = Shapes::Circle(Point(0.0, 0.0), 1.0);
    auto ref = shape.createPointReference(Point(0.0, 0.5));
    EXPECT_EQ(shape.resolvePointReference(ref), Point(0.0, 0.5));

    shape.rotate(Pi / 2);
    EXPECT_EQ(shape.resolvePointReference(ref), Point(-0.5, 0.0));
}

TEST(ShapeTest, StaticBodyIsInfinitelyHeavy) {
    Shapes::Shape shape = square(0.0, 0.0, 1.0);
    EXPECT_FALSE(shape.collisionData().isStatic());

    shape.collisionData().makeStatic();
    EXPECT_TRUE(shape.collisionData().isStatic());
    EXPECT_TRUE(std::isinf(shape.collisionData().mass));
    EXPECT_TRUE(std::isinf(shape.collisionData().inertia));
}

TEST(ShapeTest, GravityFollowsAmbientAngle) {
    EngineConfig config;
    Shapes::Shape upright = Shapes::Circle(Point(0.0, 0.0), 0.1);
    Shapes::Shape tilted = Shapes::Circle(Point(0.0, 0.0), 0.1);

    upright.updatePosition(1000, 0.0, config);
    tilted.updatePosition(1000, -Pi / 2, config);

    Vector const v1 = upright.collisionData().velocity;
    Vector const v2 = tilted.collisionData().velocity;
    EXPECT_NEAR(v1.x, 0.0, EPSILON);
    EXPECT_LT(v1.y, 0.0);
    // "down" turned a quarter clockwise points along -x
    EXPECT_NEAR(v2.x, v1.y, EPSILON);
    EXPECT_NEAR(v2.y, 0.0, EPSILON);
}
