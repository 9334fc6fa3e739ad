#include <gtest/gtest.h>

#include <cmath>

#include "tiltbox/algo/collision.hpp"
#include "tiltbox/core/engine_config.hpp"
#include "tiltbox/shapes/shape.hpp"
#include "tiltbox/systems/collision_response.hpp"

using RigidBodyCollision::CollisionType;
using RigidBodyCollision::collide;

class CollisionResponseTest : public ::testing::Test {
protected:
    EngineConfig config;

    static Shapes::Shape box(double x0, double y0, double x1, double y1) {
        return Shapes::Polygon({Point(x0, y0), Point(x1, y0), Point(x1, y1), Point(x0, y1)});
    }

    static Shapes::Shape staticFloor() {
        Shapes::Shape floor = box(-2.0, -1.0, 2.0, 0.0);
        floor.collisionData().makeStatic();
        return floor;
    }
};

TEST_F(CollisionResponseTest, StaticBodyIsNotMoved) {
    Shapes::Shape falling = box(-0.5, -0.1, 0.5, 0.9);
    Shapes::Shape floor = staticFloor();
    falling.collisionData().velocity = Vector(0.3, -1.0);

    EXPECT_NE(collide(falling, floor, 1000, config), CollisionType::None);

    auto const& data = floor.collisionData();
    EXPECT_TRUE(std::isinf(data.mass));
    EXPECT_TRUE(std::isinf(data.inertia));
    EXPECT_DOUBLE_EQ(data.velocity.x, 0.0);
    EXPECT_DOUBLE_EQ(data.velocity.y, 0.0);
    EXPECT_DOUBLE_EQ(data.angularVelocity, 0.0);
    EXPECT_EQ(data.centroid, Point(0.0, -0.5));
}

TEST_F(CollisionResponseTest, ApproachingBodyBouncesAndIsPushedOut) {
    Shapes::Shape falling = box(-0.5, -0.1, 0.5, 0.9);
    Shapes::Shape floor = staticFloor();
    falling.collisionData().velocity = Vector(0.0, -1.0);

    collide(falling, floor, 1000, config);

    EXPECT_GT(falling.collisionData().velocity.y, -1.0);
    EXPECT_GT(falling.collisionData().centroid.y, 0.4);
}

TEST_F(CollisionResponseTest, SeparatingBodiesGetNoImpulse) {
    Shapes::Shape rising = box(-0.5, -0.1, 0.5, 0.9);
    Shapes::Shape floor = staticFloor();
    rising.collisionData().velocity = Vector(0.0, 1.0);

    auto contact = Collision::collision(rising, floor);
    ASSERT_TRUE(contact.has_value());
    double impulse = RigidBodyCollision::resolveCollision(rising, floor, *contact, 1000, config);

    EXPECT_DOUBLE_EQ(impulse, 0.0);
    EXPECT_DOUBLE_EQ(rising.collisionData().velocity.y, 1.0);
}

TEST_F(CollisionResponseTest, FastImpactIsStrong) {
    Shapes::Shape falling = box(-0.5, -0.1, 0.5, 0.9);
    Shapes::Shape floor = staticFloor();
    falling.collisionData().velocity = Vector(0.0, -10.0);

    EXPECT_EQ(collide(falling, floor, 1000, config), CollisionType::Strong);
}

TEST_F(CollisionResponseTest, NoContactNoResponse) {
    Shapes::Shape hovering = box(-0.5, 0.5, 0.5, 1.5);
    Shapes::Shape floor = staticFloor();
    hovering.collisionData().velocity = Vector(0.0, -1.0);

    EXPECT_EQ(collide(hovering, floor, 1000, config), CollisionType::None);
    EXPECT_DOUBLE_EQ(hovering.collisionData().velocity.y, -1.0);
}

TEST_F(CollisionResponseTest, EqualBodiesShareTheCorrection) {
    Shapes::Shape left = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape right = box(0.9, 0.0, 1.9, 1.0);

    collide(left, right, 1000, config);

    double const leftShift = 0.5 - left.collisionData().centroid.x;
    double const rightShift = right.collisionData().centroid.x - 1.4;
    EXPECT_GT(leftShift, 0.0);
    EXPECT_NEAR(leftShift, rightShift, 1e-9);
}
