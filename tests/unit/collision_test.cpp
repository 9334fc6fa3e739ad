#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "tiltbox/algo/collision.hpp"
#include "tiltbox/algo/gjk.hpp"
#include "tiltbox/core/constants.hpp"
#include "tiltbox/core/debug.hpp"
#include "tiltbox/shapes/shape.hpp"

using Collision::collision;

namespace {

Shapes::Shape box(double x0, double y0, double x1, double y1) {
    return Shapes::Polygon({Point(x0, y0), Point(x1, y0), Point(x1, y1), Point(x0, y1)});
}

} // namespace

TEST(CollisionTest, OverlappingSquares) {
    Shapes::Shape a = box(0.0, 0.0, 2.0, 2.0);
    Shapes::Shape b = box(1.0, 1.0, 3.0, 3.0);

    auto result = collision(a, b);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->point.length(), 1.0, 1e-6);
}

TEST(CollisionTest, TranslatingByResultSeparates) {
    Shapes::Shape a = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape b = box(0.7, 0.2, 1.7, 1.2);

    auto result = collision(a, b);
    ASSERT_TRUE(result.has_value());
    // least overlap is along x
    EXPECT_NEAR(std::abs(result->point.x), 0.3, 1e-6);
    EXPECT_NEAR(result->point.y, 0.0, 1e-6);

    a.translate(-result->point * 1.01);
    EXPECT_FALSE(collision(a, b).has_value());
}

TEST(CollisionTest, CirclesWithGap) {
    Shapes::Shape a = Shapes::Circle(Point(0.0, 0.0), 0.1);
    Shapes::Shape b = Shapes::Circle(Point(0.0, 0.3), 0.1);
    EXPECT_FALSE(collision(a, b).has_value());
}

TEST(CollisionTest, OverlappingCircles) {
    Shapes::Shape a = Shapes::Circle(Point(0.0, 0.0), 0.1);
    Shapes::Shape b = Shapes::Circle(Point(0.0, 0.15), 0.1);

    auto result = collision(a, b);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->point.length(), 0.05, 1e-3);
}

TEST(CollisionTest, SeparatedShapes) {
    Shapes::Shape square = box(0.0, 0.0, 1.0, 1.0);
    Shapes::Shape circle = Shapes::Circle(Point(2.0, 0.5), 0.5);
    EXPECT_FALSE(collision(square, circle).has_value());
    EXPECT_FALSE(collision(circle, square).has_value());
}

TEST(CollisionTest, OffAxisCirclesWithGap) {
    Shapes::Shape a = Shapes::Circle(Point(0.0, 0.0), 0.1);
    Shapes::Shape beside = Shapes::Circle(Point(0.3, 0.0), 0.1);
    Shapes::Shape diagonal = Shapes::Circle(Point(0.3, 0.3), 0.1);

    EXPECT_FALSE(collision(a, beside).has_value());
    EXPECT_FALSE(collision(beside, a).has_value());
    EXPECT_FALSE(collision(a, diagonal).has_value());
    EXPECT_FALSE(collision(diagonal, a).has_value());
}

TEST(CollisionTest, BallBesideSmallSquare) {
    Shapes::Shape square = box(-0.05, -0.05, 0.05, 0.05);
    Shapes::Shape ball = Shapes::Circle(Point(0.106, -0.195), 0.07);
    EXPECT_FALSE(collision(ball, square).has_value());
    EXPECT_FALSE(collision(square, ball).has_value());
}

TEST(CollisionTest, SeparatedCirclesAllAround) {
    Shapes::Shape a = Shapes::Circle(Point(0.0, 0.0), 0.1);
    for (int i = 0; i < 24; ++i) {
        double const angle = 0.1 + i * (2.0 * SimulatorConstants::Pi / 24.0);
        Shapes::Shape b = Shapes::Circle(Point(0.25 * std::cos(angle), 0.25 * std::sin(angle)), 0.1);
        EXPECT_FALSE(collision(a, b).has_value()) << "angle " << angle;
    }
}

TEST(CollisionTest, OverlappingCirclesSeparateAlongResult) {
    for (int i = 0; i < 24; ++i) {
        double const angle = 0.1 + i * (2.0 * SimulatorConstants::Pi / 24.0);
        double const distance = 0.05 + 0.005 * i;
        Shapes::Shape a = Shapes::Circle(Point(0.0, 0.0), 0.1);
        Shapes::Shape b = Shapes::Circle(Point(distance * std::cos(angle), distance * std::sin(angle)), 0.1);

        auto result = collision(a, b);
        ASSERT_TRUE(result.has_value()) << "angle " << angle;
        a.translate(-result->point * 1.01);
        EXPECT_FALSE(collision(a, b).has_value()) << "angle " << angle;
    }
}

TEST(CollisionTest, NearTouchingShapesStayQuiet) {
    if (TILTBOX_ENABLE_DEBUG) {
        GTEST_SKIP() << "debug output enabled";
    }
    testing::internal::CaptureStderr();
    Shapes::Shape square = box(0.0, 0.0, 1.0, 1.0);
    for (int i = 0; i < 50; ++i) {
        double const offset = 1e-9 * static_cast<double>(i - 25);
        Shapes::Shape ball = Shapes::Circle(Point(1.1 + offset, 0.5 + 0.01 * i), 0.1);
        static_cast<void>(collision(ball, square));
    }
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(CollisionTest, CircleRestingInPolygon) {
    Shapes::Shape floor = box(-1.0, -1.0, 1.0, 0.0);
    Shapes::Shape ball = Shapes::Circle(Point(0.0, 0.05), 0.07);

    auto result = collision(ball, floor);
    ASSERT_TRUE(result.has_value());
    // pushing the ball up by 0.02 clears the floor
    EXPECT_NEAR(result->point.length(), 0.02, 1e-3);
    EXPECT_LT(result->point.y, 0.0);
}

TEST(CollisionTest, NonFiniteShapesNeverCollide) {
    Shapes::Shape a = Shapes::Circle(Point(std::nan(""), 0.0), 0.1);
    Shapes::Shape b = Shapes::Circle(Point(0.0, 0.0), 0.1);
    EXPECT_FALSE(collision(a, b).has_value());
}

TEST(GjkTest, EnclosingSimplexEdgesSurroundOrigin) {
    Shapes::Shape a = box(0.0, 0.0, 2.0, 2.0);
    Shapes::Shape b = box(1.0, 1.0, 3.0, 3.0);
    Collision::MinkowskiDifference difference(a, b);

    auto edges = Collision::enclosingSimplex(Vector(0.0, 1.0), difference);
    ASSERT_TRUE(edges.has_value());
    ASSERT_GE(edges->size(), 3u);
    while (!edges->empty()) {
        EXPECT_GE(edges->top().distanceToOrigin, 0.0);
        EXPECT_TRUE(std::isfinite(edges->top().distanceToOrigin));
        edges->pop();
    }
}
