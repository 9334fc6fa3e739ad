#include <gtest/gtest.h>
#include <cmath>

#include "tiltbox/core/constants.hpp"
#include "tiltbox/math/vector_math.hpp"

using SimulatorConstants::Pi;

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);  // Parameterized constructor
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector left_result = 2.0 * v;
    EXPECT_EQ(left_result, mult_result);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    Vector neg = -v;
    EXPECT_DOUBLE_EQ(neg.x, -2.0);
    EXPECT_DOUBLE_EQ(neg.y, -3.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_NEAR(v.unit().length(), 1.0, EPSILON);

    // Cross product
    EXPECT_DOUBLE_EQ(Vector(1.0, 0.0).cross(Vector(0.0, 1.0)), 1.0);

    // Perpendicular is a clockwise quarter turn
    Vector perp = Vector(1.0, 0.0).perpendicular();
    EXPECT_DOUBLE_EQ(perp.x, 0.0);
    EXPECT_DOUBLE_EQ(perp.y, -1.0);

    Vector rotated = Vector(1.0, 0.0).rotateByAngle(Pi / 2);
    EXPECT_NEAR(rotated.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated.y, 1.0, EPSILON);

    // "to" is the displacement between two points
    Vector between = Point(1.0, 1.0).to(Point(4.0, 5.0));
    EXPECT_DOUBLE_EQ(between.x, 3.0);
    EXPECT_DOUBLE_EQ(between.y, 4.0);
}

TEST(VectorMathTest, SignedAngle) {
    Vector x(1.0, 0.0);
    Vector y(0.0, 1.0);
    EXPECT_NEAR(x.angleTo(y), Pi / 2, EPSILON);
    EXPECT_NEAR(y.angleTo(x), -Pi / 2, EPSILON);
    EXPECT_NEAR(x.angleTo(x), 0.0, EPSILON);
}

TEST(VectorMathTest, TripleProductPointsTowardsOrigin) {
    // Line through (-1, 1) and (1, 1): the origin lies below it
    Vector a(1.0, 1.0);
    Vector b(-1.0, 1.0);
    Vector towardsOrigin = a.tripleProduct(b);
    EXPECT_NEAR(towardsOrigin.x, 0.0, EPSILON);
    EXPECT_LT(towardsOrigin.y, 0.0);
    EXPECT_NEAR(towardsOrigin.dotProduct(a - b), 0.0, EPSILON);
}

TEST(VectorMathTest, EpsilonComparisons) {
    EXPECT_TRUE(nearlyEqual(1.0, 1.0 + EPSILON / 2));
    EXPECT_FALSE(nearlyEqual(1.0, 1.0 + EPSILON * 2));

    EXPECT_EQ(Vector(1.0, 2.0), Vector(1.0 + EPSILON / 2, 2.0));
    EXPECT_NE(Vector(1.0, 2.0), Vector(1.1, 2.0));
}

TEST(VectorMathTest, Finiteness) {
    EXPECT_TRUE(Vector(1.0, -2.0).isFinite());
    EXPECT_FALSE(Vector(std::nan(""), 0.0).isFinite());
    EXPECT_FALSE(Vector(0.0, INFINITY).isFinite());
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}
