#include <gtest/gtest.h>
#include <cmath>
#include "snooker/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);

    Vector v3 = Vector::fromAngle(std::acos(-1.0) / 2.0, 2.0);
    EXPECT_NEAR(v3.x, 0.0, 1e-12);
    EXPECT_NEAR(v3.y, 2.0, 1e-12);
}

TEST(VectorMathTest, VectorArithmetic) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector sum = v1 + v2;
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 6.0);

    Vector diff = v2 - v1;
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 2.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 *= 0.5;
    EXPECT_DOUBLE_EQ(v1.x, 2.0);
    EXPECT_DOUBLE_EQ(v1.y, 3.0);

    Vector div = v2 / 0.5;
    EXPECT_DOUBLE_EQ(div.x, 6.0);
    EXPECT_DOUBLE_EQ(div.y, 8.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.dotProduct(Vector(1.0, 1.0)), 7.0);

    Vector n = v.normalized();
    EXPECT_NEAR(n.length(), 1.0, 1e-12);

    Vector scaled = v.withLength(10.0);
    EXPECT_NEAR(scaled.x, 6.0, 1e-12);
    EXPECT_NEAR(scaled.y, 8.0, 1e-12);

    // Zero vector has no direction
    Vector zero;
    EXPECT_DOUBLE_EQ(zero.normalized().length(), 0.0);
    EXPECT_DOUBLE_EQ(zero.withLength(3.0).length(), 0.0);
}

TEST(VectorMathTest, ClampedLength) {
    Vector fast(30.0, 40.0);
    Vector capped = fast.clampedLength(10.0);
    EXPECT_NEAR(capped.length(), 10.0, 1e-12);
    EXPECT_NEAR(capped.x, 6.0, 1e-12);

    Vector slow(1.0, 1.0);
    Vector same = slow.clampedLength(10.0);
    EXPECT_DOUBLE_EQ(same.x, 1.0);
    EXPECT_DOUBLE_EQ(same.y, 1.0);
}

TEST(VectorMathTest, ReflectAboutNormal) {
    // Hitting a floor (normal pointing up in screen space)
    Vector incoming(3.0, 4.0);
    Vector reflected = incoming.reflect(Vector(0.0, -1.0));
    EXPECT_DOUBLE_EQ(reflected.x, 3.0);
    EXPECT_DOUBLE_EQ(reflected.y, -4.0);

    // Speed is preserved by reflection alone
    EXPECT_NEAR(reflected.length(), incoming.length(), 1e-12);
}

TEST(VectorMathTest, ReflectTwiceRestoresVector) {
    Vector const n = Vector(1.0, 2.0).normalized();
    Vector const original(-2.5, 7.25);

    Vector const once = original.reflect(n);
    Vector const twice = once.reflect(-n);

    EXPECT_NEAR(twice.x, original.x, 1e-12);
    EXPECT_NEAR(twice.y, original.y, 1e-12);
}

TEST(VectorMathTest, PositionOperations) {
    Position p(1.0, 1.0);
    Position q(4.0, 5.0);
    EXPECT_DOUBLE_EQ(p.dist(q), 5.0);

    Vector offset = q.offsetFrom(p);
    EXPECT_DOUBLE_EQ(offset.x, 3.0);
    EXPECT_DOUBLE_EQ(offset.y, 4.0);

    Position moved = p + Vector(2.0, -1.0);
    EXPECT_DOUBLE_EQ(moved.x, 3.0);
    EXPECT_DOUBLE_EQ(moved.y, 0.0);
}

TEST(VectorMathTest, Remap) {
    EXPECT_DOUBLE_EQ(remap(5.0, 0.0, 10.0, 0.0, 100.0), 50.0);
    EXPECT_DOUBLE_EQ(remap(0.5, 0.0, 1.0, 2.0, 12.0), 7.0);
    // Decreasing output range
    EXPECT_DOUBLE_EQ(remap(60.0, 5.0, 60.0, 6.0, 1.5), 1.5);
    // Degenerate input range
    EXPECT_DOUBLE_EQ(remap(3.0, 1.0, 1.0, 4.0, 9.0), 4.0);
    EXPECT_TRUE(nearlyEqual(0.1 + 0.2, 0.3));
}
