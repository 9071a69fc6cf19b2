#include <gtest/gtest.h>
#include <cmath>
#include "rigid2d/math/vector_math.hpp"
#include "rigid2d/geometry/pose.hpp"

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

    Vector neg = -v2;
    EXPECT_DOUBLE_EQ(neg.x, -3.0);
    EXPECT_DOUBLE_EQ(neg.y, -4.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);
    EXPECT_DOUBLE_EQ(v.distanceTo(Vector(0.0, 0.0)), 5.0);

    EXPECT_DOUBLE_EQ(v.normalized().length(), 1.0);
    // zero vector normalizes to the x axis
    Vector z = Vector().normalized();
    EXPECT_DOUBLE_EQ(z.x, 1.0);
    EXPECT_DOUBLE_EQ(z.y, 0.0);

    EXPECT_DOUBLE_EQ(Vector(1.0, 0.0).cross(Vector(0.0, 1.0)), 1.0);
    EXPECT_DOUBLE_EQ(Vector(0.0, 1.0).cross(Vector(1.0, 0.0)), -1.0);

    Vector perp = Vector(1.0, 0.0).perp();
    EXPECT_DOUBLE_EQ(perp.x, 0.0);
    EXPECT_DOUBLE_EQ(perp.y, 1.0);

    Vector rotated = Vector(1.0, 0.0).rotateByAngle(M_PI / 2);
    EXPECT_NEAR(rotated.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated.y, 1.0, EPSILON);

    EXPECT_TRUE(v.isFinite());
    EXPECT_FALSE(Vector(std::nan(""), 0.0).isFinite());
}

TEST(VectorMathTest, AngularCross) {
    // spinning counter-clockwise, a point on +x moves in +y
    Vector v = angularCross(2.0, Vector(1.0, 0.0));
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    v = angularCross(2.0, Vector(0.0, 1.0));
    EXPECT_DOUBLE_EQ(v.x, -2.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position p3 = p1 + Vector(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    Position p4 = p2 - Vector(1.0, 1.0);
    EXPECT_DOUBLE_EQ(p4.x, 2.0);
    EXPECT_DOUBLE_EQ(p4.y, 3.0);
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2 = static_cast<Position>(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}

TEST(VectorMathTest, PoseRoundTripsWithOffsetCenterOfMass) {
    Geometry::Pose pose;
    pose.position = Vector(1.0, 2.0);
    pose.angle = M_PI / 2;
    pose.cmBody = Vector(0.0, 0.2);

    // the center of mass maps onto the position
    Vector cm = pose.bodyToWorld(pose.cmBody);
    EXPECT_NEAR(cm.x, 1.0, EPSILON);
    EXPECT_NEAR(cm.y, 2.0, EPSILON);

    Vector w = pose.bodyToWorld(Vector(1.0, 0.2));
    EXPECT_NEAR(w.x, 1.0, EPSILON);
    EXPECT_NEAR(w.y, 3.0, EPSILON);

    Vector b = pose.worldToBody(w);
    EXPECT_NEAR(b.x, 1.0, EPSILON);
    EXPECT_NEAR(b.y, 0.2, EPSILON);
}
