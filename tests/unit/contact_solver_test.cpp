#include <gtest/gtest.h>
#include <stdexcept>
#include "rigid2d/collision/contact_forces.hpp"
#include "rigid2d/collision/contact_solver.hpp"

using namespace RigidBodyCollision;

TEST(ContactSolverTest, PushesOnlyWhereNeeded) {
    Matrix A = {{2.0, 0.5}, {0.5, 1.0}};
    // first row accelerates into contact, second is separating
    std::vector<double> b = {-4.0, 1.0};
    std::vector<bool> joint = {false, false};
    std::vector<double> x;

    LcpResult r = solveLCP_PGS(A, b, joint, x);
    EXPECT_TRUE(r.converged);
    ASSERT_EQ(x.size(), 2u);
    EXPECT_NEAR(x[0], 2.0, 1e-9);
    EXPECT_NEAR(x[1], 0.0, 1e-12);

    auto accel = residual(A, x, b);
    EXPECT_NEAR(accel[0], 0.0, 1e-9);
    EXPECT_NEAR(accel[1], 2.0, 1e-9);
    EXPECT_TRUE(checkForceAccel(1e-8, x, accel, joint));
}

TEST(ContactSolverTest, JointRowsMayPull) {
    Matrix A = {{1.0}};
    std::vector<double> b = {3.0};
    std::vector<double> x;

    solveLCP_PGS(A, b, {true}, x);
    EXPECT_NEAR(x[0], -3.0, 1e-12);

    solveLCP_PGS(A, b, {false}, x);
    EXPECT_NEAR(x[0], 0.0, 1e-12);
}

TEST(ContactSolverTest, SingularRowsStayZero) {
    Matrix A = {{0.0, 0.0}, {0.0, 1.0}};
    std::vector<double> b = {-1.0, -1.0};
    std::vector<double> x;
    LcpResult r = solveLCP_PGS(A, b, {false, false}, x);
    EXPECT_DOUBLE_EQ(x[0], 0.0);
    EXPECT_NEAR(x[1], 1.0, 1e-12);
    EXPECT_NEAR(r.maxResidual, 0.0, 1e-12);
}

TEST(ContactSolverTest, CheckForceAccelFlagsViolations) {
    std::vector<bool> joint = {false, true};
    EXPECT_FALSE(checkForceAccel(1e-6, {-1.0, 0.0}, {0.0, 0.0}, joint));
    EXPECT_FALSE(checkForceAccel(1e-6, {0.0, 0.0}, {-1.0, 0.0}, joint));
    EXPECT_FALSE(checkForceAccel(1e-6, {1.0, 0.0}, {1.0, 0.0}, joint));
    EXPECT_FALSE(checkForceAccel(1e-6, {0.0, 5.0}, {0.0, 0.1}, joint));
    EXPECT_TRUE(checkForceAccel(1e-6, {0.0, -5.0}, {2.0, 0.0}, joint));
}

TEST(ContactSolverTest, RejectsMismatchedSizes) {
    Matrix A = {{1.0, 0.0}, {0.0, 1.0}};
    std::vector<double> x;
    EXPECT_THROW(solveLCP_PGS(A, {1.0}, {false}, x), std::invalid_argument);
    Matrix ragged = {{1.0, 0.0}, {1.0}};
    EXPECT_THROW(solveLCP_PGS(ragged, {1.0, 1.0}, {false, false}, x), std::invalid_argument);
}

TEST(ContactForcesTest, ExtraAccelerationPolicies) {
    double const h = 0.025;
    CollisionRecord contact;
    contact.distance = 0.007;
    contact.targetGap = 0.005;
    contact.normalVelocity = -0.1;

    EXPECT_DOUBLE_EQ(extraAcceleration(contact, ExtraAccel::NONE, h), 0.0);
    EXPECT_NEAR(extraAcceleration(contact, ExtraAccel::VELOCITY, h), -4.0, 1e-12);
    EXPECT_NEAR(extraAcceleration(contact, ExtraAccel::VELOCITY_JOINTS, h), -4.0, 1e-12);
    // (2 v h + x) / h^2 with x = 0.002 above half the gap
    EXPECT_NEAR(extraAcceleration(contact, ExtraAccel::VELOCITY_AND_DISTANCE, h), -4.8, 1e-9);
    EXPECT_NEAR(extraAcceleration(contact, ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS, h), -4.8, 1e-9);

    CollisionRecord joint;
    joint.kind = CollisionKind::Joint;
    joint.distance = 0.001;
    joint.targetGap = 0.0;
    joint.normalVelocity = 0.05;

    EXPECT_DOUBLE_EQ(extraAcceleration(joint, ExtraAccel::NONE, h), 0.0);
    EXPECT_DOUBLE_EQ(extraAcceleration(joint, ExtraAccel::VELOCITY, h), 0.0);
    EXPECT_DOUBLE_EQ(extraAcceleration(joint, ExtraAccel::VELOCITY_AND_DISTANCE, h), 0.0);
    EXPECT_NEAR(extraAcceleration(joint, ExtraAccel::VELOCITY_JOINTS, h), 2.0, 1e-12);
    EXPECT_NEAR(extraAcceleration(joint, ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS, h), 5.6, 1e-9);
}

TEST(ContactForcesTest, ExtraAccelerationByName) {
    EXPECT_EQ(extraAccelFromName("velocity_and_distance_joints"),
              ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS);
    EXPECT_EQ(extraAccelName(ExtraAccel::VELOCITY), "VELOCITY");
    EXPECT_THROW(extraAccelFromName("position"), std::invalid_argument);
}
