/*! @file test_leg_kinematics.cpp
 *  @brief Test leg Jacobian, foot position and whole robot kinematics
 */

#include <cmath>

#include "Dynamics/LegKinematics.h"
#include "Dynamics/Woofer.h"
#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"
#include "WooferTestHelpers.h"
#include "gtest/gtest.h"

static Woofer<double> testWoofer() {
  RobotControlParameters params;
  loadTestRobotParameters(params);
  return buildWoofer<double>(params);
}

TEST(Woofer, hipLocationsAndSides) {
  Woofer<double> woofer = testWoofer();
  EXPECT_DOUBLE_EQ(8.0, woofer._bodyMass);
  EXPECT_DOUBLE_EQ(8.0 * 9.81 / 4, woofer.standingFootForce());

  EXPECT_TRUE(almostEqual(woofer.getHipLocation(FRONT_RIGHT),
                          Vec3<double>(0.2, -0.1, 0), .0001));
  EXPECT_TRUE(almostEqual(woofer.getHipLocation(FRONT_LEFT),
                          Vec3<double>(0.2, 0.1, 0), .0001));
  EXPECT_TRUE(almostEqual(woofer.getHipLocation(BACK_RIGHT),
                          Vec3<double>(-0.2, -0.1, 0), .0001));
  EXPECT_TRUE(almostEqual(woofer.getHipLocation(BACK_LEFT),
                          Vec3<double>(-0.2, 0.1, 0), .0001));
}

TEST(Woofer, rejectsNonPositiveMass) {
  RobotControlParameters params;
  loadTestRobotParameters(params);
  params.mass = 0;
  EXPECT_THROW(buildWoofer<double>(params), ConfigurationError);
}

TEST(LegKinematics, straightLeg) {
  Woofer<double> woofer = testWoofer();
  Vec3<double> q = Vec3<double>::Zero();
  Vec3<double> p;
  computeLegJacobianAndPosition(woofer, q, (Mat3<double>*)nullptr, &p,
                                FRONT_RIGHT);
  EXPECT_TRUE(almostEqual(p, Vec3<double>(0, -0.05, -0.32), .0001));

  computeLegJacobianAndPosition(woofer, q, (Mat3<double>*)nullptr, &p,
                                BACK_LEFT);
  EXPECT_TRUE(almostEqual(p, Vec3<double>(0, 0.05, -0.32), .0001));
}

TEST(LegKinematics, jacobianMatchesFiniteDifference) {
  Woofer<double> woofer = testWoofer();
  Vec3<double> q(0.1, -0.7, 1.3);
  double h = 1e-6;

  for (int leg = 0; leg < NUM_LEGS; leg++) {
    Mat3<double> J;
    Vec3<double> p;
    computeLegJacobianAndPosition(woofer, q, &J, &p, leg);

    for (int joint = 0; joint < 3; joint++) {
      Vec3<double> qh = q;
      qh[joint] += h;
      Vec3<double> ph;
      computeLegJacobianAndPosition(woofer, qh, (Mat3<double>*)nullptr, &ph,
                                    leg);
      Vec3<double> column = (ph - p) / h;
      Vec3<double> expected = J.col(joint);
      EXPECT_TRUE(almostEqual(column, expected, 1e-4));
    }
  }
}

TEST(LegKinematics, forwardKinematicsRotatesIntoWorld) {
  Woofer<double> woofer = testWoofer();
  WooferLegKinematics<double> kinematics(woofer);
  Vec12<double> q = Vec12<double>::Zero();

  Vec12<double> level = kinematics.forward(q, Quat<double>(1, 0, 0, 0));
  EXPECT_TRUE(almostEqual(legSegment(level, FRONT_RIGHT),
                          Vec3<double>(0.2, -0.15, -0.32), .0001));
  EXPECT_TRUE(almostEqual(legSegment(level, BACK_LEFT),
                          Vec3<double>(-0.2, 0.15, -0.32), .0001));

  double s = std::sqrt(2.) / 2.;
  Vec12<double> turned = kinematics.forward(q, Quat<double>(s, 0, 0, s));
  EXPECT_TRUE(almostEqual(legSegment(turned, FRONT_RIGHT),
                          Vec3<double>(0.15, 0.2, -0.32), .0001));
}

TEST(LegKinematics, stanceTorquePushesAgainstGround) {
  Woofer<double> woofer = testWoofer();
  Vec3<double> q(0, -0.8, 1.6);
  Mat3<double> J;
  computeLegJacobianAndPosition(woofer, q, &J, (Vec3<double>*)nullptr,
                                FRONT_LEFT);

  Vec3<double> f(1, -2, 20);
  Vec3<double> tau =
      footForceToJointTorque(J, RotMat<double>::Identity().eval(), f);
  Vec3<double> expected = J.transpose() * (-f);
  EXPECT_TRUE(almostEqual(tau, expected, 1e-9));
}
