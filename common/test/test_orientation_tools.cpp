/*! @file test_orientation_tools.cpp
 *  @brief Test orientation conversions
 */

#include <cmath>

#include "Math/orientation_tools.h"
#include "Utilities/utilities.h"
#include "gtest/gtest.h"

TEST(Orientation, identityQuaternion) {
  Quat<double> q(1, 0, 0, 0);
  Mat3<double> R = ori::quaternionToRotationMatrix(q);
  Mat3<double> I = Mat3<double>::Identity();
  EXPECT_TRUE(almostEqual(R, I, .0001));
  EXPECT_TRUE(almostEqual(ori::quatToRPY(q), Vec3<double>::Zero().eval(), .0001));
}

TEST(Orientation, yawRotationIsWorldToBody) {
  double s = std::sqrt(2.) / 2.;
  Quat<double> q(s, 0, 0, s);  // 90 degrees about z
  Mat3<double> rBody = ori::quaternionToRotationMatrix(q);

  // the world x axis points to the body's right
  Vec3<double> xInBody = rBody * Vec3<double>(1, 0, 0);
  EXPECT_TRUE(almostEqual(xInBody, Vec3<double>(0, -1, 0), .0001));

  Vec3<double> rpy = ori::quatToRPY(q);
  EXPECT_NEAR(M_PI / 2, rpy[2], 1e-6);
  EXPECT_NEAR(0, rpy[0], 1e-6);
  EXPECT_NEAR(0, rpy[1], 1e-6);
}

TEST(Orientation, rpyToQuat) {
  Vec3<double> rpy(0.1, -0.2, 0.3);
  Quat<double> q = ori::rpyToQuat(rpy);
  EXPECT_NEAR(1, q.norm(), 1e-9);
  EXPECT_TRUE(almostEqual(rpy, ori::quatToRPY(q), .0001));
}

TEST(Orientation, skewMatrixIsCrossProduct) {
  Vec3<double> a(1, 2, 3);
  Vec3<double> b(-4, 0.5, 2);
  Vec3<double> cross = a.cross(b);
  Vec3<double> viaSkew = ori::vectorToSkewMat(a) * b;
  EXPECT_TRUE(almostEqual(cross, viaSkew, .0001));
}

TEST(Orientation, coordinateRotation) {
  Mat3<double> R = ori::coordinateRotation(CoordinateAxis::Z, M_PI / 2);
  Vec3<double> v = R * Vec3<double>(1, 0, 0);
  EXPECT_TRUE(almostEqual(v, Vec3<double>(0, -1, 0), .0001));
}
