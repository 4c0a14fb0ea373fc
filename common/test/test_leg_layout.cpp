/*! @file test_leg_layout.cpp
 *  @brief Test leg and joint indexing
 */

#include "Dynamics/LegLayout.h"
#include "gtest/gtest.h"

TEST(LegLayout, expandLegMask) {
  Vec4<double> mask(1, 0, 1, 0);
  Vec12<double> expected;
  expected << 1, 1, 1, 0, 0, 0, 1, 1, 1, 0, 0, 0;
  EXPECT_EQ(expected, expandLegMask(mask));
}

TEST(LegLayout, expandFractionalMask) {
  Vec4<double> mask(0.25, 0.5, 0.75, 1);
  Vec12<double> expanded = expandLegMask(mask);
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    for (int joint = 0; joint < JOINTS_PER_LEG; joint++) {
      EXPECT_DOUBLE_EQ(mask[leg], expanded[jointIndex(leg, joint)]);
    }
  }
}

TEST(LegLayout, indexing) {
  EXPECT_EQ(0, jointIndex(FRONT_RIGHT, 0));
  EXPECT_EQ(5, jointIndex(FRONT_LEFT, 2));
  EXPECT_EQ(9, jointIndex(BACK_LEFT, 0));

  Vec12<double> v;
  for (int i = 0; i < NUM_JOINTS; i++) v[i] = i;
  EXPECT_EQ(Vec3<double>(6, 7, 8), legSegment(v, BACK_RIGHT));
}
