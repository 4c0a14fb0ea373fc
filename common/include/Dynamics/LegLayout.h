/*! @file LegLayout.h
 *  @brief Leg enumeration and per-leg / per-joint indexing
 *
 *  This is the only place the leg order and the number of joints per leg are
 *  defined.  Every per-leg array has NUM_LEGS entries, every per-joint array
 *  has NUM_JOINTS entries, and joint c of leg j is stored at 3 * j + c.
 */

#ifndef WOOFER_LEGLAYOUT_H
#define WOOFER_LEGLAYOUT_H

#include "cppTypes.h"

constexpr int NUM_LEGS = 4;
constexpr int JOINTS_PER_LEG = 3;
constexpr int NUM_JOINTS = NUM_LEGS * JOINTS_PER_LEG;

static_assert(NUM_JOINTS == 12, "Woofer has 12 actuated joints");

/*!
 * Leg order: front right, front left, back right, back left
 */
enum LegIndex { FRONT_RIGHT = 0, FRONT_LEFT = 1, BACK_RIGHT = 2, BACK_LEFT = 3 };

/*!
 * Index of joint (0 = ab/ad, 1 = hip, 2 = knee) of a leg in a 12-vector
 */
inline int jointIndex(int leg, int joint) { return JOINTS_PER_LEG * leg + joint; }

/*!
 * Expand a per-leg mask into a per-joint mask by repeating each leg's value
 * for each of its joints.
 */
template <typename T>
Vec12<T> expandLegMask(const Vec4<T>& legMask) {
  Vec12<T> jointMask;
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    for (int joint = 0; joint < JOINTS_PER_LEG; joint++) {
      jointMask[jointIndex(leg, joint)] = legMask[leg];
    }
  }
  return jointMask;
}

/*!
 * The 3-vector of leg from a 12-vector
 */
template <typename T>
Vec3<T> legSegment(const Vec12<T>& v, int leg) {
  return v.template segment<3>(JOINTS_PER_LEG * leg);
}

#endif  // WOOFER_LEGLAYOUT_H
