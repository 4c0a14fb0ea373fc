/*! @file Woofer.h
 *  @brief Data structure containing parameters for the Woofer quadruped
 *
 *  Leg frames have the same orientation as the body frame and their origin at
 *  the ab/ad pivot of the leg ("hip frame").
 */

#ifndef WOOFER_WOOFER_H
#define WOOFER_WOOFER_H

#include "ControlParameters/RobotParameters.h"
#include "Dynamics/LegLayout.h"
#include "cppTypes.h"

/*!
 * Basic parameters of the Woofer quadruped
 */
template <typename T>
class Woofer {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  T _bodyMass;
  Mat3<T> _bodyInertia;
  T _abadLinkLength, _hipLinkLength, _kneeLinkLength;
  Vec3<T> _abadLocation;

  /*!
   * Get if the i-th leg is on the left (+) or right (-) of the robot.
   * @param leg : the leg index
   * @return The side sign (-1 for right legs, +1 for left legs)
   */
  static T getSideSign(int leg) {
    const T sideSigns[NUM_LEGS] = {-1, 1, -1, 1};
    return sideSigns[leg];
  }

  /*!
   * Get location of the hip for the given leg in robot frame
   * @param leg : the leg index
   */
  Vec3<T> getHipLocation(int leg) const {
    Vec3<T> pHip((leg == FRONT_RIGHT || leg == FRONT_LEFT) ? _abadLocation(0)
                                                           : -_abadLocation(0),
                 getSideSign(leg) * _abadLocation(1), _abadLocation(2));
    return pHip;
  }

  /*!
   * Weight carried by each foot when all four feet share the load equally
   */
  T standingFootForce() const { return _bodyMass * T(9.81) / T(NUM_LEGS); }
};

template <typename T>
Woofer<T> buildWoofer(const RobotControlParameters& params);

#endif  // WOOFER_WOOFER_H
