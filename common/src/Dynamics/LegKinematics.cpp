/*! @file LegKinematics.cpp
 *  @brief Kinematics of the ab/ad - hip - knee legs of Woofer
 */

#include "Dynamics/LegKinematics.h"

#include <cmath>

#include "Math/orientation_tools.h"

template <typename T>
void computeLegJacobianAndPosition(const Woofer<T>& woofer, const Vec3<T>& q,
                                   Mat3<T>* J, Vec3<T>* p, int leg) {
  T l1 = woofer._abadLinkLength;
  T l2 = woofer._hipLinkLength;
  T l3 = woofer._kneeLinkLength;
  T sideSign = Woofer<T>::getSideSign(leg);

  T s1 = std::sin(q(0));
  T s2 = std::sin(q(1));
  T s3 = std::sin(q(2));

  T c1 = std::cos(q(0));
  T c2 = std::cos(q(1));
  T c3 = std::cos(q(2));

  T c23 = c2 * c3 - s2 * s3;
  T s23 = s2 * c3 + c2 * s3;

  if (J) {
    J->operator()(0, 0) = 0;
    J->operator()(0, 1) = l3 * c23 + l2 * c2;
    J->operator()(0, 2) = l3 * c23;
    J->operator()(1, 0) =
        l3 * c1 * c23 + l2 * c1 * c2 - l1 * sideSign * s1;
    J->operator()(1, 1) = -l3 * s1 * s23 - l2 * s1 * s2;
    J->operator()(1, 2) = -l3 * s1 * s23;
    J->operator()(2, 0) =
        l3 * s1 * c23 + l2 * c2 * s1 + l1 * sideSign * c1;
    J->operator()(2, 1) = l3 * c1 * s23 + l2 * c1 * s2;
    J->operator()(2, 2) = l3 * c1 * s23;
  }

  if (p) {
    p->operator()(0) = l3 * s23 + l2 * s2;
    p->operator()(1) = l1 * sideSign * c1 + l3 * (s1 * c23) + l2 * c2 * s1;
    p->operator()(2) = l1 * sideSign * s1 - l3 * (c1 * c23) - l2 * c1 * c2;
  }
}

template <typename T>
Vec3<T> footForceToJointTorque(const Mat3<T>& J, const RotMat<T>& rBody,
                               const Vec3<T>& f) {
  return J.transpose() * (rBody * (-f));
}

template <typename T>
Vec12<T> WooferLegKinematics<T>::footPositionsBody(
    const Vec12<T>& jointAngles) const {
  Vec12<T> feet;
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    Vec3<T> pLeg;
    Vec3<T> q = legSegment(jointAngles, leg);
    computeLegJacobianAndPosition(_woofer, q, (Mat3<T>*)nullptr, &pLeg, leg);
    feet.template segment<3>(JOINTS_PER_LEG * leg) =
        _woofer.getHipLocation(leg) + pLeg;
  }
  return feet;
}

template <typename T>
Vec12<T> WooferLegKinematics<T>::forward(const Vec12<T>& jointAngles,
                                         const Quat<T>& orientation) const {
  // rBody maps world to body, so its transpose takes body vectors to world
  RotMat<T> rBody = ori::quaternionToRotationMatrix(orientation);
  Vec12<T> body = footPositionsBody(jointAngles);
  Vec12<T> world;
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    world.template segment<3>(JOINTS_PER_LEG * leg) =
        rBody.transpose() * body.template segment<3>(JOINTS_PER_LEG * leg);
  }
  return world;
}

template void computeLegJacobianAndPosition<double>(const Woofer<double>&,
                                                    const Vec3<double>&,
                                                    Mat3<double>*,
                                                    Vec3<double>*, int);
template void computeLegJacobianAndPosition<float>(const Woofer<float>&,
                                                   const Vec3<float>&,
                                                   Mat3<float>*, Vec3<float>*,
                                                   int);

template Vec3<double> footForceToJointTorque<double>(const Mat3<double>&,
                                                     const RotMat<double>&,
                                                     const Vec3<double>&);
template Vec3<float> footForceToJointTorque<float>(const Mat3<float>&,
                                                   const RotMat<float>&,
                                                   const Vec3<float>&);

template class WooferLegKinematics<double>;
template class WooferLegKinematics<float>;
