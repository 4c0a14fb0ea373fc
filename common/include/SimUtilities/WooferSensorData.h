/*! @file WooferSensorData.h
 *  @brief Sensor snapshot handed to the controller every tick
 */

#ifndef WOOFER_SENSORDATA_H
#define WOOFER_SENSORDATA_H

#include "cppTypes.h"

/*!
 * "Cheater" state sent to the robot from simulator
 */
template <typename T>
struct CheaterState {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  Quat<T> orientation;
  Vec3<T> position;
  Vec3<T> omegaBody;
  Vec3<T> vBody;
};

/*!
 * Everything the robot measured during one tick
 */
template <typename T>
struct WooferSensorData {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  WooferSensorData() { zero(); }

  void zero() {
    cheaterState.orientation << 1, 0, 0, 0;
    cheaterState.position.setZero();
    cheaterState.omegaBody.setZero();
    cheaterState.vBody.setZero();
    q.setZero();
    qd.setZero();
    footTouch.setZero();
  }

  CheaterState<T> cheaterState;
  Vec12<T> q, qd;     // joint positions / velocities, leg order
  Vec4<T> footTouch;  // foot touch sensor readings [N]
};

#endif  // WOOFER_SENSORDATA_H
