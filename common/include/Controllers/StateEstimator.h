/*! @file StateEstimator.h
 *  @brief State estimator interface and result of state estimation
 */

#ifndef WOOFER_STATEESTIMATOR_H
#define WOOFER_STATEESTIMATOR_H

#include "SimUtilities/WooferSensorData.h"
#include "cppTypes.h"

/*!
 * Result of state estimation.  Replaced every tick.
 */
template <typename T>
struct RobotState {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  Vec3<T> position;
  Vec3<T> vWorld;
  Quat<T> orientation;  // [w x y z]
  Vec3<T> omegaBody;
  Vec12<T> jointAngles;
  Vec12<T> jointVelocities;

  RotMat<T> rBody;  // satisfies vBody = rBody * vWorld
  Vec3<T> rpy;
  Vec3<T> omegaWorld;
};

/*!
 * All state estimators inherit from this class.  update() throws
 * EstimationError when the sensor data can not be used.
 */
template <typename T>
class StateEstimator {
 public:
  virtual ~StateEstimator() = default;
  virtual RobotState<T> update(const WooferSensorData<T>& data) = 0;
};

/*!
 * Copies the ground truth state reported by the simulator
 */
template <typename T>
class CheaterStateEstimator : public StateEstimator<T> {
 public:
  RobotState<T> update(const WooferSensorData<T>& data) override;
};

#endif  // WOOFER_STATEESTIMATOR_H
