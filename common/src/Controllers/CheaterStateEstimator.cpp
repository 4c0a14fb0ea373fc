/*! @file CheaterStateEstimator.cpp
 *  @brief Ground truth state estimation from simulator data
 *
 *  Computes:
 *  - orientation, rBody, rpy
 *  - omegaBody, omegaWorld
 *  - position, vWorld
 *  - joint angles and velocities
 */

#include <cmath>

#include "Controllers/StateEstimator.h"
#include "Math/orientation_tools.h"
#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"

template <typename T>
RobotState<T> CheaterStateEstimator<T>::update(
    const WooferSensorData<T>& data) {
  const CheaterState<T>& cheater = data.cheaterState;

  if (!allFinite(cheater.orientation) || !allFinite(cheater.position) ||
      !allFinite(cheater.omegaBody) || !allFinite(cheater.vBody)) {
    throw EstimationError("non-finite simulator state");
  }
  if (!allFinite(data.q) || !allFinite(data.qd)) {
    throw EstimationError("non-finite joint data");
  }
  T quatNorm = cheater.orientation.norm();
  if (std::abs(quatNorm - T(1)) > T(1e-3)) {
    throw EstimationError("orientation quaternion norm is " +
                          std::to_string(quatNorm));
  }

  RobotState<T> state;
  state.orientation = cheater.orientation / quatNorm;
  state.rBody = ori::quaternionToRotationMatrix(state.orientation);
  state.rpy = ori::quatToRPY(state.orientation);
  state.omegaBody = cheater.omegaBody;
  state.omegaWorld = state.rBody.transpose() * state.omegaBody;
  state.position = cheater.position;
  state.vWorld = state.rBody.transpose() * cheater.vBody;
  state.jointAngles = data.q;
  state.jointVelocities = data.qd;
  return state;
}

template class CheaterStateEstimator<double>;
template class CheaterStateEstimator<float>;
