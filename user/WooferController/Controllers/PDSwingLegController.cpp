/*!
 * @file PDSwingLegController.cpp
 * @brief Cartesian PD tracking of a Bezier swing trajectory
 */

#include "PDSwingLegController.h"

#include "Dynamics/LegKinematics.h"
#include "Utilities/utilities.h"

template <typename T>
SwingLegOutput<T> PDSwingLegController<T>::update(
    const RobotState<T>& state, T stepPhase, const Vec12<T>& stepLocations,
    const Vec12<T>& prevStepLocations, const Vec4<T>& activeFeet,
    const RobotControlParameters& robotParams,
    const SwingControllerParameters& swingParams) {
  SwingLegOutput<T> out;
  out.torques.setZero();
  out.forces.setZero();

  Mat3<T> Kp = swingParams.kp_swing.template cast<T>().asDiagonal();
  Mat3<T> Kd = swingParams.kd_swing.template cast<T>().asDiagonal();
  T phase = coerce<T>(stepPhase, T(0), T(1));

  // the step phase wraps at each new segment, keep the last swing time then
  T dt = T(robotParams.controller_dt);
  if (_lastStepPhase >= T(0) && phase > _lastStepPhase && dt > T(0)) {
    _swingTime = dt / (phase - _lastStepPhase);
  }
  _lastStepPhase = phase;

  for (int foot = 0; foot < NUM_LEGS; foot++) {
    Vec3<T> q = legSegment(state.jointAngles, foot);
    Vec3<T> qd = legSegment(state.jointVelocities, foot);
    Mat3<T> J;
    Vec3<T> pLeg;
    computeLegJacobianAndPosition(_woofer, q, &J, &pLeg, foot);

    Vec3<T> pFootWorld =
        state.position +
        state.rBody.transpose() * (_woofer.getHipLocation(foot) + pLeg);
    out.footPositions.template segment<3>(JOINTS_PER_LEG * foot) = pFootWorld;

    if (activeFeet[foot] >= T(1)) {
      // stance
      out.trajectory.template segment<3>(JOINTS_PER_LEG * foot) = pFootWorld;
      continue;
    }

    FootSwingTrajectory<T>& trajectory = _footSwingTrajectories[foot];
    trajectory.setHeight(T(swingParams.step_height));
    trajectory.setInitialPosition(
        prevStepLocations.template segment<3>(JOINTS_PER_LEG * foot));
    trajectory.setFinalPosition(
        stepLocations.template segment<3>(JOINTS_PER_LEG * foot));
    trajectory.computeSwingTrajectoryBezier(phase, _swingTime);

    Vec3<T> pDesFootWorld = trajectory.getPosition();
    Vec3<T> vDesFootWorld = trajectory.getVelocity();
    out.trajectory.template segment<3>(JOINTS_PER_LEG * foot) = pDesFootWorld;

    // PD in the leg frame
    Vec3<T> pDesLeg = state.rBody * (pDesFootWorld - state.position) -
                      _woofer.getHipLocation(foot);
    Vec3<T> vDesLeg = state.rBody * (vDesFootWorld - state.vWorld);
    Vec3<T> vLeg = J * qd;

    Vec3<T> footForce = Kp * (pDesLeg - pLeg) + Kd * (vDesLeg - vLeg);

    out.torques.template segment<3>(JOINTS_PER_LEG * foot) =
        J.transpose() * footForce;
    out.forces.template segment<3>(JOINTS_PER_LEG * foot) =
        state.rBody.transpose() * footForce;
  }

  return out;
}

template class PDSwingLegController<double>;
template class PDSwingLegController<float>;
