/*!
 * @file StepPlanner.cpp
 * @brief Periodic gait from a contact schedule, with Raibert style footholds
 */

#include "StepPlanner.h"

#include <cmath>

#include "Math/orientation_tools.h"
#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"

template <typename T>
StepPlanner<T>::StepPlanner(const Woofer<T>& woofer)
    : _kinematics(woofer), _t0(0), _yaw0(0) {
  _p0.setZero();
  _lastActiveFeet.setOnes();
  _stepLocations.setZero();
  _prevStepLocations.setZero();
}

template <typename T>
void StepPlanner<T>::checkParameters(const GaitPlannerParameters& gaitParams,
                                     T t) const {
  if (!std::isfinite(t)) {
    throw PlannerError("time is not finite");
  }
  if (!(gaitParams.gait_period > 0) || !std::isfinite(gaitParams.gait_period)) {
    throw PlannerError("gait period must be positive, got " +
                       std::to_string(gaitParams.gait_period));
  }
  const std::vector<double>& schedule = gaitParams.contact_schedule;
  if (schedule.empty() || schedule.size() % NUM_LEGS != 0) {
    throw PlannerError("contact schedule needs rows of " +
                       std::to_string(NUM_LEGS) + " values, got " +
                       std::to_string(schedule.size()) + " values");
  }
  for (double value : schedule) {
    if (!(value >= 0 && value <= 1)) {
      throw PlannerError("contact schedule value " + std::to_string(value) +
                         " is outside [0, 1]");
    }
  }
  if (!(gaitParams.body_height > 0)) {
    throw PlannerError("body height must be positive");
  }
  if (!allFinite(gaitParams.velocity_des) ||
      !std::isfinite(gaitParams.yaw_rate_des)) {
    throw PlannerError("commanded velocity is not finite");
  }
}

template <typename T>
Vec4<T> StepPlanner<T>::scheduleRow(const std::vector<double>& schedule,
                                    int row) const {
  Vec4<T> stance;
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    stance[leg] = T(schedule[NUM_LEGS * row + leg]);
  }
  return stance;
}

template <typename T>
GaitPlan<T> StepPlanner<T>::update(const RobotState<T>& state,
                                   const Vec4<T>& contacts, T t,
                                   const RobotControlParameters& robotParams,
                                   const GaitPlannerParameters& gaitParams) {
  (void)contacts;
  (void)robotParams;
  checkParameters(gaitParams, t);

  const std::vector<double>& schedule = gaitParams.contact_schedule;
  int rows = (int)schedule.size() / NUM_LEGS;
  T period = T(gaitParams.gait_period);

  // where we are in the gait, phase and segment both come from one cycle count
  T cycles = std::floor(t / period);
  T phase = (t - cycles * period) / period;
  if (phase < 0) {
    phase += T(1);
    cycles -= T(1);
  }
  if (phase >= T(1)) {
    phase -= T(1);
    cycles += T(1);
  }
  if (phase < 0) phase = 0;
  int row = (int)std::floor(phase * rows);
  if (row >= rows) row = rows - 1;
  T stepPhase = coerce<T>(phase * rows - row, T(0), T(1));
  Vec4<T> activeFeet = scheduleRow(schedule, row);

  // feet in the world frame
  Vec12<T> pFoot = _kinematics.forward(state.jointAngles, state.orientation);
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    pFoot.template segment<3>(JOINTS_PER_LEG * leg) += state.position;
  }

  if (_firstRun) {
    _t0 = t;
    _p0 = state.position;
    _yaw0 = state.rpy[2];
    _stepLocations = pFoot;
    _prevStepLocations = pFoot;
    _lastActiveFeet.setOnes();
    _segment = -1;
    _firstRun = false;
  }

  Vec3<T> vDes(T(gaitParams.velocity_des[0]), T(gaitParams.velocity_des[1]),
               T(0));

  // new footholds for the legs lifting off in this segment
  s64 segment = (s64)cycles * rows + row;
  if (segment != _segment) {
    for (int leg = 0; leg < NUM_LEGS; leg++) {
      if (activeFeet[leg] < T(1) && _lastActiveFeet[leg] >= T(1)) {
        T stanceFraction = 0;
        for (int r = 0; r < rows; r++) {
          stanceFraction += T(schedule[NUM_LEGS * r + leg]);
        }
        T stanceTime = period * stanceFraction / T(rows);

        // hip where the body will have turned to halfway through stance
        Vec3<T> pYawCorrected =
            ori::coordinateRotation(
                CoordinateAxis::Z,
                -T(gaitParams.yaw_rate_des) * stanceTime / T(2)) *
            _kinematics.woofer().getHipLocation(leg);
        Vec3<T> pHip = state.position + state.rBody.transpose() * pYawCorrected;
        Vec3<T> pf = pHip + vDes * stanceTime / T(2);
        pf[2] = 0;

        _prevStepLocations.template segment<3>(JOINTS_PER_LEG * leg) =
            pFoot.template segment<3>(JOINTS_PER_LEG * leg);
        _stepLocations.template segment<3>(JOINTS_PER_LEG * leg) = pf;
      }
    }
    _lastActiveFeet = activeFeet;
    _segment = segment;
  }

  GaitPlan<T> plan;
  plan.stepLocations = _stepLocations;
  plan.prevStepLocations = _prevStepLocations;
  T elapsed = t - _t0;
  plan.pRef = Vec3<T>(_p0[0] + vDes[0] * elapsed, _p0[1] + vDes[1] * elapsed,
                      T(gaitParams.body_height));
  plan.rpyRef =
      Vec3<T>(0, 0, _yaw0 + T(gaitParams.yaw_rate_des) * elapsed);
  plan.activeFeet = activeFeet;
  plan.phase = phase;
  plan.stepPhase = stepPhase;
  return plan;
}

template class StepPlanner<double>;
template class StepPlanner<float>;
