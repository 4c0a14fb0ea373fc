/*!
 * @file ControlLoop.cpp
 * @brief Runs one control tick of Woofer: estimation, gait planning, swing
 * and stance control, torque blending and logging.
 */

#include "ControlLoop.h"

#include <cmath>
#include <cstdio>

#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"

template <typename T>
void DebugSnapshot<T>::zero() {
  time = 0;
  iteration = 0;
  position.setZero();
  rpy.setZero();
  maxTorques.setZero();
  maxForces.setZero();
  refWrench.setZero();
  feetLocations.setZero();
  contacts.setZero();
  footForces.setZero();
  torques.setZero();
}

/*!
 * Log channels, in the order tick() writes them
 */
template <typename T>
std::vector<ChannelDescriptor> ControlLoop<T>::logChannels() {
  return {{"torque_history", NUM_JOINTS},
          {"force_history", NUM_JOINTS},
          {"ref_wrench_history", 6},
          {"contacts_history", NUM_LEGS},
          {"active_feet_history", NUM_LEGS},
          {"swing_torque_history", NUM_JOINTS},
          {"swing_force_history", NUM_JOINTS},
          {"swing_trajectory", NUM_JOINTS},
          {"foot_positions", NUM_JOINTS},
          {"phase_history", 1},
          {"step_phase_history", 1}};
}

template <typename T>
ControlLoop<T>::ControlLoop(StateEstimator<T>* stateEstimator,
                            ContactEstimator<T>* contactEstimator,
                            GaitPlanner<T>* gaitPlanner,
                            SwingLegController<T>* swingController,
                            LegKinematics<T>* kinematics,
                            StanceForceController<T>* stanceController,
                            RobotControlParameters* robotParams,
                            GaitPlannerParameters* gaitParams,
                            SwingControllerParameters* swingParams,
                            QPControlParameters* qpParams)
    : _stateEstimator(stateEstimator),
      _contactEstimator(contactEstimator),
      _gaitPlanner(gaitPlanner),
      _swingController(swingController),
      _kinematics(kinematics),
      _stanceController(stanceController),
      _robotParams(robotParams),
      _gaitParams(gaitParams),
      _swingParams(swingParams),
      _qpParams(qpParams),
      _dt(0),
      _log(logChannels(), CONTROL_LOOP_LOG_INITIAL_CAPACITY,
           CONTROL_LOOP_LOG_CHUNK_SIZE) {
  if (!_stateEstimator || !_contactEstimator || !_gaitPlanner ||
      !_swingController || !_kinematics || !_stanceController) {
    throw ConfigurationError("control loop is missing a collaborator");
  }
  if (!_robotParams || !_gaitParams || !_swingParams || !_qpParams) {
    throw ConfigurationError("control loop is missing a parameter set");
  }

  std::vector<ControlParameters*> allParams = {_robotParams, _gaitParams,
                                               _swingParams, _qpParams};
  for (ControlParameters* params : allParams) {
    if (!params->isFullyInitialized()) {
      throw ConfigurationError("parameters " + params->name() +
                               " are not fully initialized, missing:\n" +
                               params->generateUnitializedList());
    }
  }

  if (!(_robotParams->controller_dt > 0) ||
      !std::isfinite(_robotParams->controller_dt)) {
    throw ConfigurationError("controller_dt must be positive, got " +
                             std::to_string(_robotParams->controller_dt));
  }
  if (_robotParams->num_legs != NUM_LEGS ||
      _robotParams->joints_per_leg != JOINTS_PER_LEG) {
    throw ConfigurationError(
        "robot layout " + std::to_string(_robotParams->num_legs) + "x" +
        std::to_string(_robotParams->joints_per_leg) +
        " does not match the compiled layout " + std::to_string(NUM_LEGS) +
        "x" + std::to_string(JOINTS_PER_LEG));
  }
  if (!(_robotParams->mass > 0)) {
    throw ConfigurationError("robot mass must be positive");
  }
  checkGaitPlannerParameters(*_gaitParams);
  checkSwingControllerParameters(*_swingParams);
  checkQPControlParameters(*_qpParams);

  _dt = T(_robotParams->controller_dt);

  // before the first solve every foot carries a quarter of the weight
  T standingForce = T(_robotParams->mass * 9.81 / NUM_LEGS);
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    _footForces.template segment<3>(JOINTS_PER_LEG * leg) =
        Vec3<T>(0, 0, standingForce);
  }

  printf("[ControlLoop] dt: %.6f s, mass: %.3f kg\n", (double)_dt,
         _robotParams->mass);
}

template <typename T>
void ControlLoop<T>::checkGaitPlan(const GaitPlan<T>& plan) const {
  if (!allFinite(plan.stepLocations) || !allFinite(plan.prevStepLocations) ||
      !allFinite(plan.pRef) || !allFinite(plan.rpyRef) ||
      !allFinite(plan.activeFeet) || !std::isfinite(plan.phase) ||
      !std::isfinite(plan.stepPhase)) {
    throw PlannerError("planner output is not finite");
  }
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    if (plan.activeFeet[leg] < 0 || plan.activeFeet[leg] > 1) {
      throw PlannerError("active feet mask " + eigenToString(plan.activeFeet) +
                         " is outside [0, 1]");
    }
  }
  if (plan.phase < 0 || plan.phase >= 1) {
    throw PlannerError("phase " + std::to_string(plan.phase) +
                       " is outside [0, 1)");
  }
  if (plan.stepPhase < 0 || plan.stepPhase > 1) {
    throw PlannerError("step phase " + std::to_string(plan.stepPhase) +
                       " is outside [0, 1]");
  }
}

template <typename T>
Vec12<T> ControlLoop<T>::tick(const WooferSensorData<T>& sensorData) {
  // estimation
  RobotState<T> state = _stateEstimator->update(sensorData);
  Vec4<T> contacts = _contactEstimator->update(sensorData);

  // gait planning
  GaitPlan<T> plan =
      _gaitPlanner->update(state, contacts, _t, *_robotParams, *_gaitParams);
  checkGaitPlan(plan);

  // swing legs
  SwingLegOutput<T> swing = _swingController->update(
      state, plan.stepPhase, plan.stepLocations, plan.prevStepLocations,
      plan.activeFeet, *_robotParams, *_swingParams);

  // stance legs
  Vec12<T> feetLocations =
      _kinematics->forward(state.jointAngles, state.orientation);
  StanceControllerOutput<T> stance = _stanceController->update(
      state, feetLocations, plan.activeFeet, plan.pRef, plan.rpyRef,
      _footForces, *_robotParams, *_qpParams);

  // blend
  Vec12<T> activeFeet12 = expandLegMask(plan.activeFeet);
  Vec12<T> torques;
  for (int k = 0; k < NUM_JOINTS; k++) {
    torques[k] = activeFeet12[k] * stance.torques[k] +
                 (T(1) - activeFeet12[k]) * swing.torques[k];
  }

  // nothing below may fail except the log, so it goes first
  DVec<T> phase(1), stepPhase(1);
  phase << plan.phase;
  stepPhase << plan.stepPhase;
  _log.append(_i, {torques, stance.footForces, stance.refWrench, contacts,
                   plan.activeFeet, swing.torques, swing.forces,
                   swing.trajectory, swing.footPositions, phase, stepPhase});

  _maxForces.update(stance.footForces);
  _maxTorques.update(torques);
  _footForces = stance.footForces;

  _t += _dt;
  _i++;

  _debug.time = _t;
  _debug.iteration = _i;
  _debug.position = state.position;
  _debug.rpy = state.rpy;
  _debug.maxTorques = _maxTorques.currentMax();
  _debug.maxForces = _maxForces.currentMax();
  _debug.refWrench = stance.refWrench;
  _debug.feetLocations = feetLocations;
  _debug.contacts = contacts;
  _debug.footForces = stance.footForces;
  _debug.torques = torques;

  return torques;
}

template <typename T>
void ControlLoop<T>::printDebugData() const {
  printf("Time: %f\n", (double)_debug.time);
  printf("Cartesian: %s\n", eigenToString(_debug.position).c_str());
  printf("Euler angles: %s\n", eigenToString(_debug.rpy).c_str());
  printf("Max gen. torques: %s\n", eigenToString(_debug.maxTorques).c_str());
  printf("Max forces: %s\n", eigenToString(_debug.maxForces).c_str());
  printf("Reference wrench: %s\n", eigenToString(_debug.refWrench).c_str());
  printf("feet locations: %s\n", eigenToString(_debug.feetLocations).c_str());
  printf("contacts: %s\n", eigenToString(_debug.contacts).c_str());
  printf("QP feet forces: %s\n", eigenToString(_debug.footForces).c_str());
  printf("Joint torques: %s\n", eigenToString(_debug.torques).c_str());
  printf("\n");
}

template <typename T>
std::map<std::string, DMat<T>> ControlLoop<T>::flushLog() const {
  return _log.exportData(_i);
}

template struct DebugSnapshot<double>;
template struct DebugSnapshot<float>;
template class ControlLoop<double>;
template class ControlLoop<float>;
