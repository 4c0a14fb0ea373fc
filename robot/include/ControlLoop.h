/*!
 * @file ControlLoop.h
 * @brief Runs one control tick of Woofer: estimation, gait planning, swing
 * and stance control, torque blending and logging.
 *
 * The loop owns its clock, the running extrema of forces and torques and the
 * data log.  Collaborators are owned by the caller and must outlive the loop.
 */

#ifndef WOOFER_CONTROLLOOP_H
#define WOOFER_CONTROLLOOP_H

#include <map>
#include <string>
#include <vector>

#include "ControlParameters/RobotParameters.h"
#include "ControlParameters/WooferControllerParameters.h"
#include "Controllers/ContactEstimator.h"
#include "Controllers/GaitPlanner.h"
#include "Controllers/StanceForceController.h"
#include "Controllers/StateEstimator.h"
#include "Controllers/SwingLegController.h"
#include "Dynamics/LegKinematics.h"
#include "Dynamics/LegLayout.h"
#include "SimUtilities/WooferSensorData.h"
#include "Utilities/DataRecorder.h"
#include "Utilities/RunningMax.h"
#include "cppTypes.h"

#define CONTROL_LOOP_LOG_INITIAL_CAPACITY 10
#define CONTROL_LOOP_LOG_CHUNK_SIZE 1000

/*!
 * Values of the last completed tick, for printing and publishing
 */
template <typename T>
struct DebugSnapshot {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  DebugSnapshot() { zero(); }

  void zero();

  T time;
  u64 iteration;
  Vec3<T> position;
  Vec3<T> rpy;
  Vec12<T> maxTorques;
  Vec12<T> maxForces;
  Vec6<T> refWrench;
  Vec12<T> feetLocations;
  Vec4<T> contacts;
  Vec12<T> footForces;
  Vec12<T> torques;
};

template <typename T>
class ControlLoop {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  ControlLoop(StateEstimator<T>* stateEstimator,
              ContactEstimator<T>* contactEstimator,
              GaitPlanner<T>* gaitPlanner,
              SwingLegController<T>* swingController,
              LegKinematics<T>* kinematics,
              StanceForceController<T>* stanceController,
              RobotControlParameters* robotParams,
              GaitPlannerParameters* gaitParams,
              SwingControllerParameters* swingParams,
              QPControlParameters* qpParams);

  /*!
   * Run one control tick and return the 12 joint torques.  If any step
   * throws, the exception propagates and the loop state is unchanged.
   */
  Vec12<T> tick(const WooferSensorData<T>& sensorData);

  DebugSnapshot<T> currentDebugSnapshot() const { return _debug; }
  void printDebugData() const;

  /*!
   * Logged data of every completed tick, keyed by channel name
   */
  std::map<std::string, DMat<T>> flushLog() const;

  static std::vector<ChannelDescriptor> logChannels();

  T time() const { return _t; }
  u64 iteration() const { return _i; }
  T dt() const { return _dt; }
  const Vec12<T>& maxTorques() const { return _maxTorques.currentMax(); }
  const Vec12<T>& maxForces() const { return _maxForces.currentMax(); }
  const Vec12<T>& previousFootForces() const { return _footForces; }
  const DataRecorder<T>& log() const { return _log; }

 private:
  void checkGaitPlan(const GaitPlan<T>& plan) const;

  StateEstimator<T>* _stateEstimator;
  ContactEstimator<T>* _contactEstimator;
  GaitPlanner<T>* _gaitPlanner;
  SwingLegController<T>* _swingController;
  LegKinematics<T>* _kinematics;
  StanceForceController<T>* _stanceController;

  RobotControlParameters* _robotParams;
  GaitPlannerParameters* _gaitParams;
  SwingControllerParameters* _swingParams;
  QPControlParameters* _qpParams;

  T _dt;
  T _t = 0;
  u64 _i = 0;

  Vec12<T> _footForces;
  RunningMax<T, NUM_JOINTS> _maxTorques;
  RunningMax<T, NUM_JOINTS> _maxForces;
  DataRecorder<T> _log;
  DebugSnapshot<T> _debug;
};

#endif  // WOOFER_CONTROLLOOP_H
