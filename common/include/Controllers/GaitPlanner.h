/*! @file GaitPlanner.h
 *  @brief Gait planner interface
 */

#ifndef WOOFER_GAITPLANNER_H
#define WOOFER_GAITPLANNER_H

#include "ControlParameters/RobotParameters.h"
#include "ControlParameters/WooferControllerParameters.h"
#include "Controllers/StateEstimator.h"
#include "cppTypes.h"

/*!
 * Output of the gait planner for one tick
 */
template <typename T>
struct GaitPlan {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  Vec12<T> stepLocations;      // next foothold of each leg
  Vec12<T> prevStepLocations;  // foothold each swinging leg lifted off from
  Vec3<T> pRef;
  Vec3<T> rpyRef;
  Vec4<T> activeFeet;  // 1 = stance, 0 = swing
  T phase;             // [0, 1), position in the gait cycle
  T stepPhase;         // [0, 1], position in the current step
};

/*!
 * Decides which feet are in stance, where swing feet land and the body
 * reference.  Throws PlannerError on malformed parameters.
 */
template <typename T>
class GaitPlanner {
 public:
  virtual ~GaitPlanner() = default;
  virtual GaitPlan<T> update(const RobotState<T>& state,
                             const Vec4<T>& contacts, T t,
                             const RobotControlParameters& robotParams,
                             const GaitPlannerParameters& gaitParams) = 0;
};

#endif  // WOOFER_GAITPLANNER_H
