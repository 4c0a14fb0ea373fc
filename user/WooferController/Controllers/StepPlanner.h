/*!
 * @file StepPlanner.h
 * @brief Periodic gait from a contact schedule, with Raibert style footholds
 *
 * The gait cycle is split into equal segments, one per row of the contact
 * schedule.  Each row holds the stance value of the four legs during its
 * segment.  A single row of ones is a standing gait.
 */

#ifndef WOOFER_STEPPLANNER_H
#define WOOFER_STEPPLANNER_H

#include "Controllers/GaitPlanner.h"
#include "Dynamics/LegKinematics.h"
#include "Dynamics/Woofer.h"

template <typename T>
class StepPlanner : public GaitPlanner<T> {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  explicit StepPlanner(const Woofer<T>& woofer);

  GaitPlan<T> update(const RobotState<T>& state, const Vec4<T>& contacts, T t,
                     const RobotControlParameters& robotParams,
                     const GaitPlannerParameters& gaitParams) override;

  /*!
   * Forget the footholds and body reference, the next update starts over
   */
  void reset() { _firstRun = true; }

 private:
  void checkParameters(const GaitPlannerParameters& gaitParams, T t) const;
  Vec4<T> scheduleRow(const std::vector<double>& schedule, int row) const;

  WooferLegKinematics<T> _kinematics;
  bool _firstRun = true;
  s64 _segment = -1;  // segment count since the first update
  T _t0;
  Vec3<T> _p0;
  T _yaw0;
  Vec4<T> _lastActiveFeet;
  Vec12<T> _stepLocations;
  Vec12<T> _prevStepLocations;
};

#endif  // WOOFER_STEPPLANNER_H
