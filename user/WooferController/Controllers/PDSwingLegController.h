/*!
 * @file PDSwingLegController.h
 * @brief Cartesian PD tracking of a Bezier swing trajectory
 */

#ifndef WOOFER_PDSWINGLEGCONTROLLER_H
#define WOOFER_PDSWINGLEGCONTROLLER_H

#include "Controllers/FootSwingTrajectory.h"
#include "Controllers/SwingLegController.h"
#include "Dynamics/Woofer.h"

/*!
 * Legs whose stance value is below one track a swing trajectory from their
 * previous step location to their next one.  Legs in full stance get zero
 * output and only report where their foot is.  The swing duration comes from
 * how fast the step phase advanced over the last control tick, so the first
 * call feeds forward no trajectory velocity.
 */
template <typename T>
class PDSwingLegController : public SwingLegController<T> {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  explicit PDSwingLegController(const Woofer<T>& woofer)
      : _woofer(woofer), _lastStepPhase(-1), _swingTime(0) {}

  SwingLegOutput<T> update(
      const RobotState<T>& state, T stepPhase, const Vec12<T>& stepLocations,
      const Vec12<T>& prevStepLocations, const Vec4<T>& activeFeet,
      const RobotControlParameters& robotParams,
      const SwingControllerParameters& swingParams) override;

 private:
  Woofer<T> _woofer;
  FootSwingTrajectory<T> _footSwingTrajectories[NUM_LEGS];
  T _lastStepPhase;
  T _swingTime;
};

#endif  // WOOFER_PDSWINGLEGCONTROLLER_H
