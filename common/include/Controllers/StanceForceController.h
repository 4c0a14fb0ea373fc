/*! @file StanceForceController.h
 *  @brief Stance force controller interface
 */

#ifndef WOOFER_STANCEFORCECONTROLLER_H
#define WOOFER_STANCEFORCECONTROLLER_H

#include "ControlParameters/RobotParameters.h"
#include "ControlParameters/WooferControllerParameters.h"
#include "Controllers/StateEstimator.h"
#include "cppTypes.h"

template <typename T>
struct StanceControllerOutput {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  Vec12<T> torques;
  Vec12<T> footForces;  // ground reaction forces, world frame
  Vec6<T> refWrench;    // force, then moment
};

/*!
 * Distributes the body wrench over the stance feet.  Throws
 * InfeasibleSolveError when no admissible force distribution exists.
 */
template <typename T>
class StanceForceController {
 public:
  virtual ~StanceForceController() = default;
  virtual StanceControllerOutput<T> update(
      const RobotState<T>& state, const Vec12<T>& feetLocations,
      const Vec4<T>& activeFeet, const Vec3<T>& pRef, const Vec3<T>& rpyRef,
      const Vec12<T>& previousFootForces,
      const RobotControlParameters& robotParams,
      const QPControlParameters& qpParams) = 0;
};

#endif  // WOOFER_STANCEFORCECONTROLLER_H
