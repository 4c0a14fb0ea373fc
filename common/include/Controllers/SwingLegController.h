/*! @file SwingLegController.h
 *  @brief Swing leg controller interface
 */

#ifndef WOOFER_SWINGLEGCONTROLLER_H
#define WOOFER_SWINGLEGCONTROLLER_H

#include "ControlParameters/RobotParameters.h"
#include "ControlParameters/WooferControllerParameters.h"
#include "Controllers/StateEstimator.h"
#include "cppTypes.h"

template <typename T>
struct SwingLegOutput {
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  Vec12<T> torques;
  Vec12<T> forces;
  Vec12<T> trajectory;     // desired foot positions
  Vec12<T> footPositions;  // measured foot positions
};

template <typename T>
class SwingLegController {
 public:
  virtual ~SwingLegController() = default;
  virtual SwingLegOutput<T> update(
      const RobotState<T>& state, T stepPhase, const Vec12<T>& stepLocations,
      const Vec12<T>& prevStepLocations, const Vec4<T>& activeFeet,
      const RobotControlParameters& robotParams,
      const SwingControllerParameters& swingParams) = 0;
};

#endif  // WOOFER_SWINGLEGCONTROLLER_H
