/*! @file WooferControllerParameters.h
 *  @brief Parameters of the gait planner, swing leg controller and stance
 *  force QP.  Each class is loaded from its own YAML file.
 */

#ifndef WOOFER_CONTROLLERPARAMETERS_H
#define WOOFER_CONTROLLERPARAMETERS_H

#include "ControlParameters/ControlParameters.h"

class GaitPlannerParameters : public ControlParameters {
 public:
  GaitPlannerParameters()
      : ControlParameters("gait-planner-parameters"),
        INIT_PARAMETER(gait_period),
        INIT_PARAMETER(contact_schedule),
        INIT_PARAMETER(body_height),
        INIT_PARAMETER(velocity_des),
        INIT_PARAMETER(yaw_rate_des) {}

  DECLARE_PARAMETER(double, gait_period)
  // rows of 4 stance values (FR, FL, BR, BL), one row per gait segment
  DECLARE_PARAMETER(std::vector<double>, contact_schedule)
  DECLARE_PARAMETER(double, body_height)
  DECLARE_PARAMETER(Vec3<double>, velocity_des)  // z is ignored
  DECLARE_PARAMETER(double, yaw_rate_des)
};

class SwingControllerParameters : public ControlParameters {
 public:
  SwingControllerParameters()
      : ControlParameters("swing-controller-parameters"),
        INIT_PARAMETER(step_height),
        INIT_PARAMETER(kp_swing),
        INIT_PARAMETER(kd_swing) {}

  DECLARE_PARAMETER(double, step_height)
  DECLARE_PARAMETER(Vec3<double>, kp_swing)
  DECLARE_PARAMETER(Vec3<double>, kd_swing)
};

class QPControlParameters : public ControlParameters {
 public:
  QPControlParameters()
      : ControlParameters("qp-control-parameters"),
        INIT_PARAMETER(mu),
        INIT_PARAMETER(fz_min),
        INIT_PARAMETER(fz_max),
        INIT_PARAMETER(alpha),
        INIT_PARAMETER(gamma),
        INIT_PARAMETER(wrench_weights),
        INIT_PARAMETER(kp_base),
        INIT_PARAMETER(kd_base),
        INIT_PARAMETER(kp_angular),
        INIT_PARAMETER(kd_angular) {}

  DECLARE_PARAMETER(double, mu)
  DECLARE_PARAMETER(double, fz_min)
  DECLARE_PARAMETER(double, fz_max)
  DECLARE_PARAMETER(double, alpha)  // force regularization
  DECLARE_PARAMETER(double, gamma)  // change from previous forces
  DECLARE_PARAMETER(std::vector<double>, wrench_weights)  // 6 entries

  DECLARE_PARAMETER(Vec3<double>, kp_base)
  DECLARE_PARAMETER(Vec3<double>, kd_base)
  DECLARE_PARAMETER(Vec3<double>, kp_angular)
  DECLARE_PARAMETER(Vec3<double>, kd_angular)
};

/*!
 * Check the shape and range of the gait parameters: positive period, a
 * non-empty schedule of whole 4-wide rows with values in [0, 1], positive
 * body height and a finite command.  Throws ConfigurationError.
 */
void checkGaitPlannerParameters(const GaitPlannerParameters& params);

/*!
 * Check that the swing step height and gains are non-negative.  Throws
 * ConfigurationError.
 */
void checkSwingControllerParameters(const SwingControllerParameters& params);

/*!
 * Check the QP weights: 6 non-negative wrench weights, non-negative alpha and
 * gamma with a positive sum, positive friction coefficient.  Throws
 * ConfigurationError.
 */
void checkQPControlParameters(const QPControlParameters& params);

#endif  // WOOFER_CONTROLLERPARAMETERS_H
