/*! @file RobotParameters.h
 *  @brief Declaration of various robot parameters
 *
 *  Physical layout of the robot and the controller period.  Loaded from
 * config/woofer-defaults.yaml.
 */

#ifndef WOOFER_ROBOTPARAMETERS_H
#define WOOFER_ROBOTPARAMETERS_H

#include "ControlParameters/ControlParameters.h"

/*!
 * ControlParameters shared by every Woofer controller
 */
class RobotControlParameters : public ControlParameters {
 public:

  /*!
   * Construct RobotControlParameters
   */
  RobotControlParameters()
      : ControlParameters("robot-parameters"),
        INIT_PARAMETER(controller_dt),
        INIT_PARAMETER(num_legs),
        INIT_PARAMETER(joints_per_leg),
        INIT_PARAMETER(mass),
        INIT_PARAMETER(body_inertia),
        INIT_PARAMETER(abad_location),
        INIT_PARAMETER(abad_link_length),
        INIT_PARAMETER(hip_link_length),
        INIT_PARAMETER(knee_link_length),
        INIT_PARAMETER(contact_force_threshold) {}

  DECLARE_PARAMETER(double, controller_dt)
  DECLARE_PARAMETER(s64, num_legs)
  DECLARE_PARAMETER(s64, joints_per_leg)

  // body
  DECLARE_PARAMETER(double, mass)
  DECLARE_PARAMETER(Vec3<double>, body_inertia)  // diagonal, body frame

  // legs
  DECLARE_PARAMETER(Vec3<double>, abad_location)  // front left hip
  DECLARE_PARAMETER(double, abad_link_length)
  DECLARE_PARAMETER(double, hip_link_length)
  DECLARE_PARAMETER(double, knee_link_length)

  DECLARE_PARAMETER(double, contact_force_threshold)
};

#endif  // WOOFER_ROBOTPARAMETERS_H
