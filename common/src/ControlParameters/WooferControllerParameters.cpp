/*! @file WooferControllerParameters.cpp
 *  @brief Shape and range checks of the controller parameter sets, run once
 *  when the control loop is built
 */

#include "ControlParameters/WooferControllerParameters.h"

#include <cmath>

#include "Dynamics/LegLayout.h"
#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"

void checkGaitPlannerParameters(const GaitPlannerParameters& params) {
  if (!(params.gait_period > 0) || !std::isfinite(params.gait_period)) {
    throw ConfigurationError("gait_period must be positive, got " +
                             std::to_string(params.gait_period));
  }
  const std::vector<double>& schedule = params.contact_schedule;
  if (schedule.empty() || schedule.size() % NUM_LEGS != 0) {
    throw ConfigurationError("contact_schedule needs rows of " +
                             std::to_string(NUM_LEGS) + " values, got " +
                             std::to_string(schedule.size()) + " values");
  }
  for (double value : schedule) {
    if (!(value >= 0 && value <= 1)) {
      throw ConfigurationError("contact_schedule value " +
                               std::to_string(value) + " is outside [0, 1]");
    }
  }
  if (!(params.body_height > 0) || !std::isfinite(params.body_height)) {
    throw ConfigurationError("body_height must be positive");
  }
  if (!allFinite(params.velocity_des) ||
      !std::isfinite(params.yaw_rate_des)) {
    throw ConfigurationError("commanded velocity is not finite");
  }
}

void checkSwingControllerParameters(const SwingControllerParameters& params) {
  if (!(params.step_height >= 0) || !std::isfinite(params.step_height)) {
    throw ConfigurationError("step_height must be non-negative");
  }
  if (!allFinite(params.kp_swing) || !allFinite(params.kd_swing) ||
      (params.kp_swing.array() < 0).any() ||
      (params.kd_swing.array() < 0).any()) {
    throw ConfigurationError("swing gains must be non-negative");
  }
}

void checkQPControlParameters(const QPControlParameters& params) {
  if (params.wrench_weights.size() != 6) {
    throw ConfigurationError("wrench_weights needs 6 entries, got " +
                             std::to_string(params.wrench_weights.size()));
  }
  for (double weight : params.wrench_weights) {
    if (!(weight >= 0) || !std::isfinite(weight)) {
      throw ConfigurationError("wrench_weights must be non-negative");
    }
  }
  if (!(params.alpha >= 0) || !(params.gamma >= 0) ||
      !(params.alpha + params.gamma > 0) ||
      !std::isfinite(params.alpha + params.gamma)) {
    throw ConfigurationError(
        "alpha and gamma must be non-negative with a positive sum");
  }
  if (!(params.mu > 0) || !std::isfinite(params.mu)) {
    throw ConfigurationError("friction coefficient mu must be positive");
  }
}
