/*! @file WooferTestHelpers.h
 *  @brief Parameter sets shared by the tests
 */

#ifndef WOOFER_TESTHELPERS_H
#define WOOFER_TESTHELPERS_H

#include "ControlParameters/RobotParameters.h"
#include "ControlParameters/WooferControllerParameters.h"

inline void loadTestRobotParameters(RobotControlParameters& params) {
  params.initializeFromYamlString(R"(
__collection-name__: robot-parameters
controller_dt: 0.001
num_legs: 4
joints_per_leg: 3
mass: 8.0
body_inertia: [0.02, 0.08, 0.1]
abad_location: [0.2, 0.1, 0.0]
abad_link_length: 0.05
hip_link_length: 0.16
knee_link_length: 0.16
contact_force_threshold: 5.0
)");
}

inline void loadTestGaitParameters(GaitPlannerParameters& params) {
  params.initializeFromYamlString(R"(
__collection-name__: gait-planner-parameters
gait_period: 0.4
contact_schedule: [1, 0, 0, 1,
                   0, 1, 1, 0]
body_height: 0.25
velocity_des: [0.2, 0.0, 0.0]
yaw_rate_des: 0.0
)");
}

inline void loadTestSwingParameters(SwingControllerParameters& params) {
  params.initializeFromYamlString(R"(
__collection-name__: swing-controller-parameters
step_height: 0.05
kp_swing: [500, 500, 500]
kd_swing: [10, 10, 10]
)");
}

inline void loadTestQPParameters(QPControlParameters& params) {
  params.initializeFromYamlString(R"(
__collection-name__: qp-control-parameters
mu: 1.0
fz_min: 1.0
fz_max: 200.0
alpha: 0.001
gamma: 0.0
wrench_weights: [1, 1, 1, 10, 10, 10]
kp_base: [400, 400, 400]
kd_base: [40, 40, 40]
kp_angular: [60, 60, 60]
kd_angular: [6, 6, 6]
)");
}

#endif  // WOOFER_TESTHELPERS_H
