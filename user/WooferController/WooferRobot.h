/*!
 * @file WooferRobot.h
 * @brief The onboard Woofer software: one of each estimator and controller
 * wired into a ControlLoop.
 *
 * The parameter sets are owned by the caller and must outlive the robot.
 */

#ifndef WOOFER_WOOFERROBOT_H
#define WOOFER_WOOFERROBOT_H

#include <string>

#include "ControlLoop.h"
#include "Controllers/ContactEstimator.h"
#include "Controllers/PDSwingLegController.h"
#include "Controllers/QPBalanceController.h"
#include "Controllers/StateEstimator.h"
#include "Controllers/StepPlanner.h"
#include "Dynamics/LegKinematics.h"
#include "Dynamics/Woofer.h"

/*!
 * Load the four parameter files of Woofer from a config directory and check
 * that every parameter was set.  Throws ConfigurationError otherwise.
 */
void loadWooferParameters(const std::string& configDir,
                          RobotControlParameters& robotParams,
                          GaitPlannerParameters& gaitParams,
                          SwingControllerParameters& swingParams,
                          QPControlParameters& qpParams);

class WooferRobot {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  WooferRobot(RobotControlParameters& robotParams,
              GaitPlannerParameters& gaitParams,
              SwingControllerParameters& swingParams,
              QPControlParameters& qpParams);
  WooferRobot(const WooferRobot&) = delete;
  WooferRobot& operator=(const WooferRobot&) = delete;
  ~WooferRobot();

  Vec12<double> step(const WooferSensorData<double>& sensorData) {
    return _controlLoop->tick(sensorData);
  }

  ControlLoop<double>& controlLoop() { return *_controlLoop; }
  const Woofer<double>& woofer() const { return _woofer; }

 private:
  void deleteControllers();

  Woofer<double> _woofer;

  CheaterStateEstimator<double>* _stateEstimator = nullptr;
  TouchContactEstimator<double>* _contactEstimator = nullptr;
  StepPlanner<double>* _gaitPlanner = nullptr;
  PDSwingLegController<double>* _swingController = nullptr;
  WooferLegKinematics<double>* _kinematics = nullptr;
  QPBalanceController<double>* _qpController = nullptr;
  ControlLoop<double>* _controlLoop = nullptr;
};

#endif  // WOOFER_WOOFERROBOT_H
