/*!
 * @file WooferRobot.cpp
 * @brief The onboard Woofer software: one of each estimator and controller
 * wired into a ControlLoop.
 */

#include "WooferRobot.h"

#include <cstdio>
#include <stdexcept>

#include "Utilities/ControllerErrors.h"

static void loadParameterFile(const std::string& path,
                              ControlParameters& params) {
  printf("[WooferRobot] loading %s from %s\n", params.name().c_str(),
         path.c_str());
  try {
    params.initializeFromYamlFile(path);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError(e.what());
  }
  if (!params.isFullyInitialized()) {
    throw ConfigurationError(path + " is missing parameters:\n" +
                             params.generateUnitializedList());
  }
}

void loadWooferParameters(const std::string& configDir,
                          RobotControlParameters& robotParams,
                          GaitPlannerParameters& gaitParams,
                          SwingControllerParameters& swingParams,
                          QPControlParameters& qpParams) {
  loadParameterFile(configDir + "/woofer-defaults.yaml", robotParams);
  loadParameterFile(configDir + "/woofer-gait-parameters.yaml", gaitParams);
  loadParameterFile(configDir + "/woofer-swing-parameters.yaml", swingParams);
  loadParameterFile(configDir + "/woofer-qp-parameters.yaml", qpParams);
}

WooferRobot::WooferRobot(RobotControlParameters& robotParams,
                         GaitPlannerParameters& gaitParams,
                         SwingControllerParameters& swingParams,
                         QPControlParameters& qpParams)
    : _woofer(buildWoofer<double>(robotParams)) {
  try {
    _stateEstimator = new CheaterStateEstimator<double>();
    _contactEstimator =
        new TouchContactEstimator<double>(robotParams.contact_force_threshold);
    _gaitPlanner = new StepPlanner<double>(_woofer);
    _swingController = new PDSwingLegController<double>(_woofer);
    _kinematics = new WooferLegKinematics<double>(_woofer);
    _qpController = new QPBalanceController<double>(_woofer);
    _controlLoop = new ControlLoop<double>(
        _stateEstimator, _contactEstimator, _gaitPlanner, _swingController,
        _kinematics, _qpController, &robotParams, &gaitParams, &swingParams,
        &qpParams);
  } catch (...) {
    deleteControllers();
    throw;
  }

  printf("[WooferRobot] ready, mass %.3f kg\n", _woofer._bodyMass);
}

WooferRobot::~WooferRobot() { deleteControllers(); }

void WooferRobot::deleteControllers() {
  delete _controlLoop;
  delete _qpController;
  delete _kinematics;
  delete _swingController;
  delete _gaitPlanner;
  delete _contactEstimator;
  delete _stateEstimator;
  _controlLoop = nullptr;
  _qpController = nullptr;
  _kinematics = nullptr;
  _swingController = nullptr;
  _gaitPlanner = nullptr;
  _contactEstimator = nullptr;
  _stateEstimator = nullptr;
}
