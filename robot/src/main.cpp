/*!
 * @file main.cpp
 * @brief Main Function for the Woofer controller
 *
 * Runs the controller on a simulated clock against a standing robot.
 * usage: woofer_run [ticks] [config-dir]
 */

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <lcm/lcm-cpp.hpp>

#include "Utilities/ControllerErrors.h"
#include "Utilities/Timer.h"
#include "Utilities/utilities.h"
#include "WooferRobot.h"
#include "woofer_debug_lcmt.hpp"

#ifndef WOOFER_CONFIG_DIR
#define WOOFER_CONFIG_DIR "config"
#endif

#define DEBUG_PRINT_PERIOD 1000

static void setLcm(const DebugSnapshot<double>& debug, woofer_debug_lcmt& lcm) {
  lcm.time = debug.time;
  lcm.iteration = (int64_t)debug.iteration;
  for (int i = 0; i < 3; i++) {
    lcm.p[i] = debug.position[i];
    lcm.rpy[i] = debug.rpy[i];
  }
  for (int i = 0; i < 6; i++) {
    lcm.ref_wrench[i] = debug.refWrench[i];
  }
  for (int i = 0; i < 4; i++) {
    lcm.contacts[i] = debug.contacts[i];
  }
  for (int i = 0; i < 12; i++) {
    lcm.max_torques[i] = debug.maxTorques[i];
    lcm.max_forces[i] = debug.maxForces[i];
    lcm.feet_locations[i] = debug.feetLocations[i];
    lcm.foot_forces[i] = debug.footForces[i];
    lcm.torques[i] = debug.torques[i];
  }
}

/*!
 * Sensor data of the robot standing still at body_height, each foot right
 * below its hip and carrying a quarter of the weight
 */
static WooferSensorData<double> standingSnapshot(
    const Woofer<double>& woofer, const GaitPlannerParameters& gaitParams) {
  WooferSensorData<double> data;
  data.cheaterState.position = Vec3<double>(0, 0, gaitParams.body_height);

  double l2 = woofer._hipLinkLength;
  double l3 = woofer._kneeLinkLength;
  double h = gaitParams.body_height + woofer._abadLocation[2];
  double cosKnee = coerce((h * h - l2 * l2 - l3 * l3) / (2 * l2 * l3), -1., 1.);
  double knee = -std::acos(cosKnee);
  double hip = -std::atan2(l3 * std::sin(knee), l2 + l3 * std::cos(knee));

  for (int leg = 0; leg < NUM_LEGS; leg++) {
    data.q[jointIndex(leg, 0)] = 0;
    data.q[jointIndex(leg, 1)] = hip;
    data.q[jointIndex(leg, 2)] = knee;
    data.footTouch[leg] = woofer.standingFootForce();
  }
  return data;
}

int main(int argc, char** argv) {
  long ticks = 5000;
  std::string configDir = WOOFER_CONFIG_DIR;
  if (argc > 1) ticks = std::strtol(argv[1], nullptr, 10);
  if (argc > 2) configDir = argv[2];
  if (ticks <= 0) {
    printf("usage: %s [ticks] [config-dir]\n", argv[0]);
    return EXIT_FAILURE;
  }

  RobotControlParameters robotParams;
  GaitPlannerParameters gaitParams;
  SwingControllerParameters swingParams;
  QPControlParameters qpParams;

  try {
    loadWooferParameters(configDir, robotParams, gaitParams, swingParams,
                         qpParams);
    WooferRobot robot(robotParams, gaitParams, swingParams, qpParams);
    ControlLoop<double>& loop = robot.controlLoop();

    lcm::LCM lcm(getLcmUrl(255));
    bool publish = lcm.good();
    if (!publish) {
      printf("[woofer_run] LCM failed to initialize, not publishing debug data\n");
    }
    woofer_debug_lcmt debugLcm;

    WooferSensorData<double> sensorData =
        standingSnapshot(robot.woofer(), gaitParams);
    double periodMs = 1000. * loop.dt();
    long overruns = 0;

    printf("[woofer_run] running %ld ticks\n", ticks);
    Timer timer;
    for (long i = 0; i < ticks; i++) {
      timer.start();
      robot.step(sensorData);
      double ms = timer.getMs();
      if (ms > periodMs) {
        overruns++;
        printf("[woofer_run] tick %ld overran: %.3f ms > %.3f ms\n", i, ms,
               periodMs);
      }

      if (publish) {
        setLcm(loop.currentDebugSnapshot(), debugLcm);
        lcm.publish("woofer_debug", &debugLcm);
      }

      if ((i + 1) % DEBUG_PRINT_PERIOD == 0) {
        loop.printDebugData();
      }
    }

    printf("[woofer_run] done, %llu ticks, t = %.3f s, %ld overruns\n",
           (unsigned long long)loop.iteration(), loop.time(), overruns);
    for (const auto& kv : loop.flushLog()) {
      printf("[woofer_run] %-22s %ld x %ld\n", kv.first.c_str(),
             (long)kv.second.rows(), (long)kv.second.cols());
    }
  } catch (const ControllerError& e) {
    printf("[woofer_run] %s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
