/*! @file ControllerErrors.h
 *  @brief Exceptions raised by the control loop and its collaborators
 *
 *  Every error keeps its kind when it propagates out of a control tick, so the
 *  caller can tell a bad sensor frame from an infeasible force distribution.
 */

#ifndef WOOFER_CONTROLLERERRORS_H
#define WOOFER_CONTROLLERERRORS_H

#include <stdexcept>
#include <string>

/*!
 * Base class for all control errors
 */
class ControllerError : public std::runtime_error {
 public:
  explicit ControllerError(const std::string& what)
      : std::runtime_error(what) {}
};

/*!
 * Invalid or insufficient sensor data for state or contact estimation
 */
class EstimationError : public ControllerError {
 public:
  explicit EstimationError(const std::string& what)
      : ControllerError("[Estimation] " + what) {}
};

/*!
 * Malformed gait configuration or planner output
 */
class PlannerError : public ControllerError {
 public:
  explicit PlannerError(const std::string& what)
      : ControllerError("[GaitPlanner] " + what) {}
};

/*!
 * The stance force optimization has no feasible solution
 */
class InfeasibleSolveError : public ControllerError {
 public:
  explicit InfeasibleSolveError(const std::string& what)
      : ControllerError("[StanceForce] " + what) {}
};

/*!
 * Array width, enumeration or parameter mismatch found at construction.
 * Never raised once the control loop is running.
 */
class ConfigurationError : public ControllerError {
 public:
  explicit ConfigurationError(const std::string& what)
      : ControllerError("[Configuration] " + what) {}
};

#endif  // WOOFER_CONTROLLERERRORS_H
