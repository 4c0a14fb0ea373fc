/*! @file Woofer.cpp
 *  @brief Build the Woofer model from the robot parameters
 */

#include "Dynamics/Woofer.h"

#include <cmath>

#include "Utilities/ControllerErrors.h"

/*!
 * Generate a Woofer model.  Throws ConfigurationError if the parameters do not
 * describe a physical robot.
 */
template <typename T>
Woofer<T> buildWoofer(const RobotControlParameters& params) {
  if (!(params.mass > 0) || !std::isfinite(params.mass)) {
    throw ConfigurationError("robot mass must be positive, got " +
                             std::to_string(params.mass));
  }
  if (!(params.body_inertia.array() > 0).all()) {
    throw ConfigurationError("body inertia must be positive");
  }
  if (!(params.hip_link_length > 0) || !(params.knee_link_length > 0) ||
      params.abad_link_length < 0) {
    throw ConfigurationError("invalid leg link lengths");
  }

  Woofer<T> woofer;
  woofer._bodyMass = T(params.mass);
  woofer._bodyInertia = params.body_inertia.cast<T>().asDiagonal();
  woofer._abadLinkLength = T(params.abad_link_length);
  woofer._hipLinkLength = T(params.hip_link_length);
  woofer._kneeLinkLength = T(params.knee_link_length);
  woofer._abadLocation = params.abad_location.cast<T>();
  return woofer;
}

template Woofer<double> buildWoofer<double>(const RobotControlParameters&);
template Woofer<float> buildWoofer<float>(const RobotControlParameters&);
