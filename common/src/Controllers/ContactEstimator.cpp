/*! @file ContactEstimator.cpp
 *  @brief Touch sensor contact detection
 */

#include "Controllers/ContactEstimator.h"

#include <cmath>

#include "Dynamics/LegLayout.h"
#include "Utilities/ControllerErrors.h"

template <typename T>
TouchContactEstimator<T>::TouchContactEstimator(T threshold)
    : _threshold(threshold) {
  if (!std::isfinite(threshold) || threshold < 0) {
    throw ConfigurationError("contact force threshold must be non-negative");
  }
}

template <typename T>
Vec4<T> TouchContactEstimator<T>::update(const WooferSensorData<T>& data) {
  Vec4<T> contacts;
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    T touch = data.footTouch[leg];
    if (!std::isfinite(touch) || touch < 0) {
      throw EstimationError("bad touch sensor reading on leg " +
                            std::to_string(leg));
    }
    contacts[leg] = touch > _threshold ? T(1) : T(0);
  }
  return contacts;
}

template class TouchContactEstimator<double>;
template class TouchContactEstimator<float>;
