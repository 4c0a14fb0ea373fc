/*! @file ContactEstimator.h
 *  @brief Contact estimator interface and touch sensor contact detection
 */

#ifndef WOOFER_CONTACTESTIMATOR_H
#define WOOFER_CONTACTESTIMATOR_H

#include "SimUtilities/WooferSensorData.h"
#include "cppTypes.h"

/*!
 * Contact estimators return one value per leg in [0, 1]
 */
template <typename T>
class ContactEstimator {
 public:
  virtual ~ContactEstimator() = default;
  virtual Vec4<T> update(const WooferSensorData<T>& data) = 0;
};

/*!
 * A foot is in contact when its touch sensor reads more than the threshold
 */
template <typename T>
class TouchContactEstimator : public ContactEstimator<T> {
 public:
  explicit TouchContactEstimator(T threshold);

  Vec4<T> update(const WooferSensorData<T>& data) override;

  T threshold() const { return _threshold; }

 private:
  T _threshold;
};

#endif  // WOOFER_CONTACTESTIMATOR_H
