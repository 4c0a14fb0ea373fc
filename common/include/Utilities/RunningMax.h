/*! @file RunningMax.h
 *  @brief Running maximum of absolute values, per channel
 *
 *  Used to track the largest foot forces and joint torques commanded since the
 *  controller started.  There is no decay and no window.
 */

#ifndef WOOFER_RUNNINGMAX_H
#define WOOFER_RUNNINGMAX_H

#include <cmath>

#include "cppTypes.h"

template <typename T, int N>
class RunningMax {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  typedef Eigen::Matrix<T, N, 1> Vector;

  RunningMax() { reset(); }

  void reset() { _max.setZero(); }

  /*!
   * Fold one sample into the running maximum: max[k] = max(max[k], |v[k]|)
   */
  void update(const Vector& v) {
    for (int k = 0; k < N; k++) {
      T a = std::abs(v[k]);
      if (a > _max[k]) _max[k] = a;
    }
  }

  const Vector& currentMax() const { return _max; }

  int width() const { return N; }

 private:
  Vector _max;
};

#endif  // WOOFER_RUNNINGMAX_H
