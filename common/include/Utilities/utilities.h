/*!
 * @file utilities.h
 * @brief Common utility functions
 */

#ifndef WOOFER_UTILITIES_H
#define WOOFER_UTILITIES_H

#include <cassert>
#include <cmath>
#include <string>
#include <eigen3/Eigen/Dense>

/*!
 * Are two eigen matrices almost equal?
 */
template <typename T, typename T2>
bool almostEqual(const Eigen::MatrixBase<T>& a, const Eigen::MatrixBase<T>& b,
                 T2 tol) {
  long x = T::RowsAtCompileTime;
  long y = T::ColsAtCompileTime;

  if (T::RowsAtCompileTime == Eigen::Dynamic ||
      T::ColsAtCompileTime == Eigen::Dynamic) {
    assert(a.rows() == b.rows());
    assert(a.cols() == b.cols());
    x = a.rows();
    y = a.cols();
  }

  for (long i = 0; i < x; i++) {
    for (long j = 0; j < y; j++) {
      T2 error = std::abs(a(i, j) - b(i, j));
      if (error >= tol) return false;
    }
  }
  return true;
}

/*!
 * Square a number
 */
template <typename T>
T square(T a) {
  return a * a;
}

/*!
 * Coerce in to be between min and max
 */
template <typename T>
T coerce(T in, T min, T max) {
  if (in < min) {
    in = min;
  }
  if (in > max) {
    in = max;
  }
  return in;
}

/*!
 * Are all entries of an eigen matrix finite?
 */
template <typename T>
bool allFinite(const Eigen::MatrixBase<T>& m) {
  for (long i = 0; i < m.rows(); i++) {
    for (long j = 0; j < m.cols(); j++) {
      if (!std::isfinite(m(i, j))) return false;
    }
  }
  return true;
}

/*!
 * Convert an eigen vector to a string like "[ 1 2 3 ]"
 */
template <typename T>
std::string eigenToString(const Eigen::MatrixBase<T>& v) {
  std::string s = "[";
  for (long i = 0; i < v.size(); i++) {
    s += " " + std::to_string(v(i));
  }
  s += " ]";
  return s;
}

/*!
 * LCM url for multicast on the local network with the given time to live
 */
std::string getLcmUrl(long ttl);

#endif  // WOOFER_UTILITIES_H
