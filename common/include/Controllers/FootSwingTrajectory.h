/*!
 * @file FootSwingTrajectory.h
 * @brief Utility to generate foot swing trajectories.
 *
 * Bezier curves in xy, two Bezier halves in z up to the apex
 */

#ifndef WOOFER_FOOTSWINGTRAJECTORY_H
#define WOOFER_FOOTSWINGTRAJECTORY_H

#include "cppTypes.h"

/*!
 * A foot swing trajectory for a single foot
 */
template <typename T>
class FootSwingTrajectory {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  FootSwingTrajectory() {
    _p0.setZero();
    _pf.setZero();
    _p.setZero();
    _v.setZero();
    _height = 0;
  }

  void setInitialPosition(const Vec3<T>& p0) { _p0 = p0; }
  void setFinalPosition(const Vec3<T>& pf) { _pf = pf; }

  /*!
   * Set the maximum height of the swing, above the initial position
   */
  void setHeight(T h) { _height = h; }

  /*!
   * Compute the position and velocity along the swing.  x and y follow one
   * Bezier curve from start to end, z rises to the apex at phase 0.5 and
   * comes back down.
   * @param phase : 0 at lift off, 1 at touch down
   * @param swingTime : duration of the swing, the velocity is zero if this is
   * not positive
   */
  void computeSwingTrajectoryBezier(T phase, T swingTime);

  const Vec3<T>& getPosition() const { return _p; }
  const Vec3<T>& getVelocity() const { return _v; }

 private:
  Vec3<T> _p0, _pf, _p, _v;
  T _height;
};

#endif  // WOOFER_FOOTSWINGTRAJECTORY_H
