/*!
 * @file FootSwingTrajectory.cpp
 * @brief Utility to generate foot swing trajectories.
 */

#include "Controllers/FootSwingTrajectory.h"

#include "Utilities/Interpolation.h"

template <typename T>
void FootSwingTrajectory<T>::computeSwingTrajectoryBezier(T phase,
                                                          T swingTime) {
  _p = Interpolate::cubicBezier<Vec3<T>>(_p0, _pf, phase);
  _v = Interpolate::cubicBezierFirstDerivative<Vec3<T>>(_p0, _pf, phase);

  T zp, zv;
  if (phase < T(0.5)) {
    zp = Interpolate::cubicBezier<T>(_p0[2], _p0[2] + _height, phase * 2);
    zv = Interpolate::cubicBezierFirstDerivative<T>(_p0[2], _p0[2] + _height,
                                                    phase * 2) * 2;
  } else {
    zp = Interpolate::cubicBezier<T>(_p0[2] + _height, _pf[2], phase * 2 - 1);
    zv = Interpolate::cubicBezierFirstDerivative<T>(_p0[2] + _height, _pf[2],
                                                    phase * 2 - 1) * 2;
  }
  _p[2] = zp;
  _v[2] = zv;

  // d/dphase to d/dt
  if (swingTime > T(0)) {
    _v /= swingTime;
  } else {
    _v.setZero();
  }
}

template class FootSwingTrajectory<double>;
template class FootSwingTrajectory<float>;
