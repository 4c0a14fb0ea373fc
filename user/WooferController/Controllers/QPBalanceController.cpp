/*!
 * @file QPBalanceController.cpp
 * @brief Stance foot forces from a quadratic program
 */

#include "QPBalanceController.h"

#include <cmath>
#include <stdexcept>

#include "Dynamics/LegKinematics.h"
#include "Math/orientation_tools.h"
#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"

#define QP_INEQ_PER_FOOT 6

template <typename T>
Vec6<T> QPBalanceController<T>::referenceWrench(
    const RobotState<T>& state, const Vec3<T>& pRef, const Vec3<T>& rpyRef,
    const QPControlParameters& qpParams) const {
  Vec3<T> kpBase = qpParams.kp_base.template cast<T>();
  Vec3<T> kdBase = qpParams.kd_base.template cast<T>();
  Vec3<T> kpAngular = qpParams.kp_angular.template cast<T>();
  Vec3<T> kdAngular = qpParams.kd_angular.template cast<T>();

  Vec3<T> force = kpBase.cwiseProduct(pRef - state.position) -
                  kdBase.cwiseProduct(state.vWorld);
  force[2] += _woofer._bodyMass * T(9.81);

  Vec3<T> rpyError = rpyRef - state.rpy;
  // shortest way around in yaw
  while (rpyError[2] > T(M_PI)) rpyError[2] -= T(2 * M_PI);
  while (rpyError[2] < -T(M_PI)) rpyError[2] += T(2 * M_PI);
  Vec3<T> moment = kpAngular.cwiseProduct(rpyError) -
                   kdAngular.cwiseProduct(state.omegaWorld);

  Vec6<T> wrench;
  wrench << force, moment;
  return wrench;
}

template <typename T>
StanceControllerOutput<T> QPBalanceController<T>::update(
    const RobotState<T>& state, const Vec12<T>& feetLocations,
    const Vec4<T>& activeFeet, const Vec3<T>& pRef, const Vec3<T>& rpyRef,
    const Vec12<T>& previousFootForces,
    const RobotControlParameters& robotParams,
    const QPControlParameters& qpParams) {
  (void)robotParams;

  // the control loop checks this once at construction
  checkQPControlParameters(qpParams);

  StanceControllerOutput<T> out;
  out.torques.setZero();
  out.footForces.setZero();
  out.refWrench = referenceWrench(state, pRef, rpyRef, qpParams);

  std::vector<int> stanceLegs;
  for (int leg = 0; leg < NUM_LEGS; leg++) {
    if (activeFeet[leg] > T(0)) stanceLegs.push_back(leg);
  }
  int numStance = (int)stanceLegs.size();
  if (numStance == 0) {
    return out;
  }

  // wrench about the COM produced by the stance foot forces
  DMat<T> A = DMat<T>::Zero(6, 3 * numStance);
  DVec<T> fPrev(3 * numStance);
  for (int k = 0; k < numStance; k++) {
    int leg = stanceLegs[k];
    Vec3<T> r = legSegment(feetLocations, leg);
    A.block(0, 3 * k, 3, 3) = Mat3<T>::Identity();
    A.block(3, 3 * k, 3, 3) = ori::vectorToSkewMat(r);
    fPrev.segment(3 * k, 3) = legSegment(previousFootForces, leg);
  }

  DVec<T> fOpt;
  _SetupQP(numStance);
  _SolveQP(A, out.refWrench, fPrev, qpParams, fOpt);

  for (int k = 0; k < numStance; k++) {
    int leg = stanceLegs[k];
    Vec3<T> f = fOpt.segment(3 * k, 3);
    Mat3<T> J;
    Vec3<T> q = legSegment(state.jointAngles, leg);
    computeLegJacobianAndPosition(_woofer, q, &J, (Vec3<T>*)nullptr, leg);

    out.footForces.template segment<3>(JOINTS_PER_LEG * leg) = f;
    out.torques.template segment<3>(JOINTS_PER_LEG * leg) =
        footForceToJointTorque(J, state.rBody, f);
  }

  return out;
}

template <typename T>
void QPBalanceController<T>::_SetupQP(int numStance) {
  _dim_opt = 3 * numStance;
  _dim_ieq_cstr = QP_INEQ_PER_FOOT * numStance;

  z.resize(0., _dim_opt);
  G.resize(0., _dim_opt, _dim_opt);
  g0.resize(0., _dim_opt);
  CE.resize(0., _dim_opt, 0);
  ce0.resize(0., 0);
  CI.resize(0., _dim_opt, _dim_ieq_cstr);
  ci0.resize(0., _dim_ieq_cstr);
}

template <typename T>
void QPBalanceController<T>::_SolveQP(const DMat<T>& A, const Vec6<T>& wrench,
                                      const DVec<T>& fPrev,
                                      const QPControlParameters& qpParams,
                                      DVec<T>& fOpt) {
  DMat<double> S = DMat<double>::Zero(6, 6);
  for (int i = 0; i < 6; i++) S(i, i) = qpParams.wrench_weights[i];

  DMat<double> Ad = A.template cast<double>();
  DVec<double> w = wrench.template cast<double>();
  DVec<double> fp = fPrev.template cast<double>();
  double regularization = qpParams.alpha + qpParams.gamma;

  /* min 0.5 * x G x + g0 x
  s.t.
      CE^T x + ce0 = 0
      CI^T x + ci0 >= 0
  */
  DMat<double> H = Ad.transpose() * S * Ad;
  H += regularization * DMat<double>::Identity(_dim_opt, _dim_opt);
  DVec<double> g = -(Ad.transpose() * S * w + qpParams.gamma * fp);

  for (int i = 0; i < _dim_opt; i++) {
    for (int j = 0; j < _dim_opt; j++) {
      G[i][j] = 2. * H(i, j);
    }
    g0[i] = 2. * g[i];
  }

  double mu = qpParams.mu;
  for (int k = 0; k < _dim_opt / 3; k++) {
    int fx = 3 * k, fy = 3 * k + 1, fz = 3 * k + 2;
    int c = QP_INEQ_PER_FOOT * k;

    // fz_min <= fz <= fz_max
    CI[fz][c] = 1.;
    ci0[c] = -qpParams.fz_min;
    CI[fz][c + 1] = -1.;
    ci0[c + 1] = qpParams.fz_max;

    // |fx| <= mu fz, |fy| <= mu fz
    CI[fx][c + 2] = -1.;
    CI[fz][c + 2] = mu;
    CI[fx][c + 3] = 1.;
    CI[fz][c + 3] = mu;
    CI[fy][c + 4] = -1.;
    CI[fz][c + 4] = mu;
    CI[fy][c + 5] = 1.;
    CI[fz][c + 5] = mu;
  }

  double cost;
  try {
    cost = solve_quadprog(G, g0, CE, ce0, CI, ci0, z);
  } catch (const std::logic_error& e) {
    throw InfeasibleSolveError(std::string("QP solver failed: ") + e.what());
  }
  if (!std::isfinite(cost)) {
    throw InfeasibleSolveError("no foot forces satisfy the friction and "
                               "normal force limits");
  }

  fOpt.resize(_dim_opt);
  for (int i = 0; i < _dim_opt; i++) {
    fOpt[i] = T(z[i]);
  }
  if (!allFinite(fOpt)) {
    throw InfeasibleSolveError("QP returned non-finite foot forces");
  }
}

template class QPBalanceController<double>;
template class QPBalanceController<float>;
