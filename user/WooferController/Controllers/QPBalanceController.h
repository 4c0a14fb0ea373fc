/*!
 * @file QPBalanceController.h
 * @brief Stance foot forces from a quadratic program
 *
 * The reference wrench comes from PD control of body position and
 * orientation plus gravity compensation.  Foot forces f of the stance feet
 * minimize
 *
 *   (A f - w)^T S (A f - w) + alpha |f|^2 + gamma |f - f_prev|^2
 *
 * subject to the friction pyramid and fz_min <= fz <= fz_max, where A maps
 * foot forces to the wrench about the center of mass.
 */

#ifndef WOOFER_QPBALANCECONTROLLER_H
#define WOOFER_QPBALANCECONTROLLER_H

#include <Goldfarb_Optimizer/QuadProg++.hh>

#include "Controllers/StanceForceController.h"
#include "Dynamics/Woofer.h"

template <typename T>
class QPBalanceController : public StanceForceController<T> {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  explicit QPBalanceController(const Woofer<T>& woofer) : _woofer(woofer) {}

  StanceControllerOutput<T> update(
      const RobotState<T>& state, const Vec12<T>& feetLocations,
      const Vec4<T>& activeFeet, const Vec3<T>& pRef, const Vec3<T>& rpyRef,
      const Vec12<T>& previousFootForces,
      const RobotControlParameters& robotParams,
      const QPControlParameters& qpParams) override;

  /*!
   * Wrench (force, moment) the stance feet should apply to the body
   */
  Vec6<T> referenceWrench(const RobotState<T>& state, const Vec3<T>& pRef,
                          const Vec3<T>& rpyRef,
                          const QPControlParameters& qpParams) const;

 private:
  void _SetupQP(int numStance);
  void _SolveQP(const DMat<T>& A, const Vec6<T>& wrench,
                const DVec<T>& fPrev, const QPControlParameters& qpParams,
                DVec<T>& fOpt);

  Woofer<T> _woofer;
  int _dim_opt = -1;
  int _dim_ieq_cstr = 0;

  GolDIdnani::GVect<double> z;
  GolDIdnani::GMatr<double> G;
  GolDIdnani::GVect<double> g0;
  GolDIdnani::GMatr<double> CE;
  GolDIdnani::GVect<double> ce0;
  GolDIdnani::GMatr<double> CI;
  GolDIdnani::GVect<double> ci0;
};

#endif  // WOOFER_QPBALANCECONTROLLER_H
