/*! @file LegKinematics.h
 *  @brief Kinematics of the ab/ad - hip - knee legs of Woofer
 *
 *  Per-leg quantities are in the hip frame of the leg.  Whole-robot forward
 *  kinematics returns, for each leg, the vector from the center of mass to
 *  the foot expressed in the world frame.
 */

#ifndef WOOFER_LEGKINEMATICS_H
#define WOOFER_LEGKINEMATICS_H

#include "Dynamics/LegLayout.h"
#include "Dynamics/Woofer.h"
#include "cppTypes.h"

/*!
 * Forward kinematics used by the control loop to find the lever arms of the
 * feet.  Implementations must be pure.
 */
template <typename T>
class LegKinematics {
 public:
  virtual ~LegKinematics() = default;

  /*!
   * @param jointAngles : 12 joint angles in leg order
   * @param orientation : body orientation quaternion [w x y z]
   * @return 12-vector of COM-to-foot vectors in the world frame
   */
  virtual Vec12<T> forward(const Vec12<T>& jointAngles,
                           const Quat<T>& orientation) const = 0;
};

/*!
 * Forward kinematics of the Woofer legs
 */
template <typename T>
class WooferLegKinematics : public LegKinematics<T> {
 public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  explicit WooferLegKinematics(const Woofer<T>& woofer) : _woofer(woofer) {}

  Vec12<T> forward(const Vec12<T>& jointAngles,
                   const Quat<T>& orientation) const override;

  /*!
   * COM-to-foot vectors in the body frame
   */
  Vec12<T> footPositionsBody(const Vec12<T>& jointAngles) const;

  const Woofer<T>& woofer() const { return _woofer; }

 private:
  Woofer<T> _woofer;
};

/*!
 * Compute the position of the foot and its Jacobian.  This is done in the
 * local leg coordinate system.  If J/p are NULL, the calculation will be
 * skipped.
 */
template <typename T>
void computeLegJacobianAndPosition(const Woofer<T>& woofer, const Vec3<T>& q,
                                   Mat3<T>* J, Vec3<T>* p, int leg);

/*!
 * Joint torques of one leg in stance.  f is the ground reaction force on the
 * foot in the world frame, so the leg has to push with -f.
 */
template <typename T>
Vec3<T> footForceToJointTorque(const Mat3<T>& J, const RotMat<T>& rBody,
                               const Vec3<T>& f);

#endif  // WOOFER_LEGKINEMATICS_H
