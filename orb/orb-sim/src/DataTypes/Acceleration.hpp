#ifndef ORB_SIM_ACCELERATION_HPP
#define ORB_SIM_ACCELERATION_HPP

#include "orb-sim/src/DataTypes/Vec3DBase.hpp"
#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace orb_sim
{

/**
 * @brief 3D linear acceleration vector type [m/s^2]
 *
 * Stored on the body state as the last integrated acceleration; it is
 * diagnostic only and never fed back into the integrator.
 */
struct Acceleration final : detail::Vec3DBase<Acceleration>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Acceleration(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace orb_sim

template <>
struct std::formatter<orb_sim::Acceleration>
  : orb_sim::detail::Vec3FormatterBase<orb_sim::Acceleration>
{
};

#endif  // ORB_SIM_ACCELERATION_HPP
