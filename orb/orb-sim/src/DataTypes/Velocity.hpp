#ifndef ORB_SIM_VELOCITY_HPP
#define ORB_SIM_VELOCITY_HPP

#include "orb-sim/src/DataTypes/Vec3DBase.hpp"
#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace orb_sim
{

/**
 * @brief 3D linear velocity vector type [m/s]
 *
 * Thin wrapper around Vec3DBase: full Eigen expression compatibility plus
 * std::format support for log output.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Velocity final : detail::Vec3DBase<Velocity>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Velocity(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace orb_sim

template <>
struct std::formatter<orb_sim::Velocity>
  : orb_sim::detail::Vec3FormatterBase<orb_sim::Velocity>
{
};

#endif  // ORB_SIM_VELOCITY_HPP
