#ifndef ORB_SIM_COORDINATE_HPP
#define ORB_SIM_COORDINATE_HPP

#include "orb-sim/src/DataTypes/Vec3DBase.hpp"
#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace orb_sim
{

/**
 * @brief 3D position vector type [m] in world space
 *
 * Used for body positions, mesh centers, border centers and any other point
 * in world space. Thin wrapper around Vec3DBase: full Eigen expression
 * compatibility plus std::format support for log output.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace orb_sim

template <>
struct std::formatter<orb_sim::Coordinate>
  : orb_sim::detail::Vec3FormatterBase<orb_sim::Coordinate>
{
};

#endif  // ORB_SIM_COORDINATE_HPP
