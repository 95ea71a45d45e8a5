#ifndef ORB_SIM_VEC3D_BASE_HPP
#define ORB_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace orb_sim::detail
{

/**
 * @brief Shared storage and conversions for the 3-vector state types
 *
 * Coordinate, Velocity and Acceleration are distinct types so a position can
 * not be passed where a velocity is expected, yet all of them are plain
 * Eigen::Vector3d underneath and take part in Eigen expressions directly.
 * Any Eigen expression converts back implicitly, e.g.
 *
 *   Coordinate next = position + velocity * dt;
 *
 * @tparam Derived Concrete vector type
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{Eigen::Vector3d::Zero()}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename Expr>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<Expr>& expr) : Eigen::Vector3d{expr}
  {
  }

  template <typename Expr>
  Vec3DBase& operator=(const Eigen::MatrixBase<Expr>& expr)
  {
    Eigen::Vector3d::operator=(expr);
    return *this;
  }

  /**
   * @brief True when no component is NaN or infinite
   *
   * A single NaN never recovers under further arithmetic, so state vectors
   * are checked with this before they enter the simulation.
   */
  [[nodiscard]] bool isFinite() const
  {
    return this->allFinite();
  }
};

}  // namespace orb_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // ORB_SIM_VEC3D_BASE_HPP
