// Ticket: 0004_spherical_border

#ifndef ORB_SIM_PHYSICS_SPHERICAL_BORDER_HPP
#define ORB_SIM_PHYSICS_SPHERICAL_BORDER_HPP

#include <cmath>
#include <stdexcept>
#include <string>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim
{

/// @brief Spherical container confining every body in the scene
///
/// Bodies are kept inside the ball of `radius` around `center`. On contact
/// the outward velocity component is mirrored and the whole velocity is
/// scaled by `restitution`.
///
/// @ticket 0004_spherical_border
struct SphericalBorder
{
  Coordinate center{0.0, 0.0, 0.0};  ///< Border center [m]
  double radius{0.85};               ///< Inner radius [m]
  double restitution{0.95};          ///< Velocity scale on contact [0, 1]

  /// @throws std::invalid_argument on a non-positive or non-finite radius,
  ///         restitution outside [0, 1], or a non-finite center
  void validate() const
  {
    if (!isPositiveFinite(radius))
    {
      throw std::invalid_argument("Border radius must be positive, got: " +
                                  std::to_string(radius));
    }
    if (!isUnitInterval(restitution))
    {
      throw std::invalid_argument(
        "Border restitution must be in [0, 1], got: " +
        std::to_string(restitution));
    }
    if (!center.isFinite())
    {
      throw std::invalid_argument("Border center must be finite");
    }
  }
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_SPHERICAL_BORDER_HPP
