#ifndef ORB_SIM_UTILS_HPP
#define ORB_SIM_UTILS_HPP

#include <cmath>

namespace orb_sim
{

// Separations below this are treated as coincident centers [m].
// Normalizing a shorter vector is not meaningful.
constexpr double kDegenerateDistance = 1e-12;

/// Radii, masses and timesteps: finite and strictly positive
inline bool isPositiveFinite(double value)
{
  return std::isfinite(value) && value > 0.0;
}

/// Restitution coefficients: finite and within [0, 1]
inline bool isUnitInterval(double value)
{
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

}  // namespace orb_sim

#endif  // ORB_SIM_UTILS_HPP
