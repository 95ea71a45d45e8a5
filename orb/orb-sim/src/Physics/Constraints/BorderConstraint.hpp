// Ticket: 0004_spherical_border

#ifndef ORB_SIM_PHYSICS_BORDER_CONSTRAINT_HPP
#define ORB_SIM_PHYSICS_BORDER_CONSTRAINT_HPP

#include "orb-sim/src/Physics/Constraints/SphericalBorder.hpp"
#include "orb-sim/src/Physics/RigidBody/Body.hpp"

namespace orb_sim
{

/// @brief Confinement of a single body to the spherical border
///
/// Algorithm, for d = |x - c| and n = (x - c) / d:
/// 1. If d + r <= R the body is inside: nothing to do
/// 2. Reposition onto the inner surface: x = c + n * (R - r)
/// 3. Mirror the velocity across the tangent plane: v -= 2 (v . n) n
/// 4. Damp the whole velocity: v *= e
///
/// Steps 2-4 run for every penetrating body, whichever way it is moving.
/// Overshoot below 1e-12 m, the round-off of a previous reposition, does
/// not count as penetration.
///
/// @ticket 0004_spherical_border
namespace BorderConstraint
{

/// @brief Enforce containment for one body
/// @return true if the body penetrated the border and was corrected
/// @note A body whose center sits on the border center has no defined
///       normal and is left alone
bool keepWithinBorder(Body& body, const SphericalBorder& border);

/// @brief Depth by which the body currently pokes through the border [m]
/// @return max(0, |x - c| + r - R)
double residualPenetration(const Body& body, const SphericalBorder& border);

}  // namespace BorderConstraint

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_BORDER_CONSTRAINT_HPP
