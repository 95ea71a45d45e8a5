// Ticket: 0004_spherical_border

#include "orb-sim/src/Physics/Constraints/BorderConstraint.hpp"

#include <algorithm>

#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim::BorderConstraint
{

namespace
{

// Overshoot left by rounding c + n * (R - r) is not a new contact [m]
constexpr double kRepositionSlack = 1.0e-12;

}  // namespace

bool keepWithinBorder(Body& body, const SphericalBorder& border)
{
  auto& state = body.getInertialState();

  Coordinate const offset = state.position - border.center;
  double const distance = offset.norm();

  if (distance + body.getRadius() <= border.radius + kRepositionSlack)
  {
    return false;
  }

  if (distance < kDegenerateDistance)
  {
    return false;
  }

  Coordinate const normal{offset / distance};

  state.position = border.center + normal * (border.radius - body.getRadius());

  // Mirror across the tangent plane, then damp the whole velocity
  state.velocity -= normal * (2.0 * state.velocity.dot(normal));
  state.velocity *= border.restitution;

  return true;
}

double residualPenetration(const Body& body, const SphericalBorder& border)
{
  double const distance =
    (body.getInertialState().position - border.center).norm();
  return std::max(0.0, distance + body.getRadius() - border.radius);
}

}  // namespace orb_sim::BorderConstraint
