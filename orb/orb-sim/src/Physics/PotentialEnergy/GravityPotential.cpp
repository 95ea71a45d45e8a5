// Ticket: 0002_gravity_integration

#include "orb-sim/src/Physics/PotentialEnergy/GravityPotential.hpp"

#include <stdexcept>

namespace orb_sim
{

GravityPotential::GravityPotential(const Coordinate& gravityVector)
{
  setGravity(gravityVector);
}

Coordinate GravityPotential::computeForce(const InertialState& /* state */,
                                          double mass) const
{
  // Uniform field: force does not depend on position
  return g_ * mass;
}

double GravityPotential::computeEnergy(const InertialState& state,
                                       double mass) const
{
  // V = -m * g . r
  // With g = (0, -9.8, 0) a body at y = 0.75 holds +7.35 J per kg, and the
  // energy falls as the body descends.
  return -mass * g_.dot(state.position);
}

void GravityPotential::setGravity(const Coordinate& gravityVector)
{
  if (!gravityVector.isFinite())
  {
    throw std::invalid_argument("Gravity vector must be finite");
  }
  g_ = gravityVector;
}

const Coordinate& GravityPotential::getGravity() const
{
  return g_;
}

}  // namespace orb_sim
