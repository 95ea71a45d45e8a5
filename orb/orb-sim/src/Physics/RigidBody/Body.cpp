// Ticket: 0001_sphere_body_store

#include "orb-sim/src/Physics/RigidBody/Body.hpp"

#include <stdexcept>
#include <string>

#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim
{

Body::Body(uint32_t instanceId,
           const Coordinate& position,
           double radius,
           double mass)
  : instanceId_{instanceId},
    radius_{radius},
    mass_{mass},
    inverseMass_{0.0},
    state_{}
{
  if (!isPositiveFinite(radius))
  {
    throw std::invalid_argument("Body radius must be positive, got: " +
                                std::to_string(radius));
  }

  if (!isPositiveFinite(mass))
  {
    throw std::invalid_argument("Body mass must be positive, got: " +
                                std::to_string(mass));
  }

  if (!position.isFinite())
  {
    throw std::invalid_argument("Body position must be finite");
  }

  inverseMass_ = 1.0 / mass_;
  state_.position = position;
}

double Body::getKineticEnergy() const
{
  return 0.5 * mass_ * state_.velocity.squaredNorm();
}

}  // namespace orb_sim
