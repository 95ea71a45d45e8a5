// Ticket: 0001_sphere_body_store

#include "orb-sim/src/Physics/RigidBody/BodyStore.hpp"

#include <stdexcept>
#include <string>

namespace orb_sim
{

BodyHandle BodyStore::add(const Coordinate& position, double radius)
{
  return add(position, radius, Body::kDefaultMass);
}

BodyHandle BodyStore::add(const Coordinate& position,
                          double radius,
                          double mass)
{
  auto const handle = static_cast<BodyHandle>(bodies_.size());
  // Body validates its own parameters; nothing is appended on failure
  bodies_.emplace_back(handle, position, radius, mass);
  return handle;
}

const Body& BodyStore::get(BodyHandle handle) const
{
  if (handle >= bodies_.size())
  {
    throw std::out_of_range("Invalid body handle: " + std::to_string(handle));
  }
  return bodies_[handle];
}

Body& BodyStore::get(BodyHandle handle)
{
  if (handle >= bodies_.size())
  {
    throw std::out_of_range("Invalid body handle: " + std::to_string(handle));
  }
  return bodies_[handle];
}

}  // namespace orb_sim
