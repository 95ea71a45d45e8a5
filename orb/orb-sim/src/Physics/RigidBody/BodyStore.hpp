// Ticket: 0001_sphere_body_store

#ifndef ORB_SIM_PHYSICS_BODY_STORE_HPP
#define ORB_SIM_PHYSICS_BODY_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "orb-sim/src/Physics/RigidBody/Body.hpp"

namespace orb_sim
{

/// Index of a body within its BodyStore. Stable for the session.
using BodyHandle = uint32_t;

/**
 * @brief Ordered, append-only collection of bodies.
 *
 * Handles are creation indices and never change: there is no removal, and
 * bodies are only appended during scene setup. Iteration order is creation
 * order, which is also the order the relaxation loop visits bodies in.
 *
 * @note References returned by get() are invalidated by add(); hold
 *       handles, not references, across setup calls.
 */
class BodyStore
{
public:
  BodyStore() = default;

  /**
   * @brief Append a body at rest with unit mass
   * @return Handle of the new body
   * @throws std::invalid_argument on invalid radius or position
   */
  BodyHandle add(const Coordinate& position, double radius);

  /**
   * @brief Append a body at rest with an explicit mass
   * @return Handle of the new body
   * @throws std::invalid_argument on invalid radius, mass or position
   */
  BodyHandle add(const Coordinate& position, double radius, double mass);

  /**
   * @throws std::out_of_range if handle does not name a body
   */
  const Body& get(BodyHandle handle) const;
  Body& get(BodyHandle handle);

  [[nodiscard]] size_t size() const
  {
    return bodies_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return bodies_.empty();
  }

  std::span<Body> bodies()
  {
    return bodies_;
  }

  std::span<const Body> bodies() const
  {
    return bodies_;
  }

  auto begin()
  {
    return bodies_.begin();
  }
  auto end()
  {
    return bodies_.end();
  }
  auto begin() const
  {
    return bodies_.begin();
  }
  auto end() const
  {
    return bodies_.end();
  }

private:
  std::vector<Body> bodies_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_BODY_STORE_HPP
