// Ticket: 0001_sphere_body_store

#ifndef ORB_SIM_PHYSICS_BODY_HPP
#define ORB_SIM_PHYSICS_BODY_HPP

#include <cstdint>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/RigidBody/InertialState.hpp"

namespace orb_sim
{

/**
 * @brief Dynamic, non-rotating sphere with radius and mass.
 *
 * A Body is a point mass with a collision radius. Radius and mass are fixed
 * at construction; only the inertial state (position, velocity) changes, and
 * only while a simulation step runs.
 *
 * Usage pattern:
 * @code
 * Body ball{0, Coordinate{0.0, 0.75, 0.0}, 0.04};  // unit mass
 * ball.getInertialState().velocity = Velocity{1.0, 0.0, 0.0};
 * @endcode
 *
 * @ticket 0001_sphere_body_store
 */
class Body
{
public:
  /// Mass assigned when none is given [kg]
  static constexpr double kDefaultMass = 1.0;

  /**
   * @brief Create a body at rest.
   *
   * @param instanceId Stable identifier (creation index within the store)
   * @param position Initial center [m]
   * @param radius Sphere radius [m]
   * @param mass Mass [kg]
   *
   * @throws std::invalid_argument if radius <= 0, mass <= 0, or any value
   *         is not finite
   */
  Body(uint32_t instanceId,
       const Coordinate& position,
       double radius,
       double mass = kDefaultMass);

  [[nodiscard]] uint32_t getInstanceId() const
  {
    return instanceId_;
  }

  [[nodiscard]] double getRadius() const
  {
    return radius_;
  }

  [[nodiscard]] double getMass() const
  {
    return mass_;
  }

  [[nodiscard]] double getInverseMass() const
  {
    return inverseMass_;
  }

  const InertialState& getInertialState() const
  {
    return state_;
  }

  InertialState& getInertialState()
  {
    return state_;
  }

  /**
   * @brief Translational kinetic energy 0.5 * m * |v|^2 [J]
   */
  [[nodiscard]] double getKineticEnergy() const;

  Body(const Body&) = default;
  Body& operator=(const Body&) = default;
  Body(Body&&) noexcept = default;
  Body& operator=(Body&&) noexcept = default;
  ~Body() = default;

private:
  uint32_t instanceId_;
  double radius_;
  double mass_;
  double inverseMass_;
  InertialState state_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_BODY_HPP
