// Ticket: 0002_gravity_integration

#ifndef ORB_SIM_PHYSICS_POTENTIAL_ENERGY_HPP
#define ORB_SIM_PHYSICS_POTENTIAL_ENERGY_HPP

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/RigidBody/InertialState.hpp"

namespace orb_sim
{

/**
 * @brief Abstract interface for environmental potential energy fields
 *
 * Implementations supply the conservative force acting on a body,
 * F = -dV/dX, and the matching energy V used by the diagnostics.
 *
 * Fields act on every body alike and depend only on its state and mass;
 * contact forces are not modelled here. WorldModel sums all fields into the
 * net force handed to the Integrator.
 *
 * @ticket 0002_gravity_integration
 */
class PotentialEnergy
{
public:
  virtual ~PotentialEnergy() = default;

  /**
   * @brief Compute linear force from potential energy gradient
   * @param state Current inertial state
   * @param mass Body mass [kg]
   * @return Force F = -dV/dX [N]
   */
  virtual Coordinate computeForce(const InertialState& state,
                                  double mass) const = 0;

  /**
   * @brief Compute potential energy
   * @param state Current inertial state
   * @param mass Body mass [kg]
   * @return Potential energy V [J]
   */
  virtual double computeEnergy(const InertialState& state,
                               double mass) const = 0;

protected:
  PotentialEnergy() = default;
  PotentialEnergy(const PotentialEnergy&) = default;
  PotentialEnergy& operator=(const PotentialEnergy&) = default;
  PotentialEnergy(PotentialEnergy&&) noexcept = default;
  PotentialEnergy& operator=(PotentialEnergy&&) noexcept = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_POTENTIAL_ENERGY_HPP
