// Ticket: 0002_gravity_integration

#ifndef ORB_SIM_PHYSICS_INTEGRATOR_HPP
#define ORB_SIM_PHYSICS_INTEGRATOR_HPP

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/RigidBody/InertialState.hpp"

namespace orb_sim
{

/**
 * @brief Time-stepping scheme for a single body's translational state
 *
 * WorldModel sums the potential fields into a net force and hands it here
 * once per body per step. Contacts are resolved afterwards by the
 * RelaxationSolver and never pass through the integrator.
 *
 * Implementations hold no per-body state.
 *
 * @ticket 0002_gravity_integration
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Integrate state forward by one timestep
   * @param state Current inertial state (modified in place)
   * @param force Net force in world frame [N]
   * @param mass Body mass [kg]
   * @param dt Timestep [s]
   * @throws std::invalid_argument if dt is not finite and positive
   */
  virtual void step(InertialState& state,
                    const Coordinate& force,
                    double mass,
                    double dt) = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_INTEGRATOR_HPP
