// Ticket: 0002_gravity_integration

#ifndef ORB_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define ORB_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include "orb-sim/src/Physics/Integration/Integrator.hpp"

namespace orb_sim
{

/**
 * @brief Semi-implicit Euler integrator (symplectic)
 *
 * Integration order:
 * 1. Compute acceleration: a = F / m
 * 2. Update velocity: v_new = v_old + a * dt
 * 3. Update position: x_new = x_old + v_new * dt (uses NEW velocity)
 *
 * Properties:
 * - First-order accurate
 * - Symplectic (preserves phase space volume)
 * - Better energy conservation than explicit Euler
 *
 * @ticket 0002_gravity_integration
 */
class SemiImplicitEulerIntegrator : public Integrator
{
public:
  SemiImplicitEulerIntegrator() = default;
  ~SemiImplicitEulerIntegrator() override = default;

  void step(InertialState& state,
            const Coordinate& force,
            double mass,
            double dt) override;

  // Rule of Five
  SemiImplicitEulerIntegrator(const SemiImplicitEulerIntegrator&) = default;
  SemiImplicitEulerIntegrator& operator=(const SemiImplicitEulerIntegrator&) =
    default;
  SemiImplicitEulerIntegrator(SemiImplicitEulerIntegrator&&) noexcept = default;
  SemiImplicitEulerIntegrator& operator=(
    SemiImplicitEulerIntegrator&&) noexcept = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
