// Ticket: 0002_gravity_integration

#include "orb-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

#include <stdexcept>
#include <string>

#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim
{

void SemiImplicitEulerIntegrator::step(InertialState& state,
                                       const Coordinate& force,
                                       double mass,
                                       double dt)
{
  if (!isPositiveFinite(dt))
  {
    throw std::invalid_argument("Timestep must be positive, got: " +
                                std::to_string(dt));
  }

  Acceleration const linearAccel{force / mass};
  state.acceleration = linearAccel;

  // ===== Semi-Implicit Euler Integration =====

  // Update velocity: v_new = v_old + a * dt
  state.velocity += linearAccel * dt;

  // Update position using NEW velocity: x_new = x_old + v_new * dt
  state.position += state.velocity * dt;
}

}  // namespace orb_sim
