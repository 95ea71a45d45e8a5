#ifndef ORB_SIM_INERTIAL_STATE_HPP
#define ORB_SIM_INERTIAL_STATE_HPP

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"

namespace orb_sim
{

/**
 * @brief Linear kinematic state of a non-rotating body.
 *
 * Bodies carry no orientation: spheres without rotational dynamics are fully
 * described by their center, its rate, and the last applied acceleration.
 *
 * Mutated only during a simulation step by the integrator, the border
 * constraint and the pairwise collision response.
 */
struct InertialState
{
  Coordinate position;
  Velocity velocity;
  Acceleration acceleration;  // Last integrated acceleration (diagnostic)
};

}  // namespace orb_sim

#endif  // ORB_SIM_INERTIAL_STATE_HPP
