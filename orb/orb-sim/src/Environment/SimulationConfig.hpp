// Ticket: 0008_world_model_api

#ifndef ORB_SIM_ENVIRONMENT_SIMULATION_CONFIG_HPP
#define ORB_SIM_ENVIRONMENT_SIMULATION_CONFIG_HPP

#include <cstdint>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/CollisionResponse.hpp"
#include "orb-sim/src/Physics/Constraints/RelaxationSolver.hpp"
#include "orb-sim/src/Physics/Constraints/SphericalBorder.hpp"
#include "orb-sim/src/Physics/PotentialEnergy/GravityPotential.hpp"

namespace orb_sim
{

/// @brief Tunables for a WorldModel session
///
/// Defaults reproduce the two-ball demo: y-up gravity, a 0.85 m border at
/// the origin, 0.95 restitution everywhere, three relaxation passes and a
/// 1 ms fixed timestep.
struct SimulationConfig
{
  Coordinate gravity{GravityPotential::kDefaultGravity};  ///< [m/s^2]
  SphericalBorder border{};  ///< Used until createBorder replaces it
  double restitution{CollisionResponse::kDefaultRestitution};  ///< Ball-ball
  RelaxationSolver::Config relaxation{};
  uint32_t ballSubdivisions{3};    ///< Icosphere level for addBall meshes
  double fixedTimestep{1.0e-3};    ///< Step size used by update() [s]
  int maxStepsPerUpdate{250};      ///< Cap on steps per update() call

  /// @throws std::invalid_argument naming the first invalid field
  void validate() const;
};

}  // namespace orb_sim

#endif  // ORB_SIM_ENVIRONMENT_SIMULATION_CONFIG_HPP
