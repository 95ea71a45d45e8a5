// Ticket: 0008_world_model_api

#include "orb-sim/src/Environment/SimulationConfig.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "orb-assets/src/GeometryFactory.hpp"
#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim
{

void SimulationConfig::validate() const
{
  if (!gravity.isFinite())
  {
    throw std::invalid_argument("Gravity vector must be finite");
  }

  border.validate();

  if (!isUnitInterval(restitution))
  {
    throw std::invalid_argument("Restitution must be in [0, 1], got: " +
                                std::to_string(restitution));
  }

  relaxation.validate();

  if (ballSubdivisions > orb_assets::GeometryFactory::kMaxSubdivisions)
  {
    throw std::invalid_argument("Ball subdivisions must be at most " +
                                std::to_string(
                                  orb_assets::GeometryFactory::kMaxSubdivisions) +
                                ", got: " + std::to_string(ballSubdivisions));
  }

  if (!isPositiveFinite(fixedTimestep))
  {
    throw std::invalid_argument("Fixed timestep must be positive, got: " +
                                std::to_string(fixedTimestep));
  }

  if (maxStepsPerUpdate < 1)
  {
    throw std::invalid_argument("Max steps per update must be at least 1, got: " +
                                std::to_string(maxStepsPerUpdate));
  }
}

}  // namespace orb_sim
