// Ticket: 0006_energy_diagnostics

#include "orb-sim/src/Diagnostics/EnergyTracker.hpp"

#include <algorithm>
#include <cmath>

#include "orb-sim/src/Physics/PotentialEnergy/PotentialEnergy.hpp"
#include "orb-sim/src/Physics/RigidBody/Body.hpp"

namespace orb_sim
{

EnergyTracker::BodyEnergy EnergyTracker::computeBodyEnergy(
  const Body& body,
  std::span<const std::unique_ptr<PotentialEnergy>> potentialEnergies)
{
  BodyEnergy result{};

  result.kineticE = body.getKineticEnergy();

  for (const auto& potential : potentialEnergies)
  {
    result.potentialE +=
      potential->computeEnergy(body.getInertialState(), body.getMass());
  }

  return result;
}

EnergyTracker::SystemEnergy EnergyTracker::computeSystemEnergy(
  std::span<const Body> bodies,
  std::span<const std::unique_ptr<PotentialEnergy>> potentialEnergies)
{
  SystemEnergy result{};

  for (const auto& body : bodies)
  {
    BodyEnergy const bodyEnergy = computeBodyEnergy(body, potentialEnergies);
    result.totalKineticE += bodyEnergy.kineticE;
    result.totalPotentialE += bodyEnergy.potentialE;
  }

  return result;
}

bool EnergyTracker::isEnergyInjection(double currentEnergy,
                                      double previousEnergy,
                                      double relativeTolerance,
                                      double absoluteTolerance)
{
  double const deltaE = currentEnergy - previousEnergy;

  if (deltaE <= 0.0)
  {
    return false;
  }

  double const threshold =
    std::max(relativeTolerance * std::abs(currentEnergy), absoluteTolerance);

  return deltaE > threshold;
}

}  // namespace orb_sim
