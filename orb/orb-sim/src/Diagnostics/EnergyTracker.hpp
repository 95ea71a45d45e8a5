// Ticket: 0006_energy_diagnostics

#ifndef ORB_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP
#define ORB_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP

#include <memory>
#include <span>

namespace orb_sim
{

// Forward declaration
class Body;
class PotentialEnergy;

/**
 * @brief Energy computation utility for simulation diagnostics
 *
 * Provides static methods to compute kinetic and potential energy for
 * individual bodies and the whole scene. Bodies do not rotate, so kinetic
 * energy is purely translational.
 *
 * Contacts dissipate energy (restitution < 1); a rise in total energy
 * between frames beyond round-off points at a solver or integrator defect.
 *
 * @ticket 0006_energy_diagnostics
 */
class EnergyTracker
{
public:
  /**
   * @brief Per-body energy breakdown
   */
  struct BodyEnergy
  {
    double kineticE{0.0};    // Translational kinetic energy [J]
    double potentialE{0.0};  // Potential energy [J]

    [[nodiscard]] double total() const
    {
      return kineticE + potentialE;
    }
  };

  /**
   * @brief System-level energy summary
   */
  struct SystemEnergy
  {
    double totalKineticE{0.0};    // Sum of all body KE [J]
    double totalPotentialE{0.0};  // Sum of all body PE [J]

    /**
     * @brief Total system mechanical energy
     * @return totalKineticE + totalPotentialE [J]
     */
    [[nodiscard]] double total() const
    {
      return totalKineticE + totalPotentialE;
    }
  };

  /**
   * @brief Compute energy for a single body
   *
   * @param body Body to evaluate
   * @param potentialEnergies Potential energy fields to evaluate
   */
  static BodyEnergy computeBodyEnergy(
    const Body& body,
    std::span<const std::unique_ptr<PotentialEnergy>> potentialEnergies);

  /**
   * @brief Compute total system energy across all bodies
   *
   * @param bodies All bodies in the scene
   * @param potentialEnergies Potential energy fields to evaluate
   */
  static SystemEnergy computeSystemEnergy(
    std::span<const Body> bodies,
    std::span<const std::unique_ptr<PotentialEnergy>> potentialEnergies);

  /**
   * @brief Check if energy change exceeds tolerance (anomaly detection)
   *
   * Uses the larger of relative and absolute tolerance:
   * - Relative: relativeTolerance * |currentEnergy|
   * - Absolute: absoluteTolerance
   *
   * Energy decrease is never flagged (dissipation is physical).
   *
   * @param currentEnergy Current total system energy [J]
   * @param previousEnergy Previous total system energy [J]
   * @param relativeTolerance Relative tolerance (default 1e-6)
   * @param absoluteTolerance Absolute tolerance [J] (default 1e-9)
   * @return true if energy increased beyond tolerance
   */
  static bool isEnergyInjection(double currentEnergy,
                                double previousEnergy,
                                double relativeTolerance = 1e-6,
                                double absoluteTolerance = 1e-9);
};

}  // namespace orb_sim

#endif  // ORB_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP
