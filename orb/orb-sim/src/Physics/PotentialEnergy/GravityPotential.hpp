// Ticket: 0002_gravity_integration

#ifndef ORB_SIM_PHYSICS_GRAVITY_POTENTIAL_HPP
#define ORB_SIM_PHYSICS_GRAVITY_POTENTIAL_HPP

#include "orb-sim/src/Physics/PotentialEnergy/PotentialEnergy.hpp"

namespace orb_sim
{

/**
 * @brief Uniform gravitational field
 *
 * Constant force F = m * g regardless of position. The scene uses a y-up
 * convention, so the default field is (0, -9.8, 0).
 *
 * @ticket 0002_gravity_integration
 */
class GravityPotential : public PotentialEnergy
{
public:
  /// Default gravitational acceleration [m/s^2] (y-up)
  static inline const Coordinate kDefaultGravity{0.0, -9.8, 0.0};

  GravityPotential() = default;

  /**
   * @param gravityVector Gravitational acceleration [m/s^2]
   * @throws std::invalid_argument if any component is not finite
   */
  explicit GravityPotential(const Coordinate& gravityVector);

  ~GravityPotential() override = default;

  [[nodiscard]] Coordinate computeForce(const InertialState& state,
                                        double mass) const override;
  [[nodiscard]] double computeEnergy(const InertialState& state,
                                     double mass) const override;

  void setGravity(const Coordinate& gravityVector);
  [[nodiscard]] const Coordinate& getGravity() const;

  GravityPotential(const GravityPotential&) = default;
  GravityPotential& operator=(const GravityPotential&) = default;
  GravityPotential(GravityPotential&&) noexcept = default;
  GravityPotential& operator=(GravityPotential&&) noexcept = default;

private:
  Coordinate g_{kDefaultGravity};  // Gravitational acceleration [m/s^2]
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GRAVITY_POTENTIAL_HPP
