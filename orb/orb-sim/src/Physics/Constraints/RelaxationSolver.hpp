// Ticket: 0005_gauss_seidel_relaxation

#ifndef ORB_SIM_PHYSICS_RELAXATION_SOLVER_HPP
#define ORB_SIM_PHYSICS_RELAXATION_SOLVER_HPP

#include <cstddef>
#include <optional>
#include <span>

#include "orb-sim/src/Physics/Constraints/SphericalBorder.hpp"
#include "orb-sim/src/Physics/RigidBody/Body.hpp"

namespace orb_sim
{

/// @brief Iterative contact relaxation over border and body pairs
///
/// Resolving one contact can create or deepen another, so a single sweep
/// is not enough for stacked or clustered balls. Each pass:
/// 1. Border constraint on every body, in store order
/// 2. Pairwise response on every pair (i, j), j > i, ascending
///
/// Bodies are mutated in place (Gauss-Seidel): later checks in the same
/// pass see corrections from earlier ones.
///
/// The loop runs a fixed number of passes. When a convergence tolerance is
/// configured it stops as soon as the largest remaining penetration drops
/// below it.
///
/// @ticket 0005_gauss_seidel_relaxation
class RelaxationSolver
{
public:
  /// @brief Configuration parameters for the relaxation loop
  struct Config
  {
    int passCount{3};  ///< Passes per step (>= 1)
    std::optional<double> convergenceTolerance{};  ///< Early exit depth [m]

    /// @throws std::invalid_argument if passCount < 1 or the tolerance is
    ///         negative or not finite
    void validate() const;
  };

  /// @brief Outcome of one relaxation loop
  struct SolveResult
  {
    int passesRun{0};
    double maxResidualPenetration{0.0};  ///< After the last pass [m]
    size_t borderCorrections{0};         ///< Summed over all passes
    size_t pairResolutions{0};           ///< Summed over all passes
    bool converged{false};  ///< Early exit taken (tolerance configured)
  };

  RelaxationSolver() = default;

  /// @throws std::invalid_argument on invalid config
  explicit RelaxationSolver(const Config& config);

  ~RelaxationSolver() = default;

  /// @brief Run the relaxation loop over all bodies
  /// @param bodies Bodies in store order (mutated in place)
  /// @param border Spherical container
  /// @param restitution Ball-ball coefficient of restitution [0, 1]
  SolveResult solve(std::span<Body> bodies,
                    const SphericalBorder& border,
                    double restitution) const;

  /// @brief Largest border or pair penetration among the bodies [m]
  static double computeMaxResidualPenetration(std::span<const Body> bodies,
                                              const SphericalBorder& border);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  RelaxationSolver(const RelaxationSolver&) = default;
  RelaxationSolver& operator=(const RelaxationSolver&) = default;
  RelaxationSolver(RelaxationSolver&&) noexcept = default;
  RelaxationSolver& operator=(RelaxationSolver&&) noexcept = default;

private:
  Config config_{};
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_RELAXATION_SOLVER_HPP
