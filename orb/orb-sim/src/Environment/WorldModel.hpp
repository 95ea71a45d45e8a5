// Ticket: 0008_world_model_api

#ifndef ORB_SIM_WORLD_MODEL_HPP
#define ORB_SIM_WORLD_MODEL_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "orb-assets/src/Geometry.hpp"
#include "orb-sim/src/Diagnostics/EnergyTracker.hpp"
#include "orb-sim/src/Environment/Scene.hpp"
#include "orb-sim/src/Environment/SimulationConfig.hpp"
#include "orb-sim/src/Physics/Constraints/RelaxationSolver.hpp"
#include "orb-sim/src/Physics/Integration/Integrator.hpp"
#include "orb-sim/src/Physics/PotentialEnergy/PotentialEnergy.hpp"

namespace orb_sim
{

/**
 * @brief Driver-facing simulation of balls inside a spherical border
 *
 * Owns the scene, the potential fields, the integrator and the relaxation
 * solver. One logical tick (step) runs:
 * 1. Integrate every body once under the potential fields
 * 2. Relax border and ball-ball contacts for a configured number of passes
 * 3. Translate each dynamic mesh onto its body
 *
 * Bodies and decoration are added during setup. The first step seals the
 * scene.
 *
 * Usage pattern:
 * @code
 * WorldModel world;
 * world.createBorder(0.85, 5, Coordinate{0.0, 0.0, 0.0});
 * world.addBall(0.04, Coordinate{0.0, 0.75, 0.0}, orb_assets::kYellow);
 * while (running)
 * {
 *   world.step(1.0e-3);
 *   upload(world.dynamicVertices());
 * }
 * @endcode
 *
 * @note Not thread-safe: single-threaded simulation assumed.
 */
class WorldModel
{
public:
  /// Name of the logger created when none is injected
  static constexpr const char* kDefaultLoggerName = "orb-sim";

  /**
   * @brief Construct with default configuration and the default logger
   */
  WorldModel();

  /**
   * @brief Construct with explicit configuration
   * @param config Simulation tunables (validated)
   * @param logger Logger to report through; nullptr selects the shared
   *        "orb-sim" console logger
   * @throws std::invalid_argument if config is invalid
   */
  explicit WorldModel(SimulationConfig config,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~WorldModel() = default;

  WorldModel(const WorldModel&) = delete;
  WorldModel& operator=(const WorldModel&) = delete;
  WorldModel(WorldModel&&) noexcept = default;
  WorldModel& operator=(WorldModel&&) noexcept = default;

  // ========== Setup ==========

  /**
   * @brief Add a unit-mass ball at rest with its icosphere mesh
   * @return Handle of the new body
   * @throws std::logic_error after the first step
   * @throws std::invalid_argument if the ball cannot fit inside the border
   *         or its parameters are invalid
   */
  BodyHandle addBall(double radius,
                     const Coordinate& center,
                     const orb_assets::Color& color);

  /**
   * @brief Add a ball with an explicit mass
   */
  BodyHandle addBall(double radius,
                     const Coordinate& center,
                     const orb_assets::Color& color,
                     double mass);

  /**
   * @brief Give a ball an initial velocity
   * @throws std::logic_error after the first step
   * @throws std::out_of_range on an unknown handle
   * @throws std::invalid_argument if the velocity is not finite
   */
  void setInitialVelocity(BodyHandle handle, const Velocity& velocity);

  /**
   * @brief Set the physical border and add its static decoration
   *
   * The decoration is a translucent icosphere shell plus one ring around
   * each coordinate axis.
   *
   * @throws std::logic_error after the first step
   * @throws std::invalid_argument on an invalid radius or subdivision level
   */
  void createBorder(double radius,
                    uint32_t subdivisions,
                    const Coordinate& center);

  // ========== Simulation ==========

  /**
   * @brief Advance the simulation by one tick of length dt
   * @param dt Timestep [s]
   * @return Outcome of the relaxation loop
   * @throws std::invalid_argument if dt is not finite and positive
   */
  RelaxationSolver::SolveResult step(double dt);

  /**
   * @brief Advance to an absolute time using the fixed timestep
   *
   * Elapsed time since the previous call accumulates; whole fixed steps are
   * run out of it. At most maxStepsPerUpdate steps run per call and any
   * time beyond that is dropped.
   *
   * @param simTime Absolute time, non-decreasing across calls
   * @return Number of steps run
   * @throws std::invalid_argument if simTime is earlier than the last call
   */
  size_t update(std::chrono::milliseconds simTime);

  // ========== Accessors ==========

  /// Flattened static vertex buffer
  std::vector<orb_assets::Vertex> staticVertices() const;
  /// Flattened static index buffer
  std::vector<uint32_t> staticIndices() const;
  /// Flattened dynamic vertex buffer, current as of the last step
  std::vector<orb_assets::Vertex> dynamicVertices() const;
  /// Flattened dynamic index buffer
  std::vector<uint32_t> dynamicIndices() const;

  /**
   * @throws std::out_of_range on an unknown handle
   */
  const Body& getBody(BodyHandle handle) const;

  std::span<const Body> getBodies() const
  {
    return scene_.getBodyStore().bodies();
  }

  const Scene& getScene() const
  {
    return scene_;
  }

  const SimulationConfig& getConfig() const
  {
    return config_;
  }

  const SphericalBorder& getBorder() const
  {
    return config_.border;
  }

  /// Simulated time accumulated by all steps [s]
  [[nodiscard]] double getTime() const
  {
    return simulatedTime_;
  }

  /// Number of steps run
  [[nodiscard]] uint64_t getFrameCount() const
  {
    return frameCount_;
  }

  const RelaxationSolver::SolveResult& getLastSolveResult() const
  {
    return lastSolve_;
  }

  /**
   * @brief Kinetic and potential energy of all bodies
   */
  EnergyTracker::SystemEnergy computeSystemEnergy() const;

private:
  /// Apply the potential fields and integrate each body once
  void integrateBodies(double dt);

  void requireSetupOpen(const char* operation) const;

  std::shared_ptr<spdlog::logger> logger_;
  SimulationConfig config_;
  Scene scene_;

  std::vector<std::unique_ptr<PotentialEnergy>> potentials_;
  std::unique_ptr<Integrator> integrator_;
  RelaxationSolver solver_;
  RelaxationSolver::SolveResult lastSolve_{};

  //! Absolute time passed to the last update() call
  std::chrono::milliseconds time_{0};
  //! Time received by update() not yet consumed by fixed steps [s]
  double accumulator_{0.0};

  double simulatedTime_{0.0};
  uint64_t frameCount_{0};
};

}  // namespace orb_sim

#endif  // ORB_SIM_WORLD_MODEL_HPP
