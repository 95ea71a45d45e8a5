// Ticket: 0008_world_model_api

#include "orb-sim/src/Environment/WorldModel.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "orb-assets/src/GeometryFactory.hpp"
#include "orb-sim/src/Environment/GeometrySync.hpp"
#include "orb-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"
#include "orb-sim/src/Physics/PotentialEnergy/GravityPotential.hpp"
#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim
{

namespace
{

// Decoration around the border
constexpr orb_assets::Color kBorderShellColor{1.0f, 1.0f, 1.0f, 0.15f};
constexpr orb_assets::Color kBorderRingColor{0.8f, 0.8f, 0.8f, 0.6f};
constexpr uint32_t kBorderRingSegments = 128;
constexpr double kBorderRingWidthFraction = 0.01;

// Accumulated time within this of a whole step still runs that step [s]
constexpr double kAccumulatorSlack = 1.0e-9;

std::shared_ptr<spdlog::logger> resolveLogger(
  std::shared_ptr<spdlog::logger> logger)
{
  if (logger)
  {
    return logger;
  }

  if (auto existing = spdlog::get(WorldModel::kDefaultLoggerName))
  {
    return existing;
  }

  return spdlog::stdout_color_mt(WorldModel::kDefaultLoggerName);
}

}  // namespace

WorldModel::WorldModel()
  : WorldModel{SimulationConfig{}}
{
}

WorldModel::WorldModel(SimulationConfig config,
                       std::shared_ptr<spdlog::logger> logger)
  : logger_{resolveLogger(std::move(logger))},
    config_{std::move(config)},
    scene_{},
    potentials_{},
    integrator_{std::make_unique<SemiImplicitEulerIntegrator>()},
    solver_{}
{
  config_.validate();
  solver_ = RelaxationSolver{config_.relaxation};
  potentials_.push_back(std::make_unique<GravityPotential>(config_.gravity));

  logger_->debug(
    "WorldModel configured: gravity {}, border radius {}, {} relaxation passes",
    std::format("{}", config_.gravity),
    config_.border.radius,
    config_.relaxation.passCount);
}

// ========== Setup ==========

BodyHandle WorldModel::addBall(double radius,
                               const Coordinate& center,
                               const orb_assets::Color& color)
{
  return addBall(radius, center, color, Body::kDefaultMass);
}

BodyHandle WorldModel::addBall(double radius,
                               const Coordinate& center,
                               const orb_assets::Color& color,
                               double mass)
{
  requireSetupOpen("addBall");

  if (radius >= config_.border.radius)
  {
    throw std::invalid_argument("Ball radius " + std::to_string(radius) +
                                " does not fit inside border of radius " +
                                std::to_string(config_.border.radius));
  }

  // Validate the body before paying for tessellation
  Body const probe{0, center, radius, mass};

  auto mesh = orb_assets::GeometryFactory::createSphere(
    radius, config_.ballSubdivisions, center, color);

  BodyHandle const handle =
    scene_.addBody(center, probe.getRadius(), probe.getMass(), std::move(mesh));

  logger_->info("Added ball {} (radius {}, mass {}) at {}",
                handle,
                radius,
                mass,
                std::format("{}", center));

  return handle;
}

void WorldModel::setInitialVelocity(BodyHandle handle,
                                    const Velocity& velocity)
{
  requireSetupOpen("setInitialVelocity");

  if (!velocity.isFinite())
  {
    throw std::invalid_argument("Initial velocity must be finite");
  }

  scene_.getBodyStore().get(handle).getInertialState().velocity = velocity;
}

void WorldModel::createBorder(double radius,
                              uint32_t subdivisions,
                              const Coordinate& center)
{
  requireSetupOpen("createBorder");

  SphericalBorder border{center, radius, config_.border.restitution};
  border.validate();

  for (const auto& body : scene_.getBodyStore())
  {
    if (body.getRadius() >= radius)
    {
      throw std::invalid_argument(
        "Border radius " + std::to_string(radius) +
        " cannot contain existing ball " +
        std::to_string(body.getInstanceId()));
    }
  }

  // Generate all decoration before touching the scene
  auto shell = orb_assets::GeometryFactory::createSphere(
    radius, subdivisions, center, kBorderShellColor);

  std::vector<orb_assets::MeshData> rings;
  std::array<Eigen::Vector3d, 3> const axes{
    Eigen::Vector3d::UnitX(), Eigen::Vector3d::UnitY(), Eigen::Vector3d::UnitZ()};
  for (const auto& axis : axes)
  {
    rings.push_back(orb_assets::GeometryFactory::createRing(
      radius * (1.0 - kBorderRingWidthFraction),
      radius,
      kBorderRingSegments,
      center,
      axis,
      kBorderRingColor));
  }

  scene_.addStaticMesh(std::move(shell), center);
  for (auto& ring : rings)
  {
    scene_.addStaticMesh(std::move(ring), center);
  }

  config_.border = border;

  logger_->info("Border set: radius {} at {} ({} static meshes)",
                radius,
                std::format("{}", center),
                scene_.getStaticBuffer().size());
}

void WorldModel::requireSetupOpen(const char* operation) const
{
  if (scene_.isSealed())
  {
    throw std::logic_error(std::string{operation} +
                           " called after the simulation started");
  }
}

// ========== Simulation ==========

RelaxationSolver::SolveResult WorldModel::step(double dt)
{
  if (!isPositiveFinite(dt))
  {
    throw std::invalid_argument("Timestep must be positive, got: " +
                                std::to_string(dt));
  }

  if (!scene_.isSealed())
  {
    scene_.seal();
    logger_->info("Simulation started with {} bodies",
                  scene_.getBodyStore().size());
  }

  integrateBodies(dt);

  lastSolve_ = solver_.solve(
    scene_.getBodyStore().bodies(), config_.border, config_.restitution);

  GeometrySync::syncGeometry(scene_.getBodyStore().bodies(),
                             scene_.getDynamicBuffer().getMeshes());

  ++frameCount_;
  simulatedTime_ += dt;

  logger_->trace(
    "Frame {}: {} passes, {} border / {} pair corrections, residual {}",
    frameCount_,
    lastSolve_.passesRun,
    lastSolve_.borderCorrections,
    lastSolve_.pairResolutions,
    lastSolve_.maxResidualPenetration);

  return lastSolve_;
}

size_t WorldModel::update(std::chrono::milliseconds simTime)
{
  if (simTime < time_)
  {
    throw std::invalid_argument(
      "Simulation time went backwards: " + std::to_string(simTime.count()) +
      " ms after " + std::to_string(time_.count()) + " ms");
  }

  accumulator_ +=
    std::chrono::duration<double>(simTime - time_).count();
  time_ = simTime;

  size_t steps = 0;
  auto const maxSteps = static_cast<size_t>(config_.maxStepsPerUpdate);

  while (accumulator_ + kAccumulatorSlack >= config_.fixedTimestep &&
         steps < maxSteps)
  {
    step(config_.fixedTimestep);
    accumulator_ = std::max(0.0, accumulator_ - config_.fixedTimestep);
    ++steps;
  }

  if (accumulator_ + kAccumulatorSlack >= config_.fixedTimestep)
  {
    logger_->warn("Dropping {:.4f} s of simulation time after {} steps",
                  accumulator_,
                  steps);
    accumulator_ = 0.0;
  }

  return steps;
}

void WorldModel::integrateBodies(double dt)
{
  for (auto& body : scene_.getBodyStore())
  {
    auto& state = body.getInertialState();

    Coordinate netForce{0.0, 0.0, 0.0};
    for (const auto& potential : potentials_)
    {
      netForce += potential->computeForce(state, body.getMass());
    }

    integrator_->step(state, netForce, body.getMass(), dt);
  }
}

// ========== Accessors ==========

std::vector<orb_assets::Vertex> WorldModel::staticVertices() const
{
  return scene_.getStaticBuffer().flattenVertices();
}

std::vector<uint32_t> WorldModel::staticIndices() const
{
  return scene_.getStaticBuffer().flattenIndices();
}

std::vector<orb_assets::Vertex> WorldModel::dynamicVertices() const
{
  return scene_.getDynamicBuffer().flattenVertices();
}

std::vector<uint32_t> WorldModel::dynamicIndices() const
{
  return scene_.getDynamicBuffer().flattenIndices();
}

const Body& WorldModel::getBody(BodyHandle handle) const
{
  return scene_.getBodyStore().get(handle);
}

EnergyTracker::SystemEnergy WorldModel::computeSystemEnergy() const
{
  return EnergyTracker::computeSystemEnergy(getBodies(), potentials_);
}

}  // namespace orb_sim
