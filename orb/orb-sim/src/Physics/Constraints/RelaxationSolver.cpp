// Ticket: 0005_gauss_seidel_relaxation

#include "orb-sim/src/Physics/Constraints/RelaxationSolver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "orb-sim/src/Physics/CollisionResponse.hpp"
#include "orb-sim/src/Physics/Constraints/BorderConstraint.hpp"

namespace orb_sim
{

void RelaxationSolver::Config::validate() const
{
  if (passCount < 1)
  {
    throw std::invalid_argument(
      "Relaxation pass count must be at least 1, got: " +
      std::to_string(passCount));
  }

  if (convergenceTolerance &&
      (!std::isfinite(*convergenceTolerance) || *convergenceTolerance < 0.0))
  {
    throw std::invalid_argument(
      "Convergence tolerance must be non-negative, got: " +
      std::to_string(*convergenceTolerance));
  }
}

RelaxationSolver::RelaxationSolver(const Config& config)
  : config_{config}
{
  config_.validate();
}

RelaxationSolver::SolveResult RelaxationSolver::solve(
  std::span<Body> bodies,
  const SphericalBorder& border,
  double restitution) const
{
  SolveResult result;

  for (int pass = 0; pass < config_.passCount; ++pass)
  {
    for (auto& body : bodies)
    {
      if (BorderConstraint::keepWithinBorder(body, border))
      {
        ++result.borderCorrections;
      }
    }

    for (size_t i = 0; i < bodies.size(); ++i)
    {
      for (size_t j = i + 1; j < bodies.size(); ++j)
      {
        if (CollisionResponse::collideWith(bodies[i], bodies[j], restitution))
        {
          ++result.pairResolutions;
        }
      }
    }

    ++result.passesRun;

    if (config_.convergenceTolerance)
    {
      result.maxResidualPenetration =
        computeMaxResidualPenetration(bodies, border);
      if (result.maxResidualPenetration < *config_.convergenceTolerance)
      {
        result.converged = true;
        return result;
      }
    }
  }

  if (!config_.convergenceTolerance)
  {
    result.maxResidualPenetration =
      computeMaxResidualPenetration(bodies, border);
  }

  return result;
}

double RelaxationSolver::computeMaxResidualPenetration(
  std::span<const Body> bodies,
  const SphericalBorder& border)
{
  double maxDepth = 0.0;

  for (size_t i = 0; i < bodies.size(); ++i)
  {
    maxDepth = std::max(
      maxDepth, BorderConstraint::residualPenetration(bodies[i], border));

    for (size_t j = i + 1; j < bodies.size(); ++j)
    {
      double const distance = (bodies[j].getInertialState().position -
                               bodies[i].getInertialState().position)
                                .norm();
      double const overlap =
        bodies[i].getRadius() + bodies[j].getRadius() - distance;
      maxDepth = std::max(maxDepth, overlap);
    }
  }

  return maxDepth;
}

}  // namespace orb_sim
