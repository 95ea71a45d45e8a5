// Ticket: 0009_step_throughput_bench
//
// Shared multi-ball scenario setup for the benchmarks. Every scenario lives
// inside the default 0.85 m border at the origin.

#pragma once

#include <chrono>
#include <cmath>
#include <memory>
#include <random>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "orb-assets/src/Geometry.hpp"
#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"
#include "orb-sim/src/Environment/WorldModel.hpp"

namespace orb_sim::bench
{

// ============================================================================
// Constants
// ============================================================================

constexpr double kBorderRadius = 0.85;       // [m]
constexpr double kBallRadius = 0.02;         // [m]
constexpr double kLatticeSpacing = 0.05;     // Center spacing [m]
constexpr unsigned int kRandomSeed = 42;     // Fixed seed for reproducibility

// ============================================================================
// Setup struct
// ============================================================================

inline std::shared_ptr<spdlog::logger> makeQuietLogger()
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("orb-bench", sink);
}

// Owns the WorldModel and the simulation clock for a scenario.
struct MultiBodySetup
{
  WorldModel world{SimulationConfig{}, makeQuietLogger()};
  std::chrono::milliseconds simTime{0};

  // Each frame advances 16 ms, i.e. 16 fixed steps
  void stepFrames(int frames)
  {
    for (int f = 0; f < frames; ++f)
    {
      simTime += std::chrono::milliseconds{16};
      world.update(simTime);
    }
  }
};

// ============================================================================
// Scenario setup functions
// ============================================================================

// N balls on a cubic lattice around the center with random velocities.
// Dense ball-ball contact from the first frames on.
inline void setupLatticeBurst(MultiBodySetup& setup, int numBodies)
{
  setup.world.createBorder(kBorderRadius, 2, Coordinate{0.0, 0.0, 0.0});

  int const side = static_cast<int>(std::ceil(std::cbrt(numBodies)));
  double const offset = -static_cast<double>(side - 1) * kLatticeSpacing / 2.0;

  std::mt19937 rng{kRandomSeed};
  std::uniform_real_distribution<double> velDist{-1.0, 1.0};

  int spawned = 0;
  for (int i = 0; i < side && spawned < numBodies; ++i)
  {
    for (int j = 0; j < side && spawned < numBodies; ++j)
    {
      for (int k = 0; k < side && spawned < numBodies; ++k)
      {
        Coordinate const center{offset + i * kLatticeSpacing,
                                offset + j * kLatticeSpacing,
                                offset + k * kLatticeSpacing};
        auto const handle =
          setup.world.addBall(kBallRadius, center, orb_assets::kWhite);
        setup.world.setInitialVelocity(
          handle, Velocity{velDist(rng), velDist(rng), velDist(rng)});
        ++spawned;
      }
    }
  }
}

// N balls dropped from a column near the top of the border.
// Mostly border contact with occasional stacking at the bottom.
inline void setupColumnDrop(MultiBodySetup& setup, int numBodies)
{
  setup.world.createBorder(kBorderRadius, 2, Coordinate{0.0, 0.0, 0.0});

  std::mt19937 rng{kRandomSeed};
  std::uniform_real_distribution<double> jitter{-0.01, 0.01};

  double const top = kBorderRadius - 2.0 * kBallRadius;
  for (int i = 0; i < numBodies; ++i)
  {
    double const y = top - static_cast<double>(i % 30) * kLatticeSpacing;
    double const x = static_cast<double>(i / 30) * kLatticeSpacing;
    setup.world.addBall(kBallRadius,
                        Coordinate{x + jitter(rng), y, jitter(rng)},
                        orb_assets::kWhite);
  }
}

}  // namespace orb_sim::bench
