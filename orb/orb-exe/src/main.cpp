// Headless driver: builds the two-ball scene and runs the per-frame loop a
// renderer would (step, then read back the dynamic buffer).
//
// Usage: orb_exe [frames] [balls]

#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <format>
#include <numbers>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "orb-assets/src/Geometry.hpp"
#include "orb-sim/src/Environment/WorldModel.hpp"

namespace
{

constexpr double kDt = 1.0e-3;              // Step per frame [s]
constexpr double kBorderRadius = 0.85;      // [m]
constexpr uint32_t kBorderSubdivisions = 5;
constexpr double kBallRadius = 0.04;        // [m]
constexpr uint64_t kDefaultFrames = 10000;
constexpr int kDefaultBalls = 2;

// Extra balls sit on a horizontal circle below the yellow one
constexpr double kExtraBallRingRadius = 0.4;
constexpr double kExtraBallHeight = 0.3;

void populateScene(orb_sim::WorldModel& world, int ballCount)
{
  orb_sim::Coordinate const borderCenter{0.0, 0.0, 0.0};
  world.createBorder(kBorderRadius, kBorderSubdivisions, borderCenter);

  world.addBall(
    kBallRadius, orb_sim::Coordinate{0.0, 0.75, 0.0}, orb_assets::kYellow);
  if (ballCount > 1)
  {
    world.addBall(kBallRadius, borderCenter, orb_assets::kRed);
  }

  int const extra = ballCount - 2;
  for (int i = 0; i < extra; ++i)
  {
    double const angle = 2.0 * std::numbers::pi * i / extra;
    float const shade = static_cast<float>(i + 1) / static_cast<float>(extra);
    world.addBall(kBallRadius,
                  orb_sim::Coordinate{kExtraBallRingRadius * std::cos(angle),
                                      kExtraBallHeight,
                                      kExtraBallRingRadius * std::sin(angle)},
                  orb_assets::Color{shade, 0.5f, 1.0f - shade, 1.0f});
  }
}

}  // namespace

int main(int argc, char** argv)
{
  auto logger = spdlog::stdout_color_mt("orb-exe");

  uint64_t frames = kDefaultFrames;
  int balls = kDefaultBalls;

  try
  {
    if (argc > 1)
    {
      frames = std::stoull(argv[1]);
    }
    if (argc > 2)
    {
      balls = std::stoi(argv[2]);
    }
  }
  catch (const std::exception& e)
  {
    logger->error("Invalid arguments ({}). Usage: {} [frames] [balls]",
                  e.what(),
                  argv[0]);
    return 1;
  }

  if (balls < 1)
  {
    logger->error("Ball count must be at least 1, got {}", balls);
    return 1;
  }

  try
  {
    orb_sim::WorldModel world{orb_sim::SimulationConfig{}, logger};
    populateScene(world, balls);

    logger->info("Static buffer: {} vertices, {} indices",
                 world.staticVertices().size(),
                 world.staticIndices().size());

    double const initialEnergy = world.computeSystemEnergy().total();

    using Clock = std::chrono::steady_clock;
    auto lastReport = Clock::now();
    uint64_t framesSinceReport = 0;
    size_t uploadedVertices = 0;

    for (uint64_t frame = 0; frame < frames; ++frame)
    {
      world.step(kDt);

      // Stand-in for the per-frame GPU upload
      uploadedVertices = world.dynamicVertices().size();
      ++framesSinceReport;

      auto const now = Clock::now();
      if (now - lastReport >= std::chrono::seconds{1})
      {
        double const elapsed =
          std::chrono::duration<double>(now - lastReport).count();
        logger->info("FPS: {:.1f}", framesSinceReport / elapsed);
        lastReport = now;
        framesSinceReport = 0;
      }
    }

    auto const energy = world.computeSystemEnergy();
    logger->info("Ran {} frames ({:.3f} s simulated), {} dynamic vertices",
                 world.getFrameCount(),
                 world.getTime(),
                 uploadedVertices);
    logger->info("Energy: {:.6f} J -> {:.6f} J (kinetic {:.6f}, potential {:.6f})",
                 initialEnergy,
                 energy.total(),
                 energy.totalKineticE,
                 energy.totalPotentialE);

    for (const auto& body : world.getBodies())
    {
      logger->info("Ball {} at {}",
                   body.getInstanceId(),
                   std::format("{}", body.getInertialState().position));
    }
  }
  catch (const std::exception& e)
  {
    logger->error("Simulation failed: {}", e.what());
    return 1;
  }

  return 0;
}
