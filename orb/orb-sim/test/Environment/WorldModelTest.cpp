// Ticket: 0008_world_model_api

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "orb-assets/src/Geometry.hpp"
#include "orb-sim/src/Diagnostics/EnergyTracker.hpp"
#include "orb-sim/src/Environment/WorldModel.hpp"

using namespace orb_sim;
using namespace std::chrono_literals;

namespace
{

constexpr double kDt = 1.0e-3;
constexpr double kBallRadius = 0.04;
constexpr double kBorderRadius = 0.85;

const Coordinate kOrigin{0.0, 0.0, 0.0};

double maxPairOverlap(std::span<const Body> bodies)
{
  double worst = 0.0;
  for (size_t i = 0; i < bodies.size(); ++i)
  {
    for (size_t j = i + 1; j < bodies.size(); ++j)
    {
      double const distance = (bodies[j].getInertialState().position -
                               bodies[i].getInertialState().position)
                                .norm();
      worst = std::max(
        worst, bodies[i].getRadius() + bodies[j].getRadius() - distance);
    }
  }
  return worst;
}

double maxBorderExcess(const WorldModel& world)
{
  double worst = -1.0;
  for (const auto& body : world.getBodies())
  {
    double const distance =
      (body.getInertialState().position - world.getBorder().center).norm();
    worst = std::max(worst,
                     distance + body.getRadius() - world.getBorder().radius);
  }
  return worst;
}

}  // namespace

class WorldModelTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    // Null logger keeps test output clean
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("test_logger", nullSink);
  }

  WorldModel makeWorld(SimulationConfig config = SimulationConfig{})
  {
    return WorldModel{config, logger_};
  }

  // Border plus the yellow and red balls of the demo scene
  WorldModel makeDemoWorld()
  {
    WorldModel world = makeWorld();
    world.createBorder(kBorderRadius, 2, kOrigin);
    world.addBall(kBallRadius, Coordinate{0.0, 0.75, 0.0}, orb_assets::kYellow);
    world.addBall(kBallRadius, kOrigin, orb_assets::kRed);
    return world;
  }

  std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(WorldModelTest, Construct_DefaultConfiguration)
{
  WorldModel world = makeWorld();

  EXPECT_DOUBLE_EQ(0.85, world.getBorder().radius);
  EXPECT_DOUBLE_EQ(0.95, world.getBorder().restitution);
  EXPECT_DOUBLE_EQ(0.95, world.getConfig().restitution);
  EXPECT_DOUBLE_EQ(-9.8, world.getConfig().gravity.y());
  EXPECT_EQ(3, world.getConfig().relaxation.passCount);
  EXPECT_EQ(0u, world.getFrameCount());
  EXPECT_DOUBLE_EQ(0.0, world.getTime());
  EXPECT_TRUE(world.getBodies().empty());
}

TEST_F(WorldModelTest, Construct_InvalidConfigurationThrows)
{
  SimulationConfig noPasses;
  noPasses.relaxation.passCount = 0;
  EXPECT_THROW(makeWorld(noPasses), std::invalid_argument);

  SimulationConfig bouncy;
  bouncy.restitution = 1.5;
  EXPECT_THROW(makeWorld(bouncy), std::invalid_argument);

  SimulationConfig frozen;
  frozen.fixedTimestep = 0.0;
  EXPECT_THROW(makeWorld(frozen), std::invalid_argument);

  SimulationConfig noSteps;
  noSteps.maxStepsPerUpdate = 0;
  EXPECT_THROW(makeWorld(noSteps), std::invalid_argument);

  SimulationConfig fine;
  fine.ballSubdivisions = 8;
  EXPECT_THROW(makeWorld(fine), std::invalid_argument);

  SimulationConfig badBorder;
  badBorder.border.radius = -0.85;
  EXPECT_THROW(makeWorld(badBorder), std::invalid_argument);
}

// ============================================================================
// Setup
// ============================================================================

TEST_F(WorldModelTest, addBall_AppendsBodyAndDynamicMesh)
{
  WorldModel world = makeWorld();

  BodyHandle const yellow =
    world.addBall(kBallRadius, Coordinate{0.0, 0.75, 0.0}, orb_assets::kYellow);
  BodyHandle const red = world.addBall(kBallRadius, kOrigin, orb_assets::kRed);

  EXPECT_EQ(0u, yellow);
  EXPECT_EQ(1u, red);
  EXPECT_EQ(2u, world.getBodies().size());
  EXPECT_DOUBLE_EQ(0.75, world.getBody(yellow).getInertialState().position.y());
  EXPECT_DOUBLE_EQ(1.0, world.getBody(red).getMass());

  // Subdivision level 3: 642 vertices, 1280 triangles per ball
  EXPECT_EQ(2u * 642u, world.dynamicVertices().size());
  auto const indices = world.dynamicIndices();
  ASSERT_EQ(2u * 3840u, indices.size());

  // Second mesh indexes the second vertex range only
  auto const secondBegin = indices.begin() + 3840;
  EXPECT_EQ(642u, *std::min_element(secondBegin, indices.end()));
  EXPECT_EQ(1283u, *std::max_element(secondBegin, indices.end()));
  EXPECT_EQ(641u, *std::max_element(indices.begin(), secondBegin));

  const auto& meshes = world.getScene().getDynamicBuffer().getMeshes();
  EXPECT_EQ(0u, meshes[0].getBufferOffset());
  EXPECT_EQ(3840u, meshes[1].getBufferOffset());
  EXPECT_EQ(642u, meshes[1].getBaseVertex());

  // Vertex color comes from the ball
  auto const vertices = world.dynamicVertices();
  EXPECT_FLOAT_EQ(1.0f, vertices.front().color[1]);
  EXPECT_FLOAT_EQ(0.0f, vertices.back().color[1]);
}

TEST_F(WorldModelTest, addBall_ExplicitMass)
{
  WorldModel world = makeWorld();
  BodyHandle const heavy =
    world.addBall(kBallRadius, kOrigin, orb_assets::kRed, 5.0);
  EXPECT_DOUBLE_EQ(5.0, world.getBody(heavy).getMass());
}

TEST_F(WorldModelTest, addBall_RejectsBallThatCannotFit)
{
  WorldModel world = makeWorld();

  EXPECT_THROW(world.addBall(0.85, kOrigin, orb_assets::kRed),
               std::invalid_argument);
  EXPECT_THROW(world.addBall(-0.04, kOrigin, orb_assets::kRed),
               std::invalid_argument);
  EXPECT_THROW(world.addBall(kBallRadius, kOrigin, orb_assets::kRed, 0.0),
               std::invalid_argument);

  EXPECT_TRUE(world.getBodies().empty());
  EXPECT_TRUE(world.dynamicVertices().empty());
}

TEST_F(WorldModelTest, createBorder_SetsBorderAndDecoration)
{
  WorldModel world = makeWorld();
  Coordinate const center{0.1, 0.0, -0.1};

  world.createBorder(0.6, 2, center);

  EXPECT_DOUBLE_EQ(0.6, world.getBorder().radius);
  EXPECT_DOUBLE_EQ(0.1, world.getBorder().center.x());
  EXPECT_DOUBLE_EQ(-0.1, world.getBorder().center.z());

  // Shell (162 vertices at level 2) plus three 128-segment rings
  EXPECT_EQ(4u, world.getScene().getStaticBuffer().size());
  EXPECT_EQ(162u + 3u * 256u, world.staticVertices().size());
  EXPECT_EQ(960u + 3u * 768u, world.staticIndices().size());

  // Static geometry is never part of the dynamic buffer
  EXPECT_TRUE(world.dynamicVertices().empty());
}

TEST_F(WorldModelTest, createBorder_InvalidArgumentsLeaveSceneUntouched)
{
  WorldModel world = makeWorld();

  EXPECT_THROW(world.createBorder(0.85, 9, kOrigin), std::invalid_argument);
  EXPECT_THROW(world.createBorder(0.0, 2, kOrigin), std::invalid_argument);

  world.addBall(0.3, kOrigin, orb_assets::kRed);
  EXPECT_THROW(world.createBorder(0.25, 2, kOrigin), std::invalid_argument);

  EXPECT_TRUE(world.staticVertices().empty());
  EXPECT_DOUBLE_EQ(0.85, world.getBorder().radius);
}

TEST_F(WorldModelTest, Setup_ClosedAfterFirstStep)
{
  WorldModel world = makeDemoWorld();
  world.step(kDt);

  EXPECT_THROW(world.addBall(kBallRadius, kOrigin, orb_assets::kRed),
               std::logic_error);
  EXPECT_THROW(world.createBorder(kBorderRadius, 2, kOrigin),
               std::logic_error);
  EXPECT_THROW(world.setInitialVelocity(0, Velocity{1.0, 0.0, 0.0}),
               std::logic_error);
  EXPECT_EQ(2u, world.getBodies().size());
}

TEST_F(WorldModelTest, setInitialVelocity_Validates)
{
  WorldModel world = makeDemoWorld();

  world.setInitialVelocity(1, Velocity{0.5, 0.0, 0.0});
  EXPECT_DOUBLE_EQ(0.5, world.getBody(1).getInertialState().velocity.x());

  EXPECT_THROW(world.setInitialVelocity(7, Velocity{0.5, 0.0, 0.0}),
               std::out_of_range);
  EXPECT_THROW(world.setInitialVelocity(0, Velocity{NAN, 0.0, 0.0}),
               std::invalid_argument);
}

// ============================================================================
// step()
// ============================================================================

TEST_F(WorldModelTest, step_RejectsInvalidTimestep)
{
  WorldModel world = makeDemoWorld();

  EXPECT_THROW(world.step(0.0), std::invalid_argument);
  EXPECT_THROW(world.step(-kDt), std::invalid_argument);
  EXPECT_EQ(0u, world.getFrameCount());
  EXPECT_FALSE(world.getScene().isSealed());
}

TEST_F(WorldModelTest, step_CountsFramesAndTime)
{
  WorldModel world = makeDemoWorld();

  for (int i = 0; i < 10; ++i)
  {
    auto const result = world.step(kDt);
    EXPECT_EQ(3, result.passesRun);
  }

  EXPECT_EQ(10u, world.getFrameCount());
  EXPECT_NEAR(10 * kDt, world.getTime(), 1e-15);
}

TEST_F(WorldModelTest, step_EmptySceneIsValid)
{
  WorldModel world = makeWorld();
  EXPECT_NO_THROW(world.step(kDt));
  EXPECT_EQ(1u, world.getFrameCount());
}

// Single ball falling from (0, 0.75, 0) onto the bottom of the border
TEST_F(WorldModelTest, step_BallBouncesOffLowerBorder)
{
  WorldModel world = makeWorld();
  world.createBorder(kBorderRadius, 2, kOrigin);
  BodyHandle const ball =
    world.addBall(kBallRadius, Coordinate{0.0, 0.75, 0.0}, orb_assets::kYellow);

  bool bounced = false;
  for (int i = 0; i < 2000 && !bounced; ++i)
  {
    double const vyBefore = world.getBody(ball).getInertialState().velocity.y();
    world.step(kDt);
    const auto& state = world.getBody(ball).getInertialState();

    if (vyBefore < 0.0 && state.velocity.y() > 0.0)
    {
      bounced = true;

      // Surface tangent to the border at first contact
      EXPECT_NEAR(-(kBorderRadius - kBallRadius), state.position.y(), 1e-9);

      // Velocity after this step's integration, reversed and scaled
      double const vyImpact = vyBefore - 9.8 * kDt;
      EXPECT_NEAR(-0.95 * vyImpact, state.velocity.y(), 1e-9);

      // Straight drop: no sideways motion
      EXPECT_DOUBLE_EQ(0.0, state.position.x());
      EXPECT_DOUBLE_EQ(0.0, state.position.z());

      // Free fall over 1.56 m takes about 0.56 s
      EXPECT_GT(world.getFrameCount(), 500u);
      EXPECT_LT(world.getFrameCount(), 620u);
    }
  }

  EXPECT_TRUE(bounced);
}

TEST_F(WorldModelTest, step_SingleBallStaysInsideBorder)
{
  WorldModel world = makeWorld();
  world.createBorder(kBorderRadius, 1, kOrigin);
  BodyHandle const ball =
    world.addBall(kBallRadius, Coordinate{0.2, 0.3, -0.1}, orb_assets::kYellow);
  world.setInitialVelocity(ball, Velocity{1.3, 0.4, -0.7});

  for (int i = 0; i < 3000; ++i)
  {
    world.step(kDt);
    ASSERT_LE(maxBorderExcess(world), 1e-9) << "after step " << i;
  }
}

TEST_F(WorldModelTest, step_ManyBallsStayContainedAndSeparated)
{
  WorldModel world = makeWorld();
  world.createBorder(kBorderRadius, 1, kOrigin);

  std::mt19937 rng{42};
  std::uniform_real_distribution<double> velDist{-1.5, 1.5};
  for (int i = 0; i < 6; ++i)
  {
    Coordinate const center{-0.3 + 0.12 * i, 0.1 * (i % 3), 0.05 * (i % 2)};
    BodyHandle const handle =
      world.addBall(kBallRadius, center, orb_assets::kWhite);
    world.setInitialVelocity(
      handle, Velocity{velDist(rng), velDist(rng), velDist(rng)});
  }

  for (int i = 0; i < 3000; ++i)
  {
    world.step(kDt);
    ASSERT_LE(maxBorderExcess(world), 0.02) << "after step " << i;
    ASSERT_LE(maxPairOverlap(world.getBodies()), 0.02) << "after step " << i;
    for (const auto& body : world.getBodies())
    {
      ASSERT_TRUE(body.getInertialState().position.isFinite());
      ASSERT_TRUE(body.getInertialState().velocity.isFinite());
    }
  }
}

TEST_F(WorldModelTest, step_StackedBallsDoNotSinkIntoEachOther)
{
  // The demo scene: yellow falls onto red after both reach the bottom
  WorldModel world = makeDemoWorld();

  for (int i = 0; i < 4000; ++i)
  {
    world.step(kDt);
    ASSERT_LE(maxPairOverlap(world.getBodies()), 0.01) << "after step " << i;
  }

  // Yellow ends above red
  EXPECT_GT(world.getBody(0).getInertialState().position.y(),
            world.getBody(1).getInertialState().position.y());
}

TEST_F(WorldModelTest, step_EnergyDoesNotGrowAcrossBounces)
{
  WorldModel world = makeWorld();
  world.createBorder(kBorderRadius, 1, kOrigin);
  world.addBall(kBallRadius, Coordinate{0.0, 0.75, 0.0}, orb_assets::kYellow);

  double const initial = world.computeSystemEnergy().total();
  EXPECT_NEAR(9.8 * 0.75, initial, 1e-12);

  for (int i = 0; i < 1500; ++i)
  {
    world.step(kDt);
  }

  double const final = world.computeSystemEnergy().total();
  EXPECT_LT(final, initial);
  EXPECT_FALSE(EnergyTracker::isEnergyInjection(final, initial));
}

// ============================================================================
// Geometry sync through step()
// ============================================================================

TEST_F(WorldModelTest, step_MeshesFollowBodies)
{
  WorldModel world = makeDemoWorld();

  for (int i = 0; i < 300; ++i)
  {
    world.step(kDt);
  }

  const auto& meshes = world.getScene().getDynamicBuffer().getMeshes();
  auto const bodies = world.getBodies();
  ASSERT_EQ(bodies.size(), meshes.size());

  for (size_t b = 0; b < bodies.size(); ++b)
  {
    const auto& position = bodies[b].getInertialState().position;
    EXPECT_DOUBLE_EQ(position.x(), meshes[b].getCenter().x());
    EXPECT_DOUBLE_EQ(position.y(), meshes[b].getCenter().y());
    EXPECT_DOUBLE_EQ(position.z(), meshes[b].getCenter().z());

    // Icosphere vertices are symmetric about the center
    Eigen::Vector3d mean = Eigen::Vector3d::Zero();
    for (const auto& vertex : meshes[b].getVertices())
    {
      mean += Eigen::Vector3d{
        vertex.position[0], vertex.position[1], vertex.position[2]};
    }
    mean /= static_cast<double>(meshes[b].getVertices().size());
    EXPECT_NEAR(position.x(), mean.x(), 1e-4);
    EXPECT_NEAR(position.y(), mean.y(), 1e-4);
    EXPECT_NEAR(position.z(), mean.z(), 1e-4);
  }
}

TEST_F(WorldModelTest, step_MeshesMoveRigidly)
{
  WorldModel world = makeDemoWorld();
  world.setInitialVelocity(1, Velocity{0.7, 0.2, -0.4});

  auto distances = [](const std::vector<orb_assets::Vertex>& vertices)
  {
    std::vector<double> result;
    for (size_t i = 1; i < vertices.size(); i += 7)
    {
      double const dx = vertices[i].position[0] - vertices[0].position[0];
      double const dy = vertices[i].position[1] - vertices[0].position[1];
      double const dz = vertices[i].position[2] - vertices[0].position[2];
      result.push_back(std::sqrt(dx * dx + dy * dy + dz * dz));
    }
    return result;
  };

  // Distances within the moving red ball
  auto redVertices = [&world]()
  { return world.getScene().getDynamicBuffer().getMeshes()[1].getVertices(); };

  auto const before = distances(redVertices());
  auto const staticBefore = world.staticVertices();

  for (int i = 0; i < 500; ++i)
  {
    world.step(kDt);
  }

  auto const after = distances(redVertices());
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i)
  {
    EXPECT_NEAR(before[i], after[i], 1e-4);
  }

  // Static decoration is untouched
  auto const staticAfter = world.staticVertices();
  ASSERT_EQ(staticBefore.size(), staticAfter.size());
  for (size_t i = 0; i < staticBefore.size(); ++i)
  {
    EXPECT_FLOAT_EQ(staticBefore[i].position[1], staticAfter[i].position[1]);
  }

  // Indices never change
  EXPECT_EQ(2u * 3840u, world.dynamicIndices().size());
}

// ============================================================================
// update() fixed-timestep accumulator
// ============================================================================

TEST_F(WorldModelTest, update_RunsWholeFixedSteps)
{
  WorldModel world = makeDemoWorld();

  EXPECT_EQ(16u, world.update(16ms));
  EXPECT_EQ(0u, world.update(16ms));
  EXPECT_EQ(4u, world.update(20ms));
  EXPECT_EQ(20u, world.getFrameCount());
  EXPECT_NEAR(0.020, world.getTime(), 1e-12);
}

TEST_F(WorldModelTest, update_CapsStepsAndDropsExcess)
{
  SimulationConfig config;
  config.maxStepsPerUpdate = 5;
  WorldModel world = makeWorld(config);
  world.addBall(kBallRadius, kOrigin, orb_assets::kRed);

  EXPECT_EQ(5u, world.update(100ms));
  // Remaining 95 ms were dropped, not carried over
  EXPECT_EQ(1u, world.update(101ms));
  EXPECT_EQ(6u, world.getFrameCount());
}

TEST_F(WorldModelTest, update_LargerFixedTimestep)
{
  SimulationConfig config;
  config.fixedTimestep = 4.0e-3;
  WorldModel world = makeWorld(config);

  EXPECT_EQ(0u, world.update(3ms));
  EXPECT_EQ(1u, world.update(5ms));
  EXPECT_EQ(1u, world.update(10ms));
  EXPECT_NEAR(0.008, world.getTime(), 1e-12);
}

TEST_F(WorldModelTest, update_RejectsTimeGoingBackwards)
{
  WorldModel world = makeDemoWorld();
  world.update(50ms);
  EXPECT_THROW(world.update(40ms), std::invalid_argument);
}
