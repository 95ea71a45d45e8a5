// Ticket: 0007_scene_geometry_sync

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "orb-assets/src/Geometry.hpp"
#include "orb-assets/src/GeometryFactory.hpp"
#include "orb-sim/src/Environment/GeometrySync.hpp"

using namespace orb_sim;

namespace
{

orb_assets::Mesh makeBallMesh(const Coordinate& center)
{
  return orb_assets::Mesh{
    orb_assets::GeometryFactory::createSphere(0.04, 1, center, orb_assets::kRed),
    0,
    0,
    center};
}

}  // namespace

TEST(GeometrySyncTest, syncGeometry_TranslatesByBodyDelta)
{
  Coordinate const start{0.0, 0.75, 0.0};
  std::vector<Body> bodies{Body{0, start, 0.04}};
  std::vector<orb_assets::Mesh> meshes{makeBallMesh(start)};

  auto const before = meshes[0].getVertices();

  bodies[0].getInertialState().position = Coordinate{0.1, 0.5, -0.2};
  GeometrySync::syncGeometry(bodies, meshes);

  const auto& after = meshes[0].getVertices();
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < after.size(); ++i)
  {
    EXPECT_NEAR(before[i].position[0] + 0.1, after[i].position[0], 1e-6);
    EXPECT_NEAR(before[i].position[1] - 0.25, after[i].position[1], 1e-6);
    EXPECT_NEAR(before[i].position[2] - 0.2, after[i].position[2], 1e-6);
  }

  EXPECT_DOUBLE_EQ(0.1, meshes[0].getCenter().x());
  EXPECT_DOUBLE_EQ(0.5, meshes[0].getCenter().y());
  EXPECT_DOUBLE_EQ(-0.2, meshes[0].getCenter().z());
}

TEST(GeometrySyncTest, syncGeometry_StationaryBodyLeavesMeshInPlace)
{
  Coordinate const start{0.3, 0.0, 0.0};
  std::vector<Body> bodies{Body{0, start, 0.04}};
  std::vector<orb_assets::Mesh> meshes{makeBallMesh(start)};

  auto const before = meshes[0].getVertices();
  GeometrySync::syncGeometry(bodies, meshes);

  for (size_t i = 0; i < before.size(); ++i)
  {
    EXPECT_FLOAT_EQ(before[i].position[0], meshes[0].getVertices()[i].position[0]);
    EXPECT_FLOAT_EQ(before[i].position[1], meshes[0].getVertices()[i].position[1]);
  }
}

TEST(GeometrySyncTest, syncGeometry_PairsByCreationOrder)
{
  std::vector<Body> bodies{Body{0, Coordinate{0.0, 0.0, 0.0}, 0.04},
                           Body{1, Coordinate{0.5, 0.0, 0.0}, 0.04}};
  std::vector<orb_assets::Mesh> meshes{
    makeBallMesh(Coordinate{0.0, 0.0, 0.0}),
    makeBallMesh(Coordinate{0.5, 0.0, 0.0})};

  bodies[1].getInertialState().position = Coordinate{0.5, 0.1, 0.0};
  GeometrySync::syncGeometry(bodies, meshes);

  EXPECT_DOUBLE_EQ(0.0, meshes[0].getCenter().y());
  EXPECT_DOUBLE_EQ(0.1, meshes[1].getCenter().y());
}

TEST(GeometrySyncTest, syncGeometry_CountMismatchThrows)
{
  std::vector<Body> bodies{Body{0, Coordinate{0.0, 0.0, 0.0}, 0.04},
                           Body{1, Coordinate{0.5, 0.0, 0.0}, 0.04}};
  std::vector<orb_assets::Mesh> meshes{makeBallMesh(Coordinate{0.0, 0.0, 0.0})};

  EXPECT_THROW(GeometrySync::syncGeometry(bodies, meshes), std::logic_error);
}
