#include "orb-assets/src/GeometryFactory.hpp"

#include <cmath>
#include <map>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>

namespace orb_assets
{

namespace
{

using Triangle = std::array<uint32_t, 3>;

// Icosahedron faces, counter-clockwise seen from outside
constexpr std::array<Triangle, 20> kIcosahedronFaces{{{0, 11, 5},
                                                      {0, 5, 1},
                                                      {0, 1, 7},
                                                      {0, 7, 10},
                                                      {0, 10, 11},
                                                      {1, 5, 9},
                                                      {5, 11, 4},
                                                      {11, 10, 2},
                                                      {10, 7, 6},
                                                      {7, 1, 8},
                                                      {3, 9, 4},
                                                      {3, 4, 2},
                                                      {3, 2, 6},
                                                      {3, 6, 8},
                                                      {3, 8, 9},
                                                      {4, 9, 5},
                                                      {2, 4, 11},
                                                      {6, 2, 10},
                                                      {8, 6, 7},
                                                      {9, 8, 1}}};

}  // namespace

std::array<Eigen::Vector3d, 12> GeometryFactory::getIcosahedronCorners()
{
  double const t = std::numbers::phi;

  std::array<Eigen::Vector3d, 12> corners{
    Eigen::Vector3d{-1.0, t, 0.0},
    Eigen::Vector3d{1.0, t, 0.0},
    Eigen::Vector3d{-1.0, -t, 0.0},
    Eigen::Vector3d{1.0, -t, 0.0},
    Eigen::Vector3d{0.0, -1.0, t},
    Eigen::Vector3d{0.0, 1.0, t},
    Eigen::Vector3d{0.0, -1.0, -t},
    Eigen::Vector3d{0.0, 1.0, -t},
    Eigen::Vector3d{t, 0.0, -1.0},
    Eigen::Vector3d{t, 0.0, 1.0},
    Eigen::Vector3d{-t, 0.0, -1.0},
    Eigen::Vector3d{-t, 0.0, 1.0}};

  for (auto& corner : corners)
  {
    corner.normalize();
  }

  return corners;
}

Vertex GeometryFactory::makeVertex(const Eigen::Vector3d& position,
                                   const Eigen::Vector3d& normal,
                                   const Color& color)
{
  return Vertex{{static_cast<float>(position.x()),
                 static_cast<float>(position.y()),
                 static_cast<float>(position.z())},
                {color.r, color.g, color.b, color.a},
                {static_cast<float>(normal.x()),
                 static_cast<float>(normal.y()),
                 static_cast<float>(normal.z())}};
}

MeshData GeometryFactory::createSphere(double radius,
                                       uint32_t subdivisions,
                                       const Eigen::Vector3d& center,
                                       const Color& color)
{
  if (!std::isfinite(radius) || radius <= 0.0)
  {
    throw std::invalid_argument("Sphere radius must be positive, got: " +
                                std::to_string(radius));
  }
  if (subdivisions > kMaxSubdivisions)
  {
    throw std::invalid_argument("Sphere subdivisions must be at most " +
                                std::to_string(kMaxSubdivisions) +
                                ", got: " + std::to_string(subdivisions));
  }

  // Build the unit sphere first; scale and translate at the end
  auto const corners = getIcosahedronCorners();
  std::vector<Eigen::Vector3d> directions(corners.begin(), corners.end());
  std::vector<Triangle> faces(kIcosahedronFaces.begin(),
                              kIcosahedronFaces.end());

  for (uint32_t level = 0; level < subdivisions; ++level)
  {
    std::map<std::pair<uint32_t, uint32_t>, uint32_t> midpointCache;

    auto midpoint = [&](uint32_t a, uint32_t b)
    {
      auto const key = std::minmax(a, b);
      auto it = midpointCache.find(key);
      if (it != midpointCache.end())
      {
        return it->second;
      }

      directions.push_back((directions[a] + directions[b]).normalized());
      auto const index = static_cast<uint32_t>(directions.size() - 1);
      midpointCache.emplace(key, index);
      return index;
    };

    std::vector<Triangle> refined;
    refined.reserve(faces.size() * 4);

    for (const auto& face : faces)
    {
      uint32_t const ab = midpoint(face[0], face[1]);
      uint32_t const bc = midpoint(face[1], face[2]);
      uint32_t const ca = midpoint(face[2], face[0]);

      refined.push_back({face[0], ab, ca});
      refined.push_back({face[1], bc, ab});
      refined.push_back({face[2], ca, bc});
      refined.push_back({ab, bc, ca});
    }

    faces = std::move(refined);
  }

  MeshData mesh;
  mesh.vertices.reserve(directions.size());
  mesh.indices.reserve(faces.size() * 3);

  for (const auto& direction : directions)
  {
    mesh.vertices.push_back(
      makeVertex(center + direction * radius, direction, color));
  }

  for (const auto& face : faces)
  {
    mesh.indices.insert(mesh.indices.end(), face.begin(), face.end());
  }

  return mesh;
}

MeshData GeometryFactory::createRing(double innerRadius,
                                     double outerRadius,
                                     uint32_t segments,
                                     const Eigen::Vector3d& center,
                                     const Eigen::Vector3d& axis,
                                     const Color& color)
{
  if (!std::isfinite(innerRadius) || innerRadius < 0.0)
  {
    throw std::invalid_argument("Ring inner radius must be non-negative, got: " +
                                std::to_string(innerRadius));
  }
  if (!std::isfinite(outerRadius) || outerRadius <= innerRadius)
  {
    throw std::invalid_argument(
      "Ring outer radius must exceed inner radius, got: " +
      std::to_string(outerRadius));
  }
  if (segments < 3)
  {
    throw std::invalid_argument("Ring needs at least 3 segments, got: " +
                                std::to_string(segments));
  }
  if (!axis.allFinite() || axis.norm() < 1e-12)
  {
    throw std::invalid_argument("Ring axis must be a non-zero vector");
  }

  Eigen::Vector3d const normal = axis.normalized();

  // In-plane basis: any vector not parallel to the normal seeds it
  Eigen::Vector3d const seed = std::abs(normal.x()) < 0.9
                                 ? Eigen::Vector3d::UnitX()
                                 : Eigen::Vector3d::UnitY();
  Eigen::Vector3d const u = normal.cross(seed).normalized();
  Eigen::Vector3d const v = normal.cross(u);

  MeshData mesh;
  mesh.vertices.reserve(2 * segments);
  mesh.indices.reserve(6 * segments);

  for (uint32_t i = 0; i < segments; ++i)
  {
    double const angle = 2.0 * std::numbers::pi * i / segments;
    Eigen::Vector3d const radial = u * std::cos(angle) + v * std::sin(angle);

    mesh.vertices.push_back(
      makeVertex(center + radial * innerRadius, normal, color));
    mesh.vertices.push_back(
      makeVertex(center + radial * outerRadius, normal, color));
  }

  for (uint32_t i = 0; i < segments; ++i)
  {
    uint32_t const inner = 2 * i;
    uint32_t const outer = inner + 1;
    uint32_t const nextInner = 2 * ((i + 1) % segments);
    uint32_t const nextOuter = nextInner + 1;

    mesh.indices.insert(mesh.indices.end(), {inner, outer, nextOuter});
    mesh.indices.insert(mesh.indices.end(), {inner, nextOuter, nextInner});
  }

  return mesh;
}

}  // namespace orb_assets
