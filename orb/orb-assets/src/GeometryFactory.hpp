#ifndef ORB_ASSETS_GEOMETRY_FACTORY_HPP
#define ORB_ASSETS_GEOMETRY_FACTORY_HPP

#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <vector>

#include "orb-assets/src/Geometry.hpp"

namespace orb_assets
{

/**
 * @brief Factory class for the procedural shapes used by the scene
 *
 * Provides static methods that tessellate spheres and flat rings into
 * MeshData (vertices plus 0-based local triangle indices). Geometry is
 * generated directly around the requested center.
 *
 * Usage:
 *   auto ball = GeometryFactory::createSphere(0.04, 3, {0, 0.75, 0}, kYellow);
 *   auto ring = GeometryFactory::createRing(0.84, 0.85, 64, {0, 0, 0},
 *                                           Eigen::Vector3d::UnitY(), kWhite);
 */
class GeometryFactory
{
public:
  /// Highest accepted icosphere subdivision level (163842 vertices)
  static constexpr uint32_t kMaxSubdivisions = 7;

  /**
   * @brief Create an icosphere
   *
   * Starts from a regular icosahedron (12 vertices, 20 triangles). Each
   * subdivision splits every triangle into 4 by inserting edge midpoints,
   * which are projected back onto the sphere. Shared edges reuse their
   * midpoint vertex, so the vertex count after s subdivisions is
   * 10 * 4^s + 2 and the triangle count is 20 * 4^s.
   *
   * Normals point radially outward. Triangles are wound counter-clockwise
   * when seen from outside.
   *
   * @param radius Sphere radius (> 0)
   * @param subdivisions Subdivision level [0, kMaxSubdivisions]
   * @param center Sphere center
   * @param color Color applied to every vertex
   * @throws std::invalid_argument on invalid radius or subdivision level
   */
  static MeshData createSphere(double radius,
                               uint32_t subdivisions,
                               const Eigen::Vector3d& center,
                               const Color& color);

  /**
   * @brief Create a flat annulus perpendicular to an axis
   *
   * 2 * segments vertices (inner and outer rim) and 2 triangles per segment.
   * Normals equal the normalized axis.
   *
   * @param innerRadius Inner rim radius (>= 0)
   * @param outerRadius Outer rim radius (> innerRadius)
   * @param segments Number of segments around the ring (>= 3)
   * @param center Ring center
   * @param axis Ring normal (non-zero)
   * @param color Color applied to every vertex
   * @throws std::invalid_argument on invalid radii, segment count or axis
   */
  static MeshData createRing(double innerRadius,
                             double outerRadius,
                             uint32_t segments,
                             const Eigen::Vector3d& center,
                             const Eigen::Vector3d& axis,
                             const Color& color);

private:
  /**
   * @brief Unit-length corners of a regular icosahedron
   */
  static std::array<Eigen::Vector3d, 12> getIcosahedronCorners();

  static Vertex makeVertex(const Eigen::Vector3d& position,
                           const Eigen::Vector3d& normal,
                           const Color& color);
};

}  // namespace orb_assets

#endif  // ORB_ASSETS_GEOMETRY_FACTORY_HPP
