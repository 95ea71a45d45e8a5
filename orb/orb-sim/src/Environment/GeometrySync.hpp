// Ticket: 0007_scene_geometry_sync

#ifndef ORB_SIM_ENVIRONMENT_GEOMETRY_SYNC_HPP
#define ORB_SIM_ENVIRONMENT_GEOMETRY_SYNC_HPP

#include <span>
#include <vector>

#include "orb-assets/src/Geometry.hpp"
#include "orb-sim/src/Physics/RigidBody/Body.hpp"

namespace orb_sim
{

/**
 * @brief Projection of body motion onto pre-generated mesh geometry.
 *
 * Dynamic meshes are never regenerated. Each step they are translated
 * rigidly by the displacement of their body since the previous sync.
 */
namespace GeometrySync
{

/**
 * @brief Move every dynamic mesh onto its body's current position.
 *
 * Pairs are matched by creation order: mesh i belongs to body i. For each
 * pair delta = body.position - mesh.center is added to every vertex and the
 * mesh center becomes body.position.
 *
 * @throws std::logic_error if the counts differ
 */
void syncGeometry(std::span<const Body> bodies,
                  std::vector<orb_assets::Mesh>& dynamicMeshes);

}  // namespace GeometrySync

}  // namespace orb_sim

#endif  // ORB_SIM_ENVIRONMENT_GEOMETRY_SYNC_HPP
