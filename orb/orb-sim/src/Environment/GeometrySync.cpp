// Ticket: 0007_scene_geometry_sync

#include "orb-sim/src/Environment/GeometrySync.hpp"

#include <stdexcept>
#include <string>

namespace orb_sim::GeometrySync
{

void syncGeometry(std::span<const Body> bodies,
                  std::vector<orb_assets::Mesh>& dynamicMeshes)
{
  if (bodies.size() != dynamicMeshes.size())
  {
    throw std::logic_error("Body/mesh count mismatch: " +
                           std::to_string(bodies.size()) + " bodies, " +
                           std::to_string(dynamicMeshes.size()) + " meshes");
  }

  for (size_t i = 0; i < bodies.size(); ++i)
  {
    dynamicMeshes[i].moveTo(bodies[i].getInertialState().position);
  }
}

}  // namespace orb_sim::GeometrySync
