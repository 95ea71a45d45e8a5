// Ticket: 0007_scene_geometry_sync

#include "orb-sim/src/Environment/Scene.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace orb_sim
{

BodyHandle Scene::addBody(const Coordinate& position,
                          double radius,
                          double mass,
                          orb_assets::MeshData mesh)
{
  requireOpen("addBody");

  // Body first: it validates and throws before any mesh is appended
  BodyHandle const handle = bodies_.add(position, radius, mass);
  dynamicBuffer_.append(std::move(mesh), position);
  return handle;
}

void Scene::addStaticMesh(orb_assets::MeshData mesh, const Coordinate& center)
{
  requireOpen("addStaticMesh");
  staticBuffer_.append(std::move(mesh), center);
}

void Scene::requireOpen(const char* operation) const
{
  if (sealed_)
  {
    throw std::logic_error(std::string{operation} +
                           " called after the simulation started");
  }
}

}  // namespace orb_sim
