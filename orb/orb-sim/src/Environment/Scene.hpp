// Ticket: 0007_scene_geometry_sync

#ifndef ORB_SIM_ENVIRONMENT_SCENE_HPP
#define ORB_SIM_ENVIRONMENT_SCENE_HPP

#include "orb-assets/src/Geometry.hpp"
#include "orb-sim/src/Physics/RigidBody/BodyStore.hpp"

namespace orb_sim
{

/**
 * @brief Aggregate of everything the simulation mutates or renders
 *
 * Owns the body store and two mesh buffers:
 * - static: decoration, written during setup only
 * - dynamic: one mesh per body, same order as the store, rewritten every step
 *
 * Setup closes (the scene is sealed) once the first step runs. After that
 * the set of bodies and meshes is fixed for the session.
 */
class Scene
{
public:
  Scene() = default;

  /**
   * @brief Add a body together with its dynamic mesh
   *
   * The mesh is placed with its center at the body position.
   *
   * @return Handle of the new body
   * @throws std::logic_error if the scene is sealed
   * @throws std::invalid_argument on invalid body parameters
   */
  BodyHandle addBody(const Coordinate& position,
                     double radius,
                     double mass,
                     orb_assets::MeshData mesh);

  /**
   * @brief Add decoration geometry that never moves
   * @throws std::logic_error if the scene is sealed
   */
  void addStaticMesh(orb_assets::MeshData mesh, const Coordinate& center);

  /// Close setup; further add calls throw
  void seal()
  {
    sealed_ = true;
  }

  [[nodiscard]] bool isSealed() const
  {
    return sealed_;
  }

  BodyStore& getBodyStore()
  {
    return bodies_;
  }

  const BodyStore& getBodyStore() const
  {
    return bodies_;
  }

  orb_assets::MeshBuffer& getStaticBuffer()
  {
    return staticBuffer_;
  }

  const orb_assets::MeshBuffer& getStaticBuffer() const
  {
    return staticBuffer_;
  }

  orb_assets::MeshBuffer& getDynamicBuffer()
  {
    return dynamicBuffer_;
  }

  const orb_assets::MeshBuffer& getDynamicBuffer() const
  {
    return dynamicBuffer_;
  }

private:
  void requireOpen(const char* operation) const;

  BodyStore bodies_;
  orb_assets::MeshBuffer staticBuffer_;
  orb_assets::MeshBuffer dynamicBuffer_;
  bool sealed_{false};
};

}  // namespace orb_sim

#endif  // ORB_SIM_ENVIRONMENT_SCENE_HPP
