// Ticket: 0003_sphere_pair_collision

#ifndef ORB_SIM_PHYSICS_COLLISION_RESULT_HPP
#define ORB_SIM_PHYSICS_COLLISION_RESULT_HPP

#include <limits>

#include "orb-sim/src/DataTypes/Coordinate.hpp"

namespace orb_sim
{

/**
 * @brief Contact information for an overlapping pair of spheres.
 *
 * Returned by CollisionResponse::detectOverlap when the spheres intersect.
 * It carries no 'intersecting' flag: detectOverlap returns
 * std::optional<CollisionResult> and std::nullopt means no contact.
 *
 * Contact normal points from body A toward body B.
 *
 * @ticket 0003_sphere_pair_collision
 */
struct CollisionResult
{
  Coordinate normal;  // Contact normal (world space, A->B, unit length)
  double penetrationDepth{
    std::numeric_limits<double>::quiet_NaN()};  // Overlap distance [m]

  CollisionResult() = default;

  CollisionResult(const Coordinate& n, double depth)
    : normal{n}, penetrationDepth{depth}
  {
  }

  CollisionResult(const CollisionResult&) = default;
  CollisionResult(CollisionResult&&) noexcept = default;
  CollisionResult& operator=(const CollisionResult&) = default;
  CollisionResult& operator=(CollisionResult&&) noexcept = default;
  ~CollisionResult() = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_COLLISION_RESULT_HPP
