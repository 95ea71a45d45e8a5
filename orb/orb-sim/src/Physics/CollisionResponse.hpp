// Ticket: 0003_sphere_pair_collision

#ifndef ORB_SIM_PHYSICS_COLLISION_RESPONSE_HPP
#define ORB_SIM_PHYSICS_COLLISION_RESPONSE_HPP

#include <optional>

#include "orb-sim/src/Physics/CollisionResult.hpp"
#include "orb-sim/src/Physics/RigidBody/Body.hpp"

namespace orb_sim
{

/**
 * @brief Stateless utility namespace for sphere-sphere impulse response.
 *
 * Frictionless, non-rotating contact between two spheres. The contact
 * normal is the line of centers, so the response reduces to a single
 * scalar impulse along it:
 *
 *   v_rel = (v_B - v_A) . n
 *   j     = -(1 + e) * v_rel / (1/m_A + 1/m_B)
 *   v_A  -= j * n / m_A
 *   v_B  += j * n / m_B
 *
 * followed by a positional split that removes the overlap in inverse-mass
 * proportion. Pairs that are already separating (v_rel > 0) are left
 * untouched, positions included.
 *
 * @ticket 0003_sphere_pair_collision
 */
namespace CollisionResponse
{

// ========== Constants ==========

/**
 * @brief Default coefficient of restitution for ball-ball contact.
 */
constexpr double kDefaultRestitution = 0.95;

// ========== Detection ==========

/**
 * @brief Test two spheres for overlap.
 *
 * Overlap iff |x_B - x_A| < r_A + r_B (strict; touching is not contact).
 *
 * @return Contact normal (A->B) and penetration depth, or std::nullopt when
 *         the spheres do not overlap or their centers coincide (no usable
 *         normal)
 */
std::optional<CollisionResult> detectOverlap(const Body& bodyA,
                                             const Body& bodyB);

// ========== Response ==========

/**
 * @brief Compute the scalar normal impulse for a contact.
 *
 * @param bodyA First body
 * @param bodyB Second body
 * @param result Contact from detectOverlap
 * @param restitution Coefficient of restitution [0, 1]
 * @return Impulse magnitude j [N*s], or std::nullopt when the bodies are
 *         separating (v_rel > 0) and the contact needs no response
 */
std::optional<double> computeImpulseMagnitude(const Body& bodyA,
                                              const Body& bodyB,
                                              const CollisionResult& result,
                                              double restitution);

/**
 * @brief Apply a normal impulse of magnitude j to both bodies.
 */
void applyImpulse(Body& bodyA,
                  Body& bodyB,
                  const CollisionResult& result,
                  double impulseMagnitude);

/**
 * @brief Push the bodies apart along the normal until they just touch.
 *
 * The overlap is split by inverse mass: the lighter body moves further.
 * Equal masses each move half the penetration depth.
 */
void applyPositionCorrection(Body& bodyA,
                             Body& bodyB,
                             const CollisionResult& result);

/**
 * @brief Detect and resolve contact between two bodies.
 *
 * Runs detectOverlap; on contact that is not separating applies the
 * impulse and the positional correction.
 *
 * @param restitution Coefficient of restitution [0, 1]
 * @return true if the pair was in approaching contact and was resolved
 */
bool collideWith(Body& bodyA,
                 Body& bodyB,
                 double restitution = kDefaultRestitution);

}  // namespace CollisionResponse

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_COLLISION_RESPONSE_HPP
