// Ticket: 0003_sphere_pair_collision

#include "orb-sim/src/Physics/CollisionResponse.hpp"

#include "orb-sim/src/Utils/utils.hpp"

namespace orb_sim::CollisionResponse
{

std::optional<CollisionResult> detectOverlap(const Body& bodyA,
                                             const Body& bodyB)
{
  Coordinate const offset = bodyB.getInertialState().position -
                            bodyA.getInertialState().position;
  double const distance = offset.norm();
  double const radiusSum = bodyA.getRadius() + bodyB.getRadius();

  if (distance >= radiusSum)
  {
    return std::nullopt;
  }

  // Coincident centers: no defined line of centers to push along
  if (distance < kDegenerateDistance)
  {
    return std::nullopt;
  }

  return CollisionResult{Coordinate{offset / distance}, radiusSum - distance};
}

std::optional<double> computeImpulseMagnitude(const Body& bodyA,
                                              const Body& bodyB,
                                              const CollisionResult& result,
                                              double restitution)
{
  Velocity const relativeVelocity = bodyB.getInertialState().velocity -
                                    bodyA.getInertialState().velocity;
  double const vRelNormal = relativeVelocity.dot(result.normal);

  // Already separating: constraint satisfied
  if (vRelNormal > 0.0)
  {
    return std::nullopt;
  }

  double const inverseMassSum =
    bodyA.getInverseMass() + bodyB.getInverseMass();

  return -(1.0 + restitution) * vRelNormal / inverseMassSum;
}

void applyImpulse(Body& bodyA,
                  Body& bodyB,
                  const CollisionResult& result,
                  double impulseMagnitude)
{
  Coordinate const impulse{result.normal * impulseMagnitude};

  bodyA.getInertialState().velocity -= impulse * bodyA.getInverseMass();
  bodyB.getInertialState().velocity += impulse * bodyB.getInverseMass();
}

void applyPositionCorrection(Body& bodyA,
                             Body& bodyB,
                             const CollisionResult& result)
{
  double const inverseMassA = bodyA.getInverseMass();
  double const inverseMassB = bodyB.getInverseMass();
  double const inverseMassSum = inverseMassA + inverseMassB;

  Coordinate const correction{result.normal * result.penetrationDepth};

  bodyA.getInertialState().position -=
    correction * (inverseMassA / inverseMassSum);
  bodyB.getInertialState().position +=
    correction * (inverseMassB / inverseMassSum);
}

bool collideWith(Body& bodyA, Body& bodyB, double restitution)
{
  auto const contact = detectOverlap(bodyA, bodyB);
  if (!contact)
  {
    return false;
  }

  auto const impulse =
    computeImpulseMagnitude(bodyA, bodyB, *contact, restitution);
  if (!impulse)
  {
    // Separating: leave both velocities and positions alone
    return false;
  }

  applyImpulse(bodyA, bodyB, *contact, *impulse);
  applyPositionCorrection(bodyA, bodyB, *contact);

  return true;
}

}  // namespace orb_sim::CollisionResponse
