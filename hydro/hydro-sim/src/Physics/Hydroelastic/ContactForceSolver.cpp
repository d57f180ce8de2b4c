#include "hydro-sim/src/Physics/Hydroelastic/ContactForceSolver.hpp"

#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-sim/src/Physics/Hydroelastic/BoundingBoxTree.hpp"
#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace hydro_sim
{

namespace
{

double totalForce(const ContributionMap& contributions)
{
  double sum = 0.0;
  for (const auto& [index, contribution] : contributions)
  {
    sum += contribution.force;
  }
  return sum;
}

}  // namespace

ContactForceSolver::ContactForceSolver(ContactConfig config)
  : config_{config},
    collisionHandler_{config.collisionEpsilon,
                      config.gjkMaxIterations,
                      config.epaMaxIterations},
    narrowPhase_{config.collisionEpsilon, config.gjkMaxIterations},
    integrator_{ContactPlaneProjector{config.sortPolygonVertices}}
{
}

HydroelasticContact ContactForceSolver::computeContact(
  const TetrahedralMesh& mesh1,
  const TetrahedralMesh& mesh2,
  bool withDetails) const
{
  const ReferenceFrame& frame2 = mesh2.getFrame();

  // Work in mesh 2's frame so only mesh 1 needs transforming
  TetrahedralMesh const mesh1InFrame2 = mesh1.expressedIn(frame2);

  ConvexHull const hull1{mesh1InFrame2.getVertices()};
  ConvexHull const hull2{mesh2.getVertices()};
  std::optional<PenetrationResult> const penetration =
    collisionHandler_.checkCollision(
      hull1, hull2, !config_.validatePenetrationWithSAT);

  HydroelasticContact contact;
  if (!penetration)
  {
    spdlog::debug("Hydroelastic contact: no global intersection");
    return contact;
  }
  spdlog::debug("Hydroelastic contact: penetration {}",
                std::format("{}", *penetration));

  Plane const plane{penetration->contactPoint, penetration->normal};

  contact.intersects = true;
  contact.depth = penetration->depth;
  contact.planePoint = frame2.localToGlobal(penetration->contactPoint);
  contact.planeNormal = frame2.localToGlobalRelative(penetration->normal);

  BoundingBoxTree const tree1{mesh1InFrame2.getTetrahedronBoundingBoxes()};
  BoundingBoxTree const tree2{mesh2.getTetrahedronBoundingBoxes()};
  std::vector<IndexPair> const candidates =
    tree1.overlappingPairs(tree2, config_.maxBroadPhaseCandidates);
  if (config_.maxBroadPhaseCandidates != 0 &&
      candidates.size() >= config_.maxBroadPhaseCandidates)
  {
    spdlog::warn(
      "Hydroelastic contact: broad phase capped at {} candidate pairs",
      config_.maxBroadPhaseCandidates);
  }
  spdlog::debug("Hydroelastic contact: {} broad-phase candidates",
                candidates.size());

  std::vector<IndexPair> const confirmed =
    narrowPhase_.confirmPairs(mesh1InFrame2, mesh2, candidates, plane);
  spdlog::debug("Hydroelastic contact: {} confirmed pairs", confirmed.size());

  // Each tetrahedron contributes once per body, however many partners it has
  ContributionMap body1;
  ContributionMap body2;
  for (const auto& [index1, index2] : confirmed)
  {
    if (!body1.contains(index1))
    {
      body1.emplace(index1, integrator_.integrate(mesh1InFrame2, index1, plane));
    }
    if (!body2.contains(index2))
    {
      body2.emplace(index2, integrator_.integrate(mesh2, index2, plane));
    }
  }
  spdlog::debug("Hydroelastic contact: {} / {} contributing tetrahedra",
                body1.size(),
                body2.size());

  contact.wrench12.force = Vector3D{totalForce(body1) * contact.planeNormal};
  contact.wrench21.force = Vector3D{-totalForce(body2) * contact.planeNormal};

  if (withDetails)
  {
    contact.details = ContactDetails{std::move(body1), std::move(body2)};
  }

  return contact;
}

}  // namespace hydro_sim
