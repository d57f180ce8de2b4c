#include "hydro-sim/src/Physics/Collision/CollisionHandler.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "hydro-sim/src/Physics/Collision/EPA.hpp"
#include "hydro-sim/src/Physics/Collision/GJK.hpp"
#include "hydro-sim/src/Physics/SupportFunction.hpp"

namespace hydro_sim
{

CollisionHandler::CollisionHandler(double epsilon,
                                   int gjkMaxIterations,
                                   int epaMaxIterations)
  : epsilon_{epsilon},
    gjkMaxIterations_{gjkMaxIterations},
    epaMaxIterations_{epaMaxIterations}
{
}

std::optional<PenetrationResult> CollisionHandler::checkCollision(
  const ConvexHull& hullA,
  const ConvexHull& hullB,
  bool skipSATValidation) const
{
  // Phase 1: intersection test via GJK
  GJK gjk{hullA, hullB, epsilon_};
  if (!gjk.intersects(gjkMaxIterations_))
  {
    return std::nullopt;
  }

  // Phase 2: penetration normal and depth via EPA
  std::optional<EPA::Result> epaResult;
  try
  {
    EPA epa{hullA, hullB, epsilon_};
    epaResult = epa.computePenetration(gjk.getSimplex(), epaMaxIterations_);
  }
  catch (const std::runtime_error& e)
  {
    if (skipSATValidation)
    {
      throw;
    }
    spdlog::warn("EPA failed ({}), falling back to SAT", e.what());
  }

  Vector3D normal{0.0, 0.0, 1.0};
  double depth{0.0};
  if (epaResult)
  {
    normal = epaResult->normal;
    depth = epaResult->depth;
  }

  // Phase 3: EPA picks arbitrary faces when the origin sits on the boundary
  // of A - B. Replace results that are wildly deeper than the SAT minimum.
  if (!skipSATValidation)
  {
    SATResult const sat = computeSATMinPenetration(hullA, hullB);
    if (sat.depth < -epsilon_)
    {
      // Face normal separates the hulls
      return std::nullopt;
    }

    if (!epaResult || depth > sat.depth * 10.0 + epsilon_)
    {
      normal = sat.normal;
      depth = std::max(sat.depth, 0.0);
    }
  }

  return PenetrationResult{
    depth, normal, computeContactPoint(hullA, hullB, normal)};
}

CollisionHandler::SATResult CollisionHandler::computeSATMinPenetration(
  const ConvexHull& hullA,
  const ConvexHull& hullB) const
{
  double minOverlap = std::numeric_limits<double>::infinity();
  Vector3D bestNormal{0.0, 0.0, 1.0};

  // Qhull triangulates, so coplanar facets repeat the same normal
  std::vector<Vector3D> checkedNormals;

  auto checkFaceNormals = [&](const ConvexHull& hull)
  {
    for (const auto& facet : hull.getFacets())
    {
      Vector3D const faceNormal{facet.normal};

      bool const isDuplicate =
        std::ranges::any_of(checkedNormals,
                            [&](const Vector3D& checked)
                            { return (faceNormal - checked).norm() < 1e-6; });
      if (isDuplicate)
      {
        continue;
      }
      checkedNormals.push_back(faceNormal);

      double const overlap =
        support_function::supportMinkowski(hullA, hullB, faceNormal)
          .dot(faceNormal);
      if (overlap < minOverlap)
      {
        minOverlap = overlap;
        bestNormal = faceNormal;
      }
    }
  };

  checkFaceNormals(hullA);
  checkFaceNormals(hullB);

  return SATResult{minOverlap, bestNormal};
}

Coordinate CollisionHandler::computeContactPoint(const ConvexHull& hullA,
                                                 const ConvexHull& hullB,
                                                 const Vector3D& normal)
{
  double const extentA =
    normal.dot(support_function::support(hullA, normal));
  double const extentB =
    normal.dot(support_function::support(hullB, Vector3D{-normal}));
  double const planeOffset = 0.5 * (extentA + extentB);

  Coordinate const midpoint{0.5 * (hullA.getCentroid() + hullB.getCentroid())};
  return Coordinate{midpoint + (planeOffset - normal.dot(midpoint)) * normal};
}

}  // namespace hydro_sim
