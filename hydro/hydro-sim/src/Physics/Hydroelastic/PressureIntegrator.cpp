#include "hydro-sim/src/Physics/Hydroelastic/PressureIntegrator.hpp"

#include <utility>

#include "hydro-sim/src/Geometry/Tetrahedron.hpp"

namespace hydro_sim
{

PressureIntegrator::PressureIntegrator(ContactPlaneProjector projector)
  : projector_{std::move(projector)}
{
}

TetrahedronContribution PressureIntegrator::integrate(
  const TetrahedralMesh& mesh,
  size_t tetrahedronIndex,
  const Plane& plane) const
{
  TetrahedronVertices const corners =
    mesh.getTetrahedronVertices(tetrahedronIndex);

  TetrahedronContribution contribution;
  contribution.polygon = projector_.project(plane, corners);
  contribution.area = ContactPlaneProjector::polygonArea(contribution.polygon);
  contribution.centroid =
    ContactPlaneProjector::polygonCentroid(contribution.polygon);

  Eigen::Vector4d const weights =
    barycentricCoordinates(contribution.centroid, corners);
  contribution.pressure =
    weights.dot(mesh.getTetrahedronPotentials(tetrahedronIndex));
  contribution.force = contribution.area * contribution.pressure;

  return contribution;
}

}  // namespace hydro_sim
