#include "hydro-sim/src/Geometry/Tetrahedron.hpp"

#include <format>
#include <stdexcept>

namespace hydro_sim
{

Eigen::Vector4d barycentricCoordinates(const Coordinate& point,
                                       const TetrahedronVertices& tetrahedron)
{
  const Coordinate& v3 = tetrahedron[3];

  Eigen::Matrix3d edges;
  edges.col(0) = tetrahedron[0] - v3;
  edges.col(1) = tetrahedron[1] - v3;
  edges.col(2) = tetrahedron[2] - v3;

  Eigen::FullPivLU<Eigen::Matrix3d> const lu{edges};
  if (!lu.isInvertible())
  {
    throw std::invalid_argument(
      std::format("barycentricCoordinates: degenerate tetrahedron {} {} {} {}",
                  tetrahedron[0],
                  tetrahedron[1],
                  tetrahedron[2],
                  tetrahedron[3]));
  }

  Eigen::Vector3d const lambda = lu.solve(Eigen::Vector3d{point - v3});

  Eigen::Vector4d weights;
  weights << lambda, 1.0 - lambda.sum();
  return weights;
}

double tetrahedronSignedVolume(const TetrahedronVertices& tetrahedron)
{
  Eigen::Vector3d const a = tetrahedron[1] - tetrahedron[0];
  Eigen::Vector3d const b = tetrahedron[2] - tetrahedron[0];
  Eigen::Vector3d const c = tetrahedron[3] - tetrahedron[0];
  return a.dot(b.cross(c)) / 6.0;
}

BoundingBox tetrahedronBoundingBox(const TetrahedronVertices& tetrahedron)
{
  return BoundingBox::fromPoints(tetrahedron);
}

std::vector<BoundingBox> tetrahedraBoundingBoxes(
  std::span<const Coordinate> vertices,
  std::span<const TetrahedronIndices> tetrahedra)
{
  std::vector<BoundingBox> boxes;
  boxes.reserve(tetrahedra.size());

  for (const auto& indices : tetrahedra)
  {
    TetrahedronVertices corners;
    for (size_t k = 0; k < indices.size(); ++k)
    {
      if (indices[k] >= vertices.size())
      {
        throw std::out_of_range(
          std::format("tetrahedraBoundingBoxes: vertex index {} out of range "
                      "(vertex count {})",
                      indices[k],
                      vertices.size()));
      }
      corners[k] = vertices[indices[k]];
    }
    boxes.push_back(tetrahedronBoundingBox(corners));
  }

  return boxes;
}

}  // namespace hydro_sim
