#include "hydro-sim/src/Physics/Hydroelastic/TetrahedralMesh.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace hydro_sim
{

TetrahedralMesh::TetrahedralMesh(std::vector<Coordinate> vertices,
                                 std::vector<TetrahedronIndices> tetrahedra,
                                 std::vector<double> potentials,
                                 ReferenceFrame frame)
  : vertices_{std::move(vertices)},
    tetrahedra_{std::move(tetrahedra)},
    potentials_{std::move(potentials)},
    frame_{std::move(frame)}
{
  validate();
}

TetrahedronVertices TetrahedralMesh::getTetrahedronVertices(size_t index) const
{
  const auto& indices = tetrahedra_.at(index);
  return TetrahedronVertices{vertices_[indices[0]],
                             vertices_[indices[1]],
                             vertices_[indices[2]],
                             vertices_[indices[3]]};
}

Eigen::Vector4d TetrahedralMesh::getTetrahedronPotentials(size_t index) const
{
  const auto& indices = tetrahedra_.at(index);
  return Eigen::Vector4d{potentials_[indices[0]],
                         potentials_[indices[1]],
                         potentials_[indices[2]],
                         potentials_[indices[3]]};
}

std::vector<BoundingBox> TetrahedralMesh::getTetrahedronBoundingBoxes() const
{
  return tetrahedraBoundingBoxes(vertices_, tetrahedra_);
}

TetrahedralMesh TetrahedralMesh::expressedIn(const ReferenceFrame& frame) const
{
  // Maps this mesh's local coordinates into frame's local coordinates
  ReferenceFrame const meshToFrame = frame_.relativeTo(frame);

  Eigen::Matrix3Xd points(3, static_cast<Eigen::Index>(vertices_.size()));
  for (size_t i = 0; i < vertices_.size(); ++i)
  {
    points.col(static_cast<Eigen::Index>(i)) = vertices_[i];
  }
  meshToFrame.localToGlobalBatch(points);

  std::vector<Coordinate> transformed;
  transformed.reserve(vertices_.size());
  for (Eigen::Index i = 0; i < points.cols(); ++i)
  {
    transformed.emplace_back(points.col(i));
  }

  return TetrahedralMesh{std::move(transformed), tetrahedra_, potentials_, frame};
}

void TetrahedralMesh::validate() const
{
  if (tetrahedra_.empty())
  {
    throw std::invalid_argument("TetrahedralMesh: mesh has no tetrahedra");
  }

  if (potentials_.size() != vertices_.size())
  {
    throw std::invalid_argument(
      std::format("TetrahedralMesh: {} potentials for {} vertices",
                  potentials_.size(),
                  vertices_.size()));
  }

  for (size_t t = 0; t < tetrahedra_.size(); ++t)
  {
    const auto& indices = tetrahedra_[t];
    for (size_t k = 0; k < indices.size(); ++k)
    {
      if (indices[k] >= vertices_.size())
      {
        throw std::invalid_argument(
          std::format("TetrahedralMesh: tetrahedron {} references vertex {} "
                      "but the mesh has {} vertices",
                      t,
                      indices[k],
                      vertices_.size()));
      }
      for (size_t m = k + 1; m < indices.size(); ++m)
      {
        if (indices[k] == indices[m])
        {
          throw std::invalid_argument(
            std::format("TetrahedralMesh: tetrahedron {} repeats vertex {}",
                        t,
                        indices[k]));
        }
      }
    }
  }
}

}  // namespace hydro_sim
