#include "hydro-sim/src/Utils/TetrahedralMeshFactory.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hydro_sim
{

std::array<TetrahedronIndices, 6> TetrahedralMeshFactory::kuhnTetrahedra(
  const std::array<size_t, 8>& corners)
{
  // One tetrahedron per monotone path 0 -> 7 along the cell edges
  // (x then y, x then z, ...), all sharing the 0-7 diagonal
  return {TetrahedronIndices{corners[0], corners[1], corners[3], corners[7]},
          TetrahedronIndices{corners[0], corners[1], corners[5], corners[7]},
          TetrahedronIndices{corners[0], corners[2], corners[3], corners[7]},
          TetrahedronIndices{corners[0], corners[2], corners[6], corners[7]},
          TetrahedronIndices{corners[0], corners[4], corners[5], corners[7]},
          TetrahedronIndices{corners[0], corners[4], corners[6], corners[7]}};
}

TetrahedralMesh TetrahedralMeshFactory::createBox(const Vector3D& extents,
                                                  double potential,
                                                  const ReferenceFrame& frame)
{
  if ((extents.array() <= 0.0).any())
  {
    throw std::invalid_argument(
      std::format("Box extents must be positive, got {}", extents));
  }

  Vector3D const half{extents / 2.0};

  std::vector<Coordinate> vertices;
  vertices.reserve(8);
  for (size_t k = 0; k < 8; ++k)
  {
    vertices.emplace_back((k & 1) != 0 ? half.x() : -half.x(),
                          (k & 2) != 0 ? half.y() : -half.y(),
                          (k & 4) != 0 ? half.z() : -half.z());
  }

  auto const tetrahedra = kuhnTetrahedra({0, 1, 2, 3, 4, 5, 6, 7});

  return TetrahedralMesh{std::move(vertices),
                         std::vector<TetrahedronIndices>(tetrahedra.begin(),
                                                         tetrahedra.end()),
                         std::vector<double>(8, potential),
                         frame};
}

TetrahedralMesh TetrahedralMeshFactory::createCube(double size,
                                                   double potential,
                                                   const ReferenceFrame& frame)
{
  return createBox(Vector3D{size, size, size}, potential, frame);
}

TetrahedralMesh TetrahedralMeshFactory::createSubdividedCube(
  double size,
  size_t divisions,
  double stiffness,
  const ReferenceFrame& frame)
{
  if (size <= 0.0)
  {
    throw std::invalid_argument(
      std::format("Cube size must be positive, got {}", size));
  }
  if (divisions == 0)
  {
    throw std::invalid_argument("Cube needs at least one division");
  }

  double const half = size / 2.0;
  double const step = size / static_cast<double>(divisions);
  size_t const n = divisions + 1;  // Grid points per axis

  auto gridIndex = [n](size_t i, size_t j, size_t k) { return i + n * (j + n * k); };

  std::vector<Coordinate> vertices;
  std::vector<double> potentials;
  vertices.reserve(n * n * n);
  potentials.reserve(n * n * n);
  for (size_t k = 0; k < n; ++k)
  {
    for (size_t j = 0; j < n; ++j)
    {
      for (size_t i = 0; i < n; ++i)
      {
        Coordinate const point{-half + step * static_cast<double>(i),
                               -half + step * static_cast<double>(j),
                               -half + step * static_cast<double>(k)};
        double const depth = (half - point.array().abs()).minCoeff();
        vertices.push_back(point);
        potentials.push_back(stiffness * std::max(depth, 0.0));
      }
    }
  }

  std::vector<TetrahedronIndices> tetrahedra;
  tetrahedra.reserve(6 * divisions * divisions * divisions);
  for (size_t k = 0; k < divisions; ++k)
  {
    for (size_t j = 0; j < divisions; ++j)
    {
      for (size_t i = 0; i < divisions; ++i)
      {
        std::array<size_t, 8> corners{};
        for (size_t c = 0; c < 8; ++c)
        {
          corners[c] = gridIndex(i + (c & 1), j + ((c >> 1) & 1), k + ((c >> 2) & 1));
        }
        for (const auto& tetrahedron : kuhnTetrahedra(corners))
        {
          tetrahedra.push_back(tetrahedron);
        }
      }
    }
  }

  return TetrahedralMesh{
    std::move(vertices), std::move(tetrahedra), std::move(potentials), frame};
}

}  // namespace hydro_sim
