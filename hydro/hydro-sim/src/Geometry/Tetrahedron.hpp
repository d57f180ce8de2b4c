#ifndef HYDRO_SIM_GEOMETRY_TETRAHEDRON_HPP
#define HYDRO_SIM_GEOMETRY_TETRAHEDRON_HPP

#include <Eigen/Dense>
#include <array>
#include <span>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/Geometry/BoundingBox.hpp"

namespace hydro_sim
{

/// Four vertex indices into a mesh's vertex array
using TetrahedronIndices = std::array<size_t, 4>;

/// The four corner positions of one tetrahedron
using TetrahedronVertices = std::array<Coordinate, 4>;

/**
 * @brief Barycentric coordinates of a point with respect to a tetrahedron.
 *
 * The weights sum to 1 and reproduce the point as their weighted sum of the
 * vertices. Points outside the tetrahedron get negative weights; this is not
 * an error.
 *
 * @throws std::invalid_argument if the tetrahedron is degenerate (zero volume)
 */
Eigen::Vector4d barycentricCoordinates(const Coordinate& point,
                                       const TetrahedronVertices& tetrahedron);

/**
 * @brief Signed volume, positive when (v1-v0, v2-v0, v3-v0) is right-handed.
 */
double tetrahedronSignedVolume(const TetrahedronVertices& tetrahedron);

BoundingBox tetrahedronBoundingBox(const TetrahedronVertices& tetrahedron);

/**
 * @brief One bounding box per tetrahedron of a mesh.
 *
 * @throws std::out_of_range if a tetrahedron references a missing vertex
 */
std::vector<BoundingBox> tetrahedraBoundingBoxes(
  std::span<const Coordinate> vertices,
  std::span<const TetrahedronIndices> tetrahedra);

}  // namespace hydro_sim

#endif  // HYDRO_SIM_GEOMETRY_TETRAHEDRON_HPP
