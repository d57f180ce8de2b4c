#ifndef HYDRO_SIM_PHYSICS_TETRAHEDRAL_MESH_HPP
#define HYDRO_SIM_PHYSICS_TETRAHEDRAL_MESH_HPP

#include <Eigen/Dense>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/Environment/ReferenceFrame.hpp"
#include "hydro-sim/src/Geometry/Tetrahedron.hpp"

namespace hydro_sim
{

/**
 * @brief Volume mesh of a soft body with a scalar pressure potential.
 *
 * Vertices are expressed in the mesh frame; the ReferenceFrame maps them to
 * world coordinates. Each vertex carries one potential value (pressure at
 * that vertex); the field is linear inside each tetrahedron.
 *
 * Invariants (checked on construction):
 * - at least one tetrahedron
 * - every tetrahedron references 4 distinct vertices, all in range
 * - exactly one potential per vertex
 */
class TetrahedralMesh
{
public:
  /**
   * @throws std::invalid_argument if an invariant is violated
   */
  TetrahedralMesh(std::vector<Coordinate> vertices,
                  std::vector<TetrahedronIndices> tetrahedra,
                  std::vector<double> potentials,
                  ReferenceFrame frame = ReferenceFrame{});

  [[nodiscard]] const std::vector<Coordinate>& getVertices() const
  {
    return vertices_;
  }

  [[nodiscard]] const std::vector<TetrahedronIndices>& getTetrahedra() const
  {
    return tetrahedra_;
  }

  [[nodiscard]] const std::vector<double>& getPotentials() const
  {
    return potentials_;
  }

  [[nodiscard]] const ReferenceFrame& getFrame() const
  {
    return frame_;
  }

  [[nodiscard]] size_t getVertexCount() const
  {
    return vertices_.size();
  }

  [[nodiscard]] size_t getTetrahedronCount() const
  {
    return tetrahedra_.size();
  }

  /**
   * @brief Corner positions of tetrahedron @p index (mesh frame).
   * @throws std::out_of_range if index >= getTetrahedronCount()
   */
  [[nodiscard]] TetrahedronVertices getTetrahedronVertices(size_t index) const;

  /**
   * @brief Corner potentials of tetrahedron @p index, same order as
   * getTetrahedronVertices().
   * @throws std::out_of_range if index >= getTetrahedronCount()
   */
  [[nodiscard]] Eigen::Vector4d getTetrahedronPotentials(size_t index) const;

  /// Bounding box of every tetrahedron, in mesh-frame coordinates
  [[nodiscard]] std::vector<BoundingBox> getTetrahedronBoundingBoxes() const;

  /**
   * @brief The same body with its vertices expressed in another frame.
   *
   * The returned mesh has @p frame as its reference frame and unchanged
   * topology and potentials, so it describes the same world-space volume.
   */
  [[nodiscard]] TetrahedralMesh expressedIn(const ReferenceFrame& frame) const;

private:
  void validate() const;

  std::vector<Coordinate> vertices_;
  std::vector<TetrahedronIndices> tetrahedra_;
  std::vector<double> potentials_;  // One per vertex
  ReferenceFrame frame_;            // Mesh-to-world transform
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_TETRAHEDRAL_MESH_HPP
