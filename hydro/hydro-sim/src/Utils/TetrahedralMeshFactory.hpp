#ifndef HYDRO_SIM_UTILS_TETRAHEDRAL_MESH_FACTORY_HPP
#define HYDRO_SIM_UTILS_TETRAHEDRAL_MESH_FACTORY_HPP

#include <array>

#include "hydro-sim/src/DataTypes/Vector3D.hpp"
#include "hydro-sim/src/Environment/ReferenceFrame.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/TetrahedralMesh.hpp"

namespace hydro_sim
{

/**
 * @brief Factory class for common tetrahedral volume meshes
 *
 * Every mesh is centred on the origin of its frame. Boxes are split into
 * tetrahedra with the Kuhn decomposition: six tetrahedra sharing the
 * diagonal from the (-,-,-) corner to the (+,+,+) corner. Neighbouring
 * cells use the same split, so subdivided meshes are conforming.
 */
class TetrahedralMeshFactory
{
public:
  /**
   * @brief Box with a uniform potential
   *
   * @param extents Full side lengths along x, y and z
   * @param potential Value assigned to all 8 vertices
   * @param frame Mesh-to-world transform
   * @throws std::invalid_argument if any extent is not positive
   */
  static TetrahedralMesh createBox(const Vector3D& extents,
                                   double potential,
                                   const ReferenceFrame& frame = ReferenceFrame{});

  /**
   * @brief Cube of side length @p size with a uniform potential
   * @throws std::invalid_argument if size is not positive
   */
  static TetrahedralMesh createCube(double size,
                                    double potential,
                                    const ReferenceFrame& frame = ReferenceFrame{});

  /**
   * @brief Cube split into divisions^3 cells, 6 tetrahedra per cell
   *
   * The potential of each vertex is stiffness times its depth below the
   * nearest face: zero on the surface, largest at the centre.
   *
   * @throws std::invalid_argument if size is not positive or divisions is 0
   */
  static TetrahedralMesh createSubdividedCube(
    double size,
    size_t divisions,
    double stiffness,
    const ReferenceFrame& frame = ReferenceFrame{});

private:
  /**
   * @brief The six Kuhn tetrahedra of a cell
   * @param corners Vertex index of each cell corner, corner k at offset
   *        (k & 1, (k >> 1) & 1, (k >> 2) & 1)
   */
  static std::array<TetrahedronIndices, 6> kuhnTetrahedra(
    const std::array<size_t, 8>& corners);
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_UTILS_TETRAHEDRAL_MESH_FACTORY_HPP
