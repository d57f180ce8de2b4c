#ifndef HYDRO_SIM_PHYSICS_NARROW_PHASE_HPP
#define HYDRO_SIM_PHYSICS_NARROW_PHASE_HPP

#include <Eigen/Dense>
#include <span>
#include <vector>

#include "hydro-sim/src/Geometry/Primitives.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/BoundingBoxTree.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/TetrahedralMesh.hpp"

namespace hydro_sim
{

/**
 * @brief Narrow-phase filter of broad-phase tetrahedron pairs.
 *
 * A pair survives when both tetrahedra straddle the contact plane and the
 * convex hulls of the two tetrahedra intersect (GJK). Both meshes must have
 * their vertices expressed in the same frame as the plane.
 */
class NarrowPhase
{
public:
  /**
   * @param epsilon GJK tolerance
   * @param maxIterations GJK iteration budget
   */
  explicit NarrowPhase(double epsilon = 1e-6, int maxIterations = 64);

  /**
   * @brief True iff the distances contain a strictly negative value and a
   * non-negative one.
   *
   * A vertex lying exactly on the plane counts as non-negative.
   */
  static bool straddlesPlane(const Eigen::Vector4d& signedDistances);

  /**
   * @brief Straddle flag for every tetrahedron of a mesh.
   */
  static std::vector<bool> straddlingTetrahedra(const TetrahedralMesh& mesh,
                                                const Plane& plane);

  /**
   * @brief Keep the candidate pairs that straddle and truly overlap.
   *
   * Pairs involving a degenerate (flat) tetrahedron are dropped with a
   * warning. Each tetrahedron's hull is built at most once per call.
   *
   * @param candidates (index in mesh1, index in mesh2) pairs
   * @return Confirmed pairs, in candidate order
   */
  [[nodiscard]] std::vector<IndexPair> confirmPairs(
    const TetrahedralMesh& mesh1,
    const TetrahedralMesh& mesh2,
    std::span<const IndexPair> candidates,
    const Plane& plane) const;

private:
  double epsilon_;
  int maxIterations_;
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_NARROW_PHASE_HPP
