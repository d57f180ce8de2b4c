#ifndef HYDRO_SIM_PHYSICS_CONTACT_FORCE_SOLVER_HPP
#define HYDRO_SIM_PHYSICS_CONTACT_FORCE_SOLVER_HPP

#include "hydro-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactConfig.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactResult.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/NarrowPhase.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/PressureIntegrator.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/TetrahedralMesh.hpp"

namespace hydro_sim
{

/**
 * @brief Hydroelastic contact between two tetrahedral meshes.
 *
 * Pipeline, all in the second mesh's frame:
 * 1. Express mesh 1 in the frame of mesh 2
 * 2. Penetration query on the hulls of both vertex sets; its normal and
 *    contact point define the contact plane. No intersection ends here.
 * 3. Bounding box trees over both meshes' tetrahedra, overlapping pairs
 * 4. Narrow phase: plane straddle test and pairwise GJK confirmation
 * 5. Per-tetrahedron contributions (area * interpolated pressure), each
 *    tetrahedron index integrated once per body
 * 6. Sum per body, scale the world-frame plane normal
 *
 * Stateless between calls; one solver may serve any number of mesh pairs.
 */
class ContactForceSolver
{
public:
  explicit ContactForceSolver(ContactConfig config = ContactConfig{});

  /**
   * @brief Compute the contact wrenches between two meshes.
   *
   * @param mesh1 First body
   * @param mesh2 Second body
   * @param withDetails Attach per-tetrahedron contributions to the result
   * @return Contact with intersects == false if the hulls do not overlap
   * @throws ContactProjectionError on an internal straddle/projection
   *         disagreement
   */
  [[nodiscard]] HydroelasticContact computeContact(const TetrahedralMesh& mesh1,
                                                   const TetrahedralMesh& mesh2,
                                                   bool withDetails = false) const;

  [[nodiscard]] const ContactConfig& getConfig() const
  {
    return config_;
  }

private:
  ContactConfig config_;
  CollisionHandler collisionHandler_;
  NarrowPhase narrowPhase_;
  PressureIntegrator integrator_;
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_CONTACT_FORCE_SOLVER_HPP
