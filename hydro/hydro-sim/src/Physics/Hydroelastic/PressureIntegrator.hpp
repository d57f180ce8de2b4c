#ifndef HYDRO_SIM_PHYSICS_PRESSURE_INTEGRATOR_HPP
#define HYDRO_SIM_PHYSICS_PRESSURE_INTEGRATOR_HPP

#include "hydro-sim/src/Geometry/Primitives.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactPlaneProjector.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactResult.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/TetrahedralMesh.hpp"

namespace hydro_sim
{

/**
 * @brief Force contribution of one tetrahedron cut by the contact plane.
 *
 * The contact polygon is reduced to its centroid: the pressure is the
 * mesh potential interpolated there with barycentric weights, and the
 * contribution is area * pressure. A centroid slightly outside the
 * tetrahedron (negative weights) is accepted.
 */
class PressureIntegrator
{
public:
  explicit PressureIntegrator(ContactPlaneProjector projector = ContactPlaneProjector{});

  /**
   * @param mesh Mesh expressed in the same frame as @p plane
   * @param tetrahedronIndex Tetrahedron cut by the plane
   * @throws ContactProjectionError if the tetrahedron does not straddle
   * @throws std::invalid_argument if the tetrahedron is degenerate
   */
  [[nodiscard]] TetrahedronContribution integrate(const TetrahedralMesh& mesh,
                                                  size_t tetrahedronIndex,
                                                  const Plane& plane) const;

private:
  ContactPlaneProjector projector_;
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_PRESSURE_INTEGRATOR_HPP
