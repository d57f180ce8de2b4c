#ifndef HYDRO_SIM_PHYSICS_CONTACT_CONFIG_HPP
#define HYDRO_SIM_PHYSICS_CONTACT_CONFIG_HPP

#include <cstddef>

namespace hydro_sim
{

/**
 * @brief Tuning parameters of the hydroelastic contact solver.
 */
struct ContactConfig
{
  /// Tolerance of the GJK/EPA penetration query and the pair confirmation
  double collisionEpsilon{1e-6};

  int gjkMaxIterations{64};

  int epaMaxIterations{64};

  /// Order contact polygons by angle around their centroid. When false the
  /// vertex-pair enumeration order is rearranged combinatorially instead.
  bool sortPolygonVertices{true};

  /// Cross-check EPA against the SAT minimum penetration
  bool validatePenetrationWithSAT{true};

  /// Upper bound on broad-phase candidate pairs, 0 = unlimited. When the
  /// bound is hit the remaining candidates are ignored.
  size_t maxBroadPhaseCandidates{0};
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_CONTACT_CONFIG_HPP
