#ifndef HYDRO_SIM_PHYSICS_COLLISION_HANDLER_HPP
#define HYDRO_SIM_PHYSICS_COLLISION_HANDLER_HPP

#include <optional>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"
#include "hydro-sim/src/Physics/Collision/PenetrationResult.hpp"
#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace hydro_sim
{

/**
 * @brief Orchestrates the penetration query between two convex hulls.
 *
 * - Runs GJK to detect intersection
 * - If collision detected, runs EPA for the penetration normal and depth
 * - Validates EPA against the SAT minimum over both hulls' face normals
 * - Places the contact point on the mid-plane of the overlap slab
 *
 * Returns std::nullopt when the hulls do not intersect.
 */
class CollisionHandler
{
public:
  /**
   * @param epsilon Numerical tolerance for GJK/EPA (default: 1e-6)
   * @param gjkMaxIterations GJK iteration budget
   * @param epaMaxIterations EPA expansion budget
   */
  explicit CollisionHandler(double epsilon = 1e-6,
                            int gjkMaxIterations = 64,
                            int epaMaxIterations = 64);

  /**
   * @brief Check for penetration between two hulls in a shared frame.
   *
   * @param hullA First hull
   * @param hullB Second hull
   * @param skipSATValidation If true, trust the EPA result as is
   * @return std::nullopt if no collision, PenetrationResult otherwise
   */
  [[nodiscard]] std::optional<PenetrationResult> checkCollision(
    const ConvexHull& hullA,
    const ConvexHull& hullB,
    bool skipSATValidation = false) const;

  CollisionHandler(const CollisionHandler&) = default;
  CollisionHandler(CollisionHandler&&) noexcept = default;
  CollisionHandler& operator=(const CollisionHandler&) = default;
  CollisionHandler& operator=(CollisionHandler&&) noexcept = default;
  ~CollisionHandler() = default;

private:
  /// @brief SAT result: minimum overlap and the face normal it occurs along
  struct SATResult
  {
    double depth;
    Vector3D normal;
  };

  /// @brief Minimum overlap over all unique face normals of both hulls.
  ///
  /// overlap(d) = supportMinkowski(A, B, d) . d, positive when A reaches past
  /// B along d. A negative minimum is a separating axis.
  [[nodiscard]] SATResult computeSATMinPenetration(
    const ConvexHull& hullA,
    const ConvexHull& hullB) const;

  /// @brief Point on the plane halfway between A's furthest extent along
  /// @p normal and B's nearest extent, under the midpoint of the centroids.
  [[nodiscard]] static Coordinate computeContactPoint(const ConvexHull& hullA,
                                                      const ConvexHull& hullB,
                                                      const Vector3D& normal);

  double epsilon_;
  int gjkMaxIterations_;
  int epaMaxIterations_;
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_COLLISION_HANDLER_HPP
