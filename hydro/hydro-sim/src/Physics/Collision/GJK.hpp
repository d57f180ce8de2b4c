#ifndef HYDRO_SIM_PHYSICS_GJK_HPP
#define HYDRO_SIM_PHYSICS_GJK_HPP

#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace hydro_sim
{

/**
 * @brief Boolean overlap test between two convex hulls (Gilbert-Johnson-Keerthi).
 *
 * Grows a simplex of Minkowski-difference support points toward the origin.
 * The hulls overlap once the simplex encloses the origin; the enclosing
 * simplex is kept for EPA. Both hulls are read in the same frame.
 */
class GJK
{
public:
  /// Holds references; both hulls must outlive the GJK object.
  GJK(const ConvexHull& hullA, const ConvexHull& hullB, double epsilon = 1e-6);

  /**
   * @brief Run the simplex search.
   *
   * @param maxIterations Support queries before reporting no overlap
   * @return true when A - B contains the origin
   */
  bool intersects(int maxIterations = 64);

  /**
   * @brief Terminating simplex, the input of EPA.
   *
   * @pre intersects() returned true. Usually 4 vertices enclosing the origin;
   *      fewer when the origin was hit on a lower-dimensional simplex.
   */
  [[nodiscard]] const std::vector<Coordinate>& getSimplex() const
  {
    return simplex_;
  }

private:
  bool updateSimplex();

  bool handleLine();

  bool handleTriangle();

  bool handleTetrahedron();

  static bool sameDirection(const Coordinate& direction, const Coordinate& ao);

  const ConvexHull& hullA_;
  const ConvexHull& hullB_;
  double epsilon_;

  std::vector<Coordinate> simplex_;  // Oldest vertex first
  Coordinate direction_;             // Current search direction (unit)
};

/// One-shot GJK::intersects() for callers that do not need the simplex.
bool gjkIntersects(const ConvexHull& hullA,
                   const ConvexHull& hullB,
                   double epsilon = 1e-6,
                   int maxIterations = 64);

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_GJK_HPP
