#ifndef HYDRO_SIM_PHYSICS_CONTACT_PLANE_PROJECTOR_HPP
#define HYDRO_SIM_PHYSICS_CONTACT_PLANE_PROJECTOR_HPP

#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/Geometry/Primitives.hpp"
#include "hydro-sim/src/Geometry/Tetrahedron.hpp"

namespace hydro_sim
{

/**
 * @brief A tetrahedron that was expected to straddle the contact plane
 * produced fewer than 3 polygon points.
 *
 * Signals disagreement between the straddle test and the projection, never
 * a legitimate "no contact" outcome.
 */
class ContactProjectionError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/**
 * @brief Cross section of a tetrahedron with the contact plane.
 *
 * Vertices are split into the strictly negative side and the non-negative
 * side of the plane. Every (negative, non-negative) vertex pair spans an
 * edge crossing the plane; the edge/plane intersections form the polygon:
 * 3 points for a 1/3 split, 4 for a 2/2 split.
 */
class ContactPlaneProjector
{
public:
  /**
   * @param sortVertices Order the polygon by angle around its centroid;
   *        otherwise the 2/2 enumeration order is rearranged into a cycle
   */
  explicit ContactPlaneProjector(bool sortVertices = true);

  /**
   * @brief Polygon where the tetrahedron meets the plane.
   *
   * @return 3 or 4 points on the plane, in cyclic order
   * @throws ContactProjectionError if fewer than 3 points result
   */
  [[nodiscard]] std::vector<Coordinate> project(
    const Plane& plane,
    const TetrahedronVertices& tetrahedron) const;

  /**
   * @brief Area of a triangle or of a quadrilateral given in cyclic order.
   *
   * The quadrilateral is split along the diagonal from point 0 to point 2.
   *
   * @throws std::invalid_argument unless there are 3 or 4 points
   */
  [[nodiscard]] static double polygonArea(std::span<const Coordinate> points);

  /**
   * @brief Mean of the polygon points.
   * @throws std::invalid_argument if points is empty
   */
  [[nodiscard]] static Coordinate polygonCentroid(
    std::span<const Coordinate> points);

private:
  static void sortByAngle(std::vector<Coordinate>& points,
                          const Vector3D& normal);

  bool sortVertices_;
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_CONTACT_PLANE_PROJECTOR_HPP
