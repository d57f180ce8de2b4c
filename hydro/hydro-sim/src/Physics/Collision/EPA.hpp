#ifndef HYDRO_SIM_PHYSICS_EPA_HPP
#define HYDRO_SIM_PHYSICS_EPA_HPP

#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Facet.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"
#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace hydro_sim
{

/**
 * @brief Expanding Polytope Algorithm (EPA) for penetration depth.
 *
 * Expands the GJK terminating simplex (which contains the origin) inside
 * the Minkowski difference A - B until the polytope face closest to the
 * origin lies on the boundary of A - B. That face gives the minimum
 * translation: its normal points from A toward B and its distance from the
 * origin is the penetration depth.
 *
 * Each iteration queries the support point along the closest face normal.
 * When it gains less than epsilon over that face the search stops; otherwise
 * the faces visible from the new point are replaced by a fan over the
 * horizon.
 */
class EPA
{
public:
  struct Result
  {
    Vector3D normal;       // Unit normal, A toward B
    double depth{0.0};     // Penetration depth along normal
    bool converged{false};
  };

  /// @p hullB is read in the frame of @p hullA; both must outlive the EPA.
  EPA(const ConvexHull& hullA, const ConvexHull& hullB, double epsilon = 1e-6);

  /**
   * @brief Compute penetration normal and depth from a GJK simplex.
   *
   * Simplices with fewer than 4 vertices are completed with support points
   * along the coordinate axes. If the iteration budget runs out, the closest
   * face found so far is returned with converged == false.
   *
   * @param simplex GJK terminating simplex (Minkowski space)
   * @param maxIterations Maximum expansion iterations (default: 64)
   * @throws std::invalid_argument if simplex has more than 4 vertices
   * @throws std::runtime_error if no non-degenerate polytope can be built
   */
  Result computePenetration(const std::vector<Coordinate>& simplex,
                            int maxIterations = 64);

  EPA(const EPA&) = default;
  EPA(EPA&&) noexcept = default;
  EPA& operator=(const EPA&) = delete;      // Cannot reassign reference members
  EPA& operator=(EPA&&) noexcept = delete;  // Cannot reassign reference members
  ~EPA() = default;

private:
  /**
   * @brief Edge in polytope for horizon construction.
   */
  struct EPAEdge
  {
    size_t v0;
    size_t v1;

    EPAEdge(size_t a, size_t b) : v0{a}, v1{b}
    {
    }

    // Order-independent, for duplicate detection
    bool operator==(const EPAEdge& other) const
    {
      return (v0 == other.v0 && v1 == other.v1) ||
             (v0 == other.v1 && v1 == other.v0);
    }
  };

  void initializePolytope(const std::vector<Coordinate>& simplex);

  bool expandPolytope(int maxIterations);

  [[nodiscard]] size_t findClosestFace() const;

  [[nodiscard]] bool isVisible(const Facet& face,
                               const Coordinate& point) const;

  std::vector<EPAEdge> buildHorizonEdges(const Coordinate& newVertex);

  void addFace(size_t v0, size_t v1, size_t v2);

  const ConvexHull& hullA_;
  const ConvexHull& hullB_;
  double epsilon_;

  std::vector<Coordinate> vertices_;  // Minkowski difference points
  std::vector<Facet> faces_;          // Offset = distance from the origin
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_EPA_HPP
