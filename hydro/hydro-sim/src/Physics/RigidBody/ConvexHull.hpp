#ifndef HYDRO_SIM_PHYSICS_CONVEX_HULL_HPP
#define HYDRO_SIM_PHYSICS_CONVEX_HULL_HPP

#include <span>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Facet.hpp"
#include "hydro-sim/src/Geometry/BoundingBox.hpp"

// Forward declare Qhull C API types
extern "C"
{
  // NOLINTNEXTLINE(readability-identifier-naming)
  struct qhT;
}

namespace hydro_sim
{

/**
 * @brief 3D convex hull of a point set, computed with Qhull.
 *
 * Used as the narrow-phase shape of a tetrahedron: GJK and EPA query it
 * through its support function. All coordinates are expressed in whatever
 * frame the input points were given in.
 */
class ConvexHull
{
public:
  /// Empty hull: no vertices, NaN volume and area
  ConvexHull();

  /**
   * @brief Construct convex hull from a point cloud.
   *
   * Duplicate and interior points are removed by Qhull.
   *
   * @param points At least four non-coplanar points
   * @throws std::runtime_error if points are degenerate or Qhull fails
   */
  explicit ConvexHull(std::span<const Coordinate> points);

  /**
   * @brief Hull boundary vertices (interior input points are dropped).
   */
  [[nodiscard]] const std::vector<Coordinate>& getVertices() const
  {
    return vertices_;
  }

  /**
   * @brief Triangular facets with outward unit normals.
   */
  [[nodiscard]] const std::vector<Facet>& getFacets() const
  {
    return facets_;
  }

  [[nodiscard]] size_t getVertexCount() const
  {
    return vertices_.size();
  }

  [[nodiscard]] size_t getFacetCount() const
  {
    return facets_.size();
  }

  /**
   * @brief Volume enclosed by the hull, computed by Qhull.
   */
  [[nodiscard]] double getVolume() const
  {
    return volume_;
  }

  [[nodiscard]] double getSurfaceArea() const
  {
    return surfaceArea_;
  }

  /**
   * @brief Centroid of the enclosed volume (uniform density).
   */
  [[nodiscard]] const Coordinate& getCentroid() const
  {
    return centroid_;
  }

  /**
   * @brief Test whether a point lies inside or on the hull.
   *
   * @param point Point to test
   * @param epsilon Tolerance on the facet plane distances
   */
  [[nodiscard]] bool contains(const Coordinate& point,
                              double epsilon = 1e-6) const;

  /**
   * @brief Largest facet-plane distance of a point.
   *
   * Negative inside the hull, positive outside.
   */
  [[nodiscard]] double signedDistance(const Coordinate& point) const;

  [[nodiscard]] const BoundingBox& getBoundingBox() const
  {
    return boundingBox_;
  }

  /// False for a default-constructed hull
  [[nodiscard]] bool isValid() const
  {
    return !vertices_.empty() && !facets_.empty();
  }

private:
  void computeHull(std::span<const Coordinate> points);

  /**
   * @brief Extract vertices and facets from the Qhull result.
   */
  void extractHullData(qhT* qh);

  /**
   * @brief Volume-weighted centroid of the cones from the vertex mean to
   * every facet.
   */
  void computeCentroid();

  std::vector<Coordinate> vertices_;  // Hull boundary vertices
  std::vector<Facet> facets_;         // Triangular facets with normals
  double volume_;                     // Volume computed by Qhull
  double surfaceArea_;                // Surface area computed by Qhull
  BoundingBox boundingBox_;           // Bounds of the hull vertices
  Coordinate centroid_;               // Centroid of the enclosed volume
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_CONVEX_HULL_HPP
