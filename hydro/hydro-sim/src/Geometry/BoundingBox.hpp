#ifndef HYDRO_SIM_GEOMETRY_BOUNDING_BOX_HPP
#define HYDRO_SIM_GEOMETRY_BOUNDING_BOX_HPP

#include <span>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"

namespace hydro_sim
{

/**
 * @brief Axis-aligned bounding box.
 *
 * Invariant: min <= max componentwise. Overlap tests use closed intervals,
 * so boxes that only share a boundary face, edge or corner overlap.
 */
class BoundingBox
{
public:
  /**
   * @brief Degenerate box at the origin.
   */
  BoundingBox() = default;

  /**
   * @throws std::invalid_argument if min > max on any axis
   */
  BoundingBox(const Coordinate& min, const Coordinate& max);

  /**
   * @brief Smallest box containing every point.
   * @throws std::invalid_argument if points is empty
   */
  static BoundingBox fromPoints(std::span<const Coordinate> points);

  [[nodiscard]] bool overlaps(const BoundingBox& other) const;

  [[nodiscard]] bool contains(const Coordinate& point) const;

  /**
   * @brief Smallest box containing both this box and @p other.
   */
  [[nodiscard]] BoundingBox merged(const BoundingBox& other) const;

  [[nodiscard]] Coordinate center() const;

  /// Edge lengths along x, y and z
  [[nodiscard]] Vector3D extent() const;

  [[nodiscard]] const Coordinate& getMin() const
  {
    return min_;
  }

  [[nodiscard]] const Coordinate& getMax() const
  {
    return max_;
  }

private:
  Coordinate min_;  // Minimum corner
  Coordinate max_;  // Maximum corner
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_GEOMETRY_BOUNDING_BOX_HPP
