#ifndef HYDRO_SIM_GEOMETRY_PRIMITIVES_HPP
#define HYDRO_SIM_GEOMETRY_PRIMITIVES_HPP

#include <variant>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"

namespace hydro_sim
{

/// A single point in space.
struct Point
{
  Coordinate position;
};

/// Infinite line through @c point along @c direction (assumed unit length).
struct Line
{
  Coordinate point;
  Vector3D direction;
};

/// Closed segment between @c start and @c end.
struct Segment
{
  Coordinate start;
  Coordinate end;

  [[nodiscard]] Vector3D direction() const
  {
    return Vector3D{end - start};
  }
};

/// Plane through @c point with unit @c normal.
struct Plane
{
  Coordinate point;
  Vector3D normal;

  /// Signed distance of @p p along the normal (positive on the normal side)
  [[nodiscard]] double signedDistance(const Coordinate& p) const
  {
    return normal.dot(p - point);
  }
};

/**
 * @brief Closed set of primitives understood by the distance kernel.
 */
using Primitive = std::variant<Point, Line, Segment, Plane>;

}  // namespace hydro_sim

#endif  // HYDRO_SIM_GEOMETRY_PRIMITIVES_HPP
