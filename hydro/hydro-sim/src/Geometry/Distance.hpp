#ifndef HYDRO_SIM_GEOMETRY_DISTANCE_HPP
#define HYDRO_SIM_GEOMETRY_DISTANCE_HPP

#include <Eigen/Dense>
#include <limits>
#include <span>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"
#include "hydro-sim/src/Geometry/Primitives.hpp"

namespace hydro_sim
{

/**
 * @brief Default tolerance of the distance kernel.
 *
 * Squared lengths and determinants below this value are treated as zero and
 * routed into the degenerate branches (point-like segments, parallel lines).
 */
constexpr double kDistanceEpsilon = 1e-6;

/**
 * @brief Closest point from a query point to a primitive.
 */
struct PointDistanceResult
{
  double distance{std::numeric_limits<double>::quiet_NaN()};
  Coordinate closestPoint;  // Closest point on the primitive
  double parameter{0.0};    // Line/segment parameter of closestPoint
};

/**
 * @brief Closest points between two primitives.
 *
 * parameter1/parameter2 are the line or segment parameters of the closest
 * points where the primitive has one (zero otherwise).
 */
struct DistanceResult
{
  double distance{std::numeric_limits<double>::quiet_NaN()};
  Coordinate closestPoint1;  // Closest point on the first primitive
  Coordinate closestPoint2;  // Closest point on the second primitive
  double parameter1{0.0};
  double parameter2{0.0};

  /// The same result seen from the second primitive
  [[nodiscard]] DistanceResult swapped() const
  {
    return DistanceResult{
      distance, closestPoint2, closestPoint1, parameter2, parameter1};
  }
};

/**
 * @brief Segment-plane query result.
 *
 * When the segment crosses the plane, distance is zero and both closest
 * points are the intersection point at @c parameter.
 */
struct SegmentPlaneResult
{
  double distance{std::numeric_limits<double>::quiet_NaN()};
  double parameter{0.0};          // Segment parameter in [0, 1]
  Coordinate closestPointSegment;
  Coordinate closestPointPlane;
  double signedDistanceStart{0.0};
  double signedDistanceEnd{0.0};
};

namespace distance
{

/**
 * @brief Distance between two points.
 */
DistanceResult pointToPoint(const Coordinate& point1, const Coordinate& point2);

/**
 * @brief Project a point onto a line.
 *
 * @param point Query point
 * @param linePoint Point on the line
 * @param lineDirection Direction of the line, assumed unit length
 */
PointDistanceResult pointToLine(const Coordinate& point,
                                const Coordinate& linePoint,
                                const Vector3D& lineDirection);

/**
 * @brief Closest point on a segment.
 *
 * The projection parameter is clamped to [0, 1]. A segment shorter than
 * @p epsilon is treated as the single point @p segmentStart.
 */
PointDistanceResult pointToLineSegment(const Coordinate& point,
                                       const Coordinate& segmentStart,
                                       const Coordinate& segmentEnd,
                                       double epsilon = kDistanceEpsilon);

/**
 * @brief Distance from a point to a plane.
 *
 * @param isSigned If true the distance is positive on the normal side and
 *        negative on the other side; otherwise its absolute value
 * @return Distance and the projection of the point onto the plane
 */
PointDistanceResult pointToPlane(const Coordinate& point,
                                 const Coordinate& planePoint,
                                 const Vector3D& planeNormal,
                                 bool isSigned = false);

/**
 * @brief Signed plane distances of many points at once.
 */
Eigen::VectorXd pointsToPlaneSigned(std::span<const Coordinate> points,
                                    const Coordinate& planePoint,
                                    const Vector3D& planeNormal);

/**
 * @brief Closest points between two lines (unit directions).
 *
 * Solves the 2x2 system for both line parameters. When the determinant
 * 1 - (d1 . d2)^2 is below @p epsilon the lines are parallel: the second
 * closest point is @p linePoint2 and the first parameter is solved directly.
 */
DistanceResult lineToLine(const Coordinate& linePoint1,
                          const Vector3D& lineDirection1,
                          const Coordinate& linePoint2,
                          const Vector3D& lineDirection2,
                          double epsilon = kDistanceEpsilon);

/**
 * @brief Closest points between a line and a segment.
 *
 * The line parameter is unconstrained, the segment parameter is clamped to
 * [0, 1]. closestPoint1 is on the line, closestPoint2 on the segment.
 */
DistanceResult lineToLineSegment(const Coordinate& linePoint,
                                 const Vector3D& lineDirection,
                                 const Coordinate& segmentStart,
                                 const Coordinate& segmentEnd,
                                 double epsilon = kDistanceEpsilon);

/**
 * @brief Closest points between two segments.
 *
 * Ericson, Real-Time Collision Detection (2005), 5.1.9. Handles segments
 * degenerating into points and parallel segments; both returned parameters
 * are always within [0, 1].
 */
DistanceResult lineSegmentToLineSegment(const Coordinate& segmentStart1,
                                        const Coordinate& segmentEnd1,
                                        const Coordinate& segmentStart2,
                                        const Coordinate& segmentEnd2,
                                        double epsilon = kDistanceEpsilon);

/**
 * @brief Closest points between a line and a plane.
 *
 * A line that is not parallel to the plane (|n . d| >= epsilon) pierces it
 * and the distance is zero.
 */
DistanceResult lineToPlane(const Coordinate& linePoint,
                           const Vector3D& lineDirection,
                           const Coordinate& planePoint,
                           const Vector3D& planeNormal,
                           double epsilon = kDistanceEpsilon);

/**
 * @brief Intersection or closest approach of a segment and a plane.
 *
 * The signed distances of both end points are returned; a segment whose
 * end points lie on different sides of the plane intersects it at the
 * linearly interpolated parameter dStart / (dStart - dEnd).
 */
SegmentPlaneResult lineSegmentToPlane(const Coordinate& segmentStart,
                                      const Coordinate& segmentEnd,
                                      const Coordinate& planePoint,
                                      const Vector3D& planeNormal);

/**
 * @brief Closest points between two planes.
 *
 * Non-parallel planes intersect; the returned point is the point of the
 * intersection line closest to @p planePoint1.
 */
DistanceResult planeToPlane(const Coordinate& planePoint1,
                            const Vector3D& planeNormal1,
                            const Coordinate& planePoint2,
                            const Vector3D& planeNormal2,
                            double epsilon = kDistanceEpsilon);

}  // namespace distance

/**
 * @brief Distance between any two primitives.
 *
 * Dispatches on the pair of primitive types. Reversed pairs (e.g. plane and
 * segment) use the forward routine with closest points swapped, so
 * computeDistance(a, b) and computeDistance(b, a) agree. Unsigned for planes.
 */
DistanceResult computeDistance(const Primitive& first,
                               const Primitive& second,
                               double epsilon = kDistanceEpsilon);

}  // namespace hydro_sim

#endif  // HYDRO_SIM_GEOMETRY_DISTANCE_HPP
