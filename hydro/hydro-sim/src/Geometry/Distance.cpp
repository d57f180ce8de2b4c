#include "hydro-sim/src/Geometry/Distance.hpp"

#include <cmath>
#include <type_traits>
#include <variant>

#include "hydro-sim/src/Utils/utils.hpp"

namespace hydro_sim
{

namespace distance
{

DistanceResult pointToPoint(const Coordinate& point1, const Coordinate& point2)
{
  return DistanceResult{(point1 - point2).norm(), point1, point2, 0.0, 0.0};
}

PointDistanceResult pointToLine(const Coordinate& point,
                                const Coordinate& linePoint,
                                const Vector3D& lineDirection)
{
  double const t = lineDirection.dot(point - linePoint);
  Coordinate const onLine{linePoint + t * lineDirection};
  return PointDistanceResult{(point - onLine).norm(), onLine, t};
}

PointDistanceResult pointToLineSegment(const Coordinate& point,
                                       const Coordinate& segmentStart,
                                       const Coordinate& segmentEnd,
                                       double epsilon)
{
  Eigen::Vector3d const segment = segmentEnd - segmentStart;
  double const lengthSquared = segment.squaredNorm();

  if (lengthSquared < epsilon * epsilon)
  {
    return PointDistanceResult{
      (point - segmentStart).norm(), segmentStart, 0.0};
  }

  double const t =
    clamp01(segment.dot(point - segmentStart) / lengthSquared);
  Coordinate const onSegment{segmentStart + t * segment};
  return PointDistanceResult{(point - onSegment).norm(), onSegment, t};
}

PointDistanceResult pointToPlane(const Coordinate& point,
                                 const Coordinate& planePoint,
                                 const Vector3D& planeNormal,
                                 bool isSigned)
{
  double const signedDistance = planeNormal.dot(point - planePoint);
  Coordinate const projection{point - signedDistance * planeNormal};
  return PointDistanceResult{
    isSigned ? signedDistance : std::abs(signedDistance), projection, 0.0};
}

Eigen::VectorXd pointsToPlaneSigned(std::span<const Coordinate> points,
                                    const Coordinate& planePoint,
                                    const Vector3D& planeNormal)
{
  Eigen::VectorXd distances(static_cast<Eigen::Index>(points.size()));
  for (size_t i = 0; i < points.size(); ++i)
  {
    distances(static_cast<Eigen::Index>(i)) =
      planeNormal.dot(points[i] - planePoint);
  }
  return distances;
}

DistanceResult lineToLine(const Coordinate& linePoint1,
                          const Vector3D& lineDirection1,
                          const Coordinate& linePoint2,
                          const Vector3D& lineDirection2,
                          double epsilon)
{
  Eigen::Vector3d const diff = linePoint1 - linePoint2;
  double const a12 = -lineDirection1.dot(lineDirection2);
  double const b1 = lineDirection1.dot(diff);
  double const det = 1.0 - a12 * a12;

  double t1{0.0};
  double t2{0.0};
  if (std::abs(det) >= epsilon)
  {
    double const b2 = -lineDirection2.dot(diff);
    t1 = (a12 * b2 - b1) / det;
    t2 = (a12 * b1 - b2) / det;
  }
  else
  {
    // Parallel: any point on line 2 works, take its anchor
    t1 = -b1;
  }

  Coordinate const closest1{linePoint1 + t1 * lineDirection1};
  Coordinate const closest2{linePoint2 + t2 * lineDirection2};
  return DistanceResult{(closest1 - closest2).norm(), closest1, closest2, t1, t2};
}

DistanceResult lineToLineSegment(const Coordinate& linePoint,
                                 const Vector3D& lineDirection,
                                 const Coordinate& segmentStart,
                                 const Coordinate& segmentEnd,
                                 double epsilon)
{
  Eigen::Vector3d const segment = segmentEnd - segmentStart;
  double const segmentLengthSquared = segment.squaredNorm();
  double const lineLengthSquared = lineDirection.squaredNorm();

  if (segmentLengthSquared < epsilon && lineLengthSquared < epsilon)
  {
    return DistanceResult{(linePoint - segmentStart).norm(),
                          linePoint,
                          segmentStart,
                          0.0,
                          0.0};
  }

  Eigen::Vector3d const r = segmentStart - linePoint;
  double const f = lineDirection.dot(r);

  double s{0.0};  // Segment parameter
  double t{0.0};  // Line parameter
  if (segmentLengthSquared < epsilon)
  {
    t = f / lineLengthSquared;
  }
  else
  {
    double const c = segment.dot(r);
    if (lineLengthSquared < epsilon)
    {
      s = clamp01(-c / segmentLengthSquared);
    }
    else
    {
      double const b = segment.dot(lineDirection);
      double const denom =
        segmentLengthSquared * lineLengthSquared - b * b;
      if (denom != 0.0)
      {
        s = clamp01((b * f - c * lineLengthSquared) / denom);
      }
      t = (b * s + f) / lineLengthSquared;
    }
  }

  Coordinate const onLine{linePoint + t * lineDirection};
  Coordinate const onSegment{segmentStart + s * segment};
  return DistanceResult{(onLine - onSegment).norm(), onLine, onSegment, t, s};
}

DistanceResult lineSegmentToLineSegment(const Coordinate& segmentStart1,
                                        const Coordinate& segmentEnd1,
                                        const Coordinate& segmentStart2,
                                        const Coordinate& segmentEnd2,
                                        double epsilon)
{
  Eigen::Vector3d const d1 = segmentEnd1 - segmentStart1;
  Eigen::Vector3d const d2 = segmentEnd2 - segmentStart2;
  Eigen::Vector3d const r = segmentStart1 - segmentStart2;
  double const a = d1.squaredNorm();
  double const e = d2.squaredNorm();
  double const f = d2.dot(r);

  double s{0.0};
  double t{0.0};

  if (a < epsilon && e < epsilon)
  {
    // Both segments degenerate into points
    return DistanceResult{(segmentStart1 - segmentStart2).norm(),
                          segmentStart1,
                          segmentStart2,
                          0.0,
                          0.0};
  }

  if (a < epsilon)
  {
    t = clamp01(f / e);
  }
  else
  {
    double const c = d1.dot(r);
    if (e < epsilon)
    {
      s = clamp01(-c / a);
    }
    else
    {
      double const b = d1.dot(d2);
      double const denom = a * e - b * b;

      // Parallel segments leave s free, 0 is as good as any
      if (denom != 0.0)
      {
        s = clamp01((b * f - c * e) / denom);
      }

      t = (b * s + f) / e;
      if (t < 0.0)
      {
        t = 0.0;
        s = clamp01(-c / a);
      }
      else if (t > 1.0)
      {
        t = 1.0;
        s = clamp01((b - c) / a);
      }
    }
  }

  Coordinate const closest1{segmentStart1 + s * d1};
  Coordinate const closest2{segmentStart2 + t * d2};
  return DistanceResult{(closest1 - closest2).norm(), closest1, closest2, s, t};
}

DistanceResult lineToPlane(const Coordinate& linePoint,
                           const Vector3D& lineDirection,
                           const Coordinate& planePoint,
                           const Vector3D& planeNormal,
                           double epsilon)
{
  double const denom = planeNormal.dot(lineDirection);
  double const signedDistance = planeNormal.dot(linePoint - planePoint);

  if (std::abs(denom) < epsilon)
  {
    Coordinate const projection{linePoint - signedDistance * planeNormal};
    return DistanceResult{
      std::abs(signedDistance), linePoint, projection, 0.0, 0.0};
  }

  double const t = -signedDistance / denom;
  Coordinate const intersection{linePoint + t * lineDirection};
  return DistanceResult{0.0, intersection, intersection, t, 0.0};
}

SegmentPlaneResult lineSegmentToPlane(const Coordinate& segmentStart,
                                      const Coordinate& segmentEnd,
                                      const Coordinate& planePoint,
                                      const Vector3D& planeNormal)
{
  double const dStart = planeNormal.dot(segmentStart - planePoint);
  double const dEnd = planeNormal.dot(segmentEnd - planePoint);

  SegmentPlaneResult result;
  result.signedDistanceStart = dStart;
  result.signedDistanceEnd = dEnd;

  if (dStart * dEnd <= 0.0 && dStart != dEnd)
  {
    double const t = dStart / (dStart - dEnd);
    Coordinate const intersection{segmentStart +
                                  t * (segmentEnd - segmentStart)};
    result.distance = 0.0;
    result.parameter = t;
    result.closestPointSegment = intersection;
    result.closestPointPlane = intersection;
    return result;
  }

  // Both ends on the same side (or the segment is parallel to the plane)
  bool const useStart = std::abs(dStart) <= std::abs(dEnd);
  double const d = useStart ? dStart : dEnd;
  const Coordinate& endpoint = useStart ? segmentStart : segmentEnd;

  result.distance = std::abs(d);
  result.parameter = useStart ? 0.0 : 1.0;
  result.closestPointSegment = endpoint;
  result.closestPointPlane = Coordinate{endpoint - d * planeNormal};
  return result;
}

DistanceResult planeToPlane(const Coordinate& planePoint1,
                            const Vector3D& planeNormal1,
                            const Coordinate& planePoint2,
                            const Vector3D& planeNormal2,
                            double epsilon)
{
  if (planeNormal1.cross(planeNormal2).squaredNorm() < epsilon)
  {
    double const gap = planeNormal2.dot(planePoint1 - planePoint2);
    Coordinate const projection{planePoint1 - gap * planeNormal2};
    return DistanceResult{std::abs(gap), planePoint1, projection, 0.0, 0.0};
  }

  // x = p1 + a n1 + b n2 lies on both planes and is closest to p1
  double const c = planeNormal1.dot(planeNormal2);
  double const det = 1.0 - c * c;
  double const s = planeNormal2.dot(planePoint1 - planePoint2);
  double const a = c * s / det;
  double const b = -s / det;

  Coordinate const onBoth{planePoint1 + a * planeNormal1 + b * planeNormal2};
  return DistanceResult{0.0, onBoth, onBoth, 0.0, 0.0};
}

}  // namespace distance

namespace
{

// Forward pair routines. Each (A, B) pair appears once; the reverse order is
// derived in computeDistance() below.

DistanceResult between(const Point& a, const Point& b, double)
{
  return distance::pointToPoint(a.position, b.position);
}

DistanceResult between(const Point& p, const Line& l, double)
{
  auto const r = distance::pointToLine(p.position, l.point, l.direction);
  return DistanceResult{
    r.distance, p.position, r.closestPoint, 0.0, r.parameter};
}

DistanceResult between(const Point& p, const Segment& s, double epsilon)
{
  auto const r =
    distance::pointToLineSegment(p.position, s.start, s.end, epsilon);
  return DistanceResult{
    r.distance, p.position, r.closestPoint, 0.0, r.parameter};
}

DistanceResult between(const Point& p, const Plane& pl, double)
{
  auto const r = distance::pointToPlane(p.position, pl.point, pl.normal);
  return DistanceResult{r.distance, p.position, r.closestPoint, 0.0, 0.0};
}

DistanceResult between(const Line& a, const Line& b, double epsilon)
{
  return distance::lineToLine(
    a.point, a.direction, b.point, b.direction, epsilon);
}

DistanceResult between(const Line& l, const Segment& s, double epsilon)
{
  return distance::lineToLineSegment(
    l.point, l.direction, s.start, s.end, epsilon);
}

DistanceResult between(const Line& l, const Plane& pl, double epsilon)
{
  return distance::lineToPlane(
    l.point, l.direction, pl.point, pl.normal, epsilon);
}

DistanceResult between(const Segment& a, const Segment& b, double epsilon)
{
  return distance::lineSegmentToLineSegment(
    a.start, a.end, b.start, b.end, epsilon);
}

DistanceResult between(const Segment& s, const Plane& pl, double)
{
  auto const r = distance::lineSegmentToPlane(s.start, s.end, pl.point, pl.normal);
  return DistanceResult{r.distance,
                        r.closestPointSegment,
                        r.closestPointPlane,
                        r.parameter,
                        0.0};
}

DistanceResult between(const Plane& a, const Plane& b, double epsilon)
{
  return distance::planeToPlane(
    a.point, a.normal, b.point, b.normal, epsilon);
}

template <typename A, typename B>
concept HasForwardRoutine = requires(const A& a, const B& b) {
  between(a, b, 0.0);
};

}  // namespace

DistanceResult computeDistance(const Primitive& first,
                               const Primitive& second,
                               double epsilon)
{
  return std::visit(
    [epsilon](const auto& lhs, const auto& rhs) -> DistanceResult
    {
      using Lhs = std::decay_t<decltype(lhs)>;
      using Rhs = std::decay_t<decltype(rhs)>;
      if constexpr (HasForwardRoutine<Lhs, Rhs>)
      {
        return between(lhs, rhs, epsilon);
      }
      else
      {
        return between(rhs, lhs, epsilon).swapped();
      }
    },
    first,
    second);
}

}  // namespace hydro_sim
