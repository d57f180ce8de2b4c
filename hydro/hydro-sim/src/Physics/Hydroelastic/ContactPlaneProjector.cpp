#include "hydro-sim/src/Physics/Hydroelastic/ContactPlaneProjector.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

#include "hydro-sim/src/Geometry/Distance.hpp"

namespace hydro_sim
{

ContactPlaneProjector::ContactPlaneProjector(bool sortVertices)
  : sortVertices_{sortVertices}
{
}

std::vector<Coordinate> ContactPlaneProjector::project(
  const Plane& plane,
  const TetrahedronVertices& tetrahedron) const
{
  std::array<double, 4> signedDistances{};
  std::vector<size_t> negative;
  std::vector<size_t> nonNegative;
  for (size_t k = 0; k < tetrahedron.size(); ++k)
  {
    signedDistances[k] = plane.signedDistance(tetrahedron[k]);
    if (signedDistances[k] < 0.0)
    {
      negative.push_back(k);
    }
    else
    {
      nonNegative.push_back(k);
    }
  }

  std::vector<Coordinate> polygon;
  polygon.reserve(4);
  for (size_t const n : negative)
  {
    for (size_t const p : nonNegative)
    {
      SegmentPlaneResult const crossing = distance::lineSegmentToPlane(
        tetrahedron[n], tetrahedron[p], plane.point, plane.normal);
      polygon.push_back(crossing.closestPointSegment);
    }
  }

  if (polygon.size() < 3)
  {
    throw ContactProjectionError(std::format(
      "Contact polygon has {} points; tetrahedron signed distances "
      "({:.6g}, {:.6g}, {:.6g}, {:.6g}) do not straddle the plane",
      polygon.size(),
      signedDistances[0],
      signedDistances[1],
      signedDistances[2],
      signedDistances[3]));
  }

  if (polygon.size() == 4)
  {
    if (sortVertices_)
    {
      sortByAngle(polygon, plane.normal);
    }
    else
    {
      // Enumeration gives (n0p0, n0p1, n1p0, n1p1); the cycle around the
      // quad is n0p0 -> n0p1 -> n1p1 -> n1p0
      std::swap(polygon[2], polygon[3]);
    }
  }

  return polygon;
}

double ContactPlaneProjector::polygonArea(std::span<const Coordinate> points)
{
  auto triangleArea = [](const Coordinate& a, const Coordinate& b, const Coordinate& c)
  { return 0.5 * (b - a).cross(c - a).norm(); };

  switch (points.size())
  {
    case 3:
      return triangleArea(points[0], points[1], points[2]);
    case 4:
      return triangleArea(points[0], points[1], points[2]) +
             triangleArea(points[0], points[2], points[3]);
    default:
      throw std::invalid_argument(std::format(
        "polygonArea: expected 3 or 4 points, got {}", points.size()));
  }
}

Coordinate ContactPlaneProjector::polygonCentroid(
  std::span<const Coordinate> points)
{
  if (points.empty())
  {
    throw std::invalid_argument("polygonCentroid: empty polygon");
  }

  Eigen::Vector3d sum = Eigen::Vector3d::Zero();
  for (const auto& point : points)
  {
    sum += point;
  }
  return Coordinate{sum / static_cast<double>(points.size())};
}

void ContactPlaneProjector::sortByAngle(std::vector<Coordinate>& points,
                                        const Vector3D& normal)
{
  Coordinate const centroid = polygonCentroid(points);

  // In-plane basis; any helper axis not parallel to the normal will do
  Vector3D const helper = std::abs(normal.x()) < 0.9 ? Vector3D{1.0, 0.0, 0.0}
                                                     : Vector3D{0.0, 1.0, 0.0};
  Vector3D const basisU{normal.cross(helper).normalized()};
  Vector3D const basisV{normal.cross(basisU).normalized()};

  std::ranges::sort(points,
                    [&](const Coordinate& a, const Coordinate& b)
                    {
                      Eigen::Vector3d const da = a - centroid;
                      Eigen::Vector3d const db = b - centroid;
                      double const angleA =
                        std::atan2(da.dot(basisV), da.dot(basisU));
                      double const angleB =
                        std::atan2(db.dot(basisV), db.dot(basisU));
                      return angleA < angleB;
                    });
}

}  // namespace hydro_sim
