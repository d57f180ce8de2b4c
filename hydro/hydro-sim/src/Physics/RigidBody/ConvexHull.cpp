#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_map>

extern "C"
{
#include <libqhull_r/geom_r.h>
#include <libqhull_r/libqhull_r.h>
}

#include "hydro-sim/src/Geometry/Tetrahedron.hpp"

namespace hydro_sim
{

namespace
{

/**
 * @brief One reentrant Qhull run over a point set.
 *
 * Qhull keeps a pointer to the coordinate array, so the array lives as long
 * as the run. Qhull memory is released on destruction.
 */
class QhullRun
{
public:
  explicit QhullRun(std::span<const Coordinate> points)
  {
    coordinates_.reserve(points.size() * 3);
    for (const auto& point : points)
    {
      coordinates_.insert(coordinates_.end(), {point.x(), point.y(), point.z()});
    }

    QHULL_LIB_CHECK
    qh_zero(&qh_, stderr);

    // "Qt" = triangulated output, "Pp" = suppress precision warnings
    char options[] = "qhull Qt Pp";
    exitCode_ = qh_new_qhull(&qh_,
                             3,
                             static_cast<int>(points.size()),
                             coordinates_.data(),
                             False,
                             options,
                             stderr,
                             stderr);
  }

  ~QhullRun()
  {
    int curlong{};
    int totlong{};
    qh_freeqhull(&qh_, !qh_ALL);
    qh_memfreeshort(&qh_, &curlong, &totlong);
  }

  QhullRun(const QhullRun&) = delete;
  QhullRun& operator=(const QhullRun&) = delete;

  [[nodiscard]] int exitCode() const
  {
    return exitCode_;
  }

  qhT* get()
  {
    return &qh_;
  }

private:
  std::vector<double> coordinates_;  // x0 y0 z0 x1 y1 z1 ...
  qhT qh_;
  int exitCode_{0};
};

}  // namespace

ConvexHull::ConvexHull()
  : volume_{std::numeric_limits<double>::quiet_NaN()},
    surfaceArea_{std::numeric_limits<double>::quiet_NaN()},
    centroid_{0.0, 0.0, 0.0}
{
}

ConvexHull::ConvexHull(std::span<const Coordinate> points) : ConvexHull()
{
  if (points.empty())
  {
    throw std::runtime_error("Cannot create convex hull from empty point set");
  }
  computeHull(points);
}

bool ConvexHull::contains(const Coordinate& point, double epsilon) const
{
  return std::ranges::all_of(
    facets_,
    [&](const Facet& facet)
    { return facet.normal.dot(point - vertices_[facet.vertexIndices[0]]) <= epsilon; });
}

double ConvexHull::signedDistance(const Coordinate& point) const
{
  double distance = facets_.empty() ? std::numeric_limits<double>::infinity()
                                    : -std::numeric_limits<double>::infinity();
  for (const auto& facet : facets_)
  {
    distance = std::max(
      distance, facet.normal.dot(point - vertices_[facet.vertexIndices[0]]));
  }
  return distance;
}

void ConvexHull::computeHull(std::span<const Coordinate> points)
{
  if (points.size() < 4)
  {
    throw std::runtime_error(std::format(
      "Cannot create 3D convex hull from {} points, need at least 4",
      points.size()));
  }

  QhullRun run{points};
  if (run.exitCode() != 0)
  {
    throw std::runtime_error(
      std::format("Qhull failed with exit code {}", run.exitCode()));
  }

  qhT* qh = run.get();
  qh_getarea(qh, qh->facet_list);
  volume_ = qh->totvol;
  surfaceArea_ = qh->totarea;
  extractHullData(qh);

  boundingBox_ = BoundingBox::fromPoints(vertices_);
  computeCentroid();
}

void ConvexHull::extractHullData(qhT* qh)
{
  vertices_.clear();
  facets_.clear();

  // Qhull point id -> index into vertices_
  std::unordered_map<int, size_t> indexOfPoint;

  vertexT* vertex;
  FORALLvertices
  {
    indexOfPoint.emplace(qh_pointid(qh, vertex->point), vertices_.size());
    vertices_.emplace_back(vertex->point[0], vertex->point[1], vertex->point[2]);
  }

  facetT* facet;
  FORALLfacets
  {
    // "Qt" triangulates every facet; anything else is skipped
    if (facet->upperdelaunay || !facet->simplicial ||
        qh_setsize(qh, facet->vertices) != static_cast<int>(Facet::kFacetSize))
    {
      continue;
    }

    Facet triangle;
    vertexT** vertexp;
    size_t corner = 0;
    FOREACHvertex_(facet->vertices)
    {
      triangle.vertexIndices[corner++] = indexOfPoint.at(qh_pointid(qh, vertex->point));
    }

    triangle.normal = Coordinate{facet->normal[0], facet->normal[1], facet->normal[2]};
    triangle.normal.normalize();
    // Qhull stores the plane as n . x + offset = 0
    triangle.offset = -facet->offset;

    facets_.push_back(triangle);
  }
}

void ConvexHull::computeCentroid()
{
  if (vertices_.empty())
  {
    centroid_ = Coordinate{0.0, 0.0, 0.0};
    return;
  }

  Eigen::Vector3d apex = Eigen::Vector3d::Zero();
  for (const auto& vertex : vertices_)
  {
    apex += vertex;
  }
  apex /= static_cast<double>(vertices_.size());

  Eigen::Vector3d weightedSum = Eigen::Vector3d::Zero();
  double totalVolume = 0.0;
  for (const auto& facet : facets_)
  {
    TetrahedronVertices const cone{Coordinate{apex},
                                   vertices_[facet.vertexIndices[0]],
                                   vertices_[facet.vertexIndices[1]],
                                   vertices_[facet.vertexIndices[2]]};
    double const volume = std::abs(tetrahedronSignedVolume(cone));
    weightedSum += volume * (cone[0] + cone[1] + cone[2] + cone[3]) / 4.0;
    totalVolume += volume;
  }

  centroid_ = totalVolume > 0.0 ? Coordinate{weightedSum / totalVolume}
                                : Coordinate{apex};
}

}  // namespace hydro_sim
