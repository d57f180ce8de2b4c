#include "hydro-sim/src/Physics/Collision/EPA.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "hydro-sim/src/Physics/SupportFunction.hpp"

namespace hydro_sim
{

EPA::EPA(const ConvexHull& hullA, const ConvexHull& hullB, double epsilon)
  : hullA_{hullA}, hullB_{hullB}, epsilon_{epsilon}
{
}

EPA::Result EPA::computePenetration(const std::vector<Coordinate>& simplex,
                                    int maxIterations)
{
  if (simplex.size() > 4)
  {
    throw std::invalid_argument(
      "EPA simplex cannot have more than 4 vertices (must be tetrahedron)");
  }

  initializePolytope(simplex);

  // Vertices: A=0, B=1, C=2, D=3
  addFace(0, 1, 2);
  addFace(0, 2, 3);
  addFace(0, 3, 1);
  addFace(1, 3, 2);

  if (faces_.empty())
  {
    throw std::runtime_error(
      "EPA cannot build polytope: degenerate collision geometry");
  }

  bool const converged = expandPolytope(maxIterations);
  if (!converged)
  {
    spdlog::warn(
      "EPA did not converge within {} iterations, using closest face found",
      maxIterations);
  }

  const Facet& closestFace = faces_[findClosestFace()];
  return Result{Vector3D{closestFace.normal}, closestFace.offset, converged};
}

void EPA::initializePolytope(const std::vector<Coordinate>& simplex)
{
  vertices_.assign(simplex.begin(), simplex.end());
  faces_.clear();

  if (vertices_.size() == 4)
  {
    return;
  }

  // GJK hit the origin before building a tetrahedron: complete the simplex
  // with support points along the coordinate axes
  std::array<Vector3D, 6> const directions{Vector3D{1.0, 0.0, 0.0},
                                           Vector3D{0.0, 1.0, 0.0},
                                           Vector3D{0.0, 0.0, 1.0},
                                           Vector3D{-1.0, 0.0, 0.0},
                                           Vector3D{0.0, -1.0, 0.0},
                                           Vector3D{0.0, 0.0, -1.0}};

  for (const auto& dir : directions)
  {
    if (vertices_.size() >= 4)
    {
      break;
    }

    Coordinate const point =
      support_function::supportMinkowski(hullA_, hullB_, dir);

    bool const isDuplicate =
      std::ranges::any_of(vertices_,
                          [&](const Coordinate& existing)
                          { return (point - existing).norm() < epsilon_; });
    if (!isDuplicate)
    {
      vertices_.push_back(point);
    }
  }

  if (vertices_.size() < 4)
  {
    throw std::runtime_error(
      "EPA cannot build tetrahedron: degenerate collision geometry");
  }
}

bool EPA::expandPolytope(int maxIterations)
{
  for (int iteration = 0; iteration < maxIterations; ++iteration)
  {
    const Facet& closestFace = faces_[findClosestFace()];
    Vector3D const normal{closestFace.normal};
    double const faceDistance = closestFace.offset;

    Coordinate const support =
      support_function::supportMinkowski(hullA_, hullB_, normal);

    // The face already lies on the boundary of A - B
    if (support.dot(normal) - faceDistance < epsilon_)
    {
      return true;
    }

    std::vector<EPAEdge> const horizonEdges = buildHorizonEdges(support);

    size_t const newVertexIndex = vertices_.size();
    vertices_.push_back(support);

    for (const auto& edge : horizonEdges)
    {
      addFace(edge.v0, edge.v1, newVertexIndex);
    }

    if (faces_.empty())
    {
      throw std::runtime_error("EPA polytope collapsed during expansion");
    }
  }

  return false;
}

size_t EPA::findClosestFace() const
{
  double minDistance = std::numeric_limits<double>::infinity();
  size_t closestIndex = 0;

  for (size_t i = 0; i < faces_.size(); ++i)
  {
    if (faces_[i].offset < minDistance)
    {
      minDistance = faces_[i].offset;
      closestIndex = i;
    }
  }

  return closestIndex;
}

bool EPA::isVisible(const Facet& face, const Coordinate& point) const
{
  return face.normal.dot(point - vertices_[face.vertexIndices[0]]) > epsilon_;
}

std::vector<EPA::EPAEdge> EPA::buildHorizonEdges(const Coordinate& newVertex)
{
  std::vector<EPAEdge> edgeCandidates;
  for (auto& face : faces_)
  {
    if (isVisible(face, newVertex))
    {
      edgeCandidates.emplace_back(face.vertexIndices[0], face.vertexIndices[1]);
      edgeCandidates.emplace_back(face.vertexIndices[1], face.vertexIndices[2]);
      edgeCandidates.emplace_back(face.vertexIndices[2], face.vertexIndices[0]);
      // Marked for removal below
      face.offset = std::numeric_limits<double>::infinity();
    }
  }

  // Horizon edges belong to exactly one visible face
  std::vector<EPAEdge> horizon;
  for (const auto& edge : edgeCandidates)
  {
    if (std::ranges::count(edgeCandidates, edge) == 1)
    {
      horizon.push_back(edge);
    }
  }

  std::erase_if(faces_,
                [](const Facet& face) { return std::isinf(face.offset); });

  return horizon;
}

void EPA::addFace(size_t v0, size_t v1, size_t v2)
{
  const Coordinate& a = vertices_[v0];
  const Coordinate& b = vertices_[v1];
  const Coordinate& c = vertices_[v2];

  Coordinate normal = (b - a).cross(c - a);

  double const normalLength = normal.norm();
  if (normalLength < epsilon_ * epsilon_)
  {
    // Degenerate face (collinear vertices)
    return;
  }
  normal /= normalLength;

  // Orient away from the origin
  Coordinate const centroid = (a + b + c) / 3.0;
  if (normal.dot(centroid) < 0.0)
  {
    normal = -normal;
    std::swap(v1, v2);
  }

  faces_.emplace_back(v0, v1, v2, normal, normal.dot(a));
}

}  // namespace hydro_sim
