#include "hydro-sim/src/Physics/Collision/GJK.hpp"

#include "hydro-sim/src/Physics/SupportFunction.hpp"

namespace hydro_sim
{

namespace
{

// Direction perpendicular to edge, in the plane of edge and toOrigin
Coordinate edgeNormalToward(const Coordinate& edge, const Coordinate& toOrigin)
{
  return Coordinate{edge.cross(toOrigin).cross(edge)};
}

}  // namespace

GJK::GJK(const ConvexHull& hullA, const ConvexHull& hullB, double epsilon)
  : hullA_{hullA}, hullB_{hullB}, epsilon_{epsilon}, direction_{1.0, 0.0, 0.0}
{
  simplex_.reserve(4);
}

bool GJK::intersects(int maxIterations)
{
  if (!hullA_.getBoundingBox().overlaps(hullB_.getBoundingBox()))
  {
    return false;
  }

  Coordinate const centroidOffset = hullB_.getCentroid() - hullA_.getCentroid();
  direction_ = centroidOffset.norm() < epsilon_ ? Coordinate{1.0, 0.0, 0.0}
                                                : centroidOffset;

  simplex_.clear();
  simplex_.push_back(
    support_function::supportMinkowski(hullA_, hullB_, Vector3D{direction_}));

  direction_ = -simplex_.front();
  if (direction_.norm() < epsilon_)
  {
    return true;
  }

  for (int iteration = 0; iteration < maxIterations; ++iteration)
  {
    direction_.normalize();
    Coordinate const candidate =
      support_function::supportMinkowski(hullA_, hullB_, Vector3D{direction_});

    // No progress past the origin along the search direction
    if (candidate.dot(direction_) < epsilon_)
    {
      return false;
    }

    simplex_.push_back(candidate);
    if (updateSimplex())
    {
      return true;
    }

    // Origin on an edge or face of the reduced simplex
    if (direction_.norm() < epsilon_ * epsilon_)
    {
      return true;
    }
  }

  return false;
}

bool GJK::updateSimplex()
{
  if (simplex_.size() == 2)
  {
    return handleLine();
  }
  if (simplex_.size() == 3)
  {
    return handleTriangle();
  }
  if (simplex_.size() == 4)
  {
    return handleTetrahedron();
  }
  return false;
}

bool GJK::handleLine()
{
  // simplex_ = {b, a}, a is the newest support point
  Coordinate const a = simplex_.back();
  Coordinate const ab = simplex_.front() - a;
  Coordinate const toOrigin = -a;

  if (!sameDirection(ab, toOrigin))
  {
    simplex_ = {a};
    direction_ = toOrigin;
    return false;
  }

  direction_ = edgeNormalToward(ab, toOrigin);
  return false;
}

bool GJK::handleTriangle()
{
  // simplex_ = {c, b, a}
  Coordinate const a = simplex_[2];
  Coordinate const b = simplex_[1];
  Coordinate const c = simplex_[0];
  Coordinate const toOrigin = -a;

  Coordinate const ab = b - a;
  Coordinate const ac = c - a;
  Coordinate const faceNormal = ab.cross(ac);

  bool const outsideAc = sameDirection(faceNormal.cross(ac), toOrigin);
  bool const outsideAb = sameDirection(ab.cross(faceNormal), toOrigin);

  if (outsideAc && sameDirection(ac, toOrigin))
  {
    simplex_ = {c, a};
    direction_ = edgeNormalToward(ac, toOrigin);
    return false;
  }

  if (outsideAc || outsideAb)
  {
    simplex_ = {b, a};
    return handleLine();
  }

  // Origin is above or below the face; keep the winding facing it
  if (sameDirection(faceNormal, toOrigin))
  {
    direction_ = faceNormal;
  }
  else
  {
    simplex_ = {b, c, a};
    direction_ = -faceNormal;
  }
  return false;
}

bool GJK::handleTetrahedron()
{
  // simplex_ = {d, c, b, a}; the triangle {c, b, a} faces away from d
  Coordinate const a = simplex_[3];
  Coordinate const b = simplex_[2];
  Coordinate const c = simplex_[1];
  Coordinate const d = simplex_[0];
  Coordinate const toOrigin = -a;

  Coordinate const ab = b - a;
  Coordinate const ac = c - a;
  Coordinate const ad = d - a;

  struct Face
  {
    Coordinate normal;
    std::vector<Coordinate> triangle;
  };

  for (const Face& face : {Face{ab.cross(ac), {c, b, a}},
                           Face{ac.cross(ad), {d, c, a}},
                           Face{ad.cross(ab), {b, d, a}}})
  {
    if (sameDirection(face.normal, toOrigin))
    {
      simplex_ = face.triangle;
      return handleTriangle();
    }
  }

  return true;
}

bool GJK::sameDirection(const Coordinate& direction, const Coordinate& ao)
{
  return direction.dot(ao) > 0.0;
}

bool gjkIntersects(const ConvexHull& hullA,
                   const ConvexHull& hullB,
                   double epsilon,
                   int maxIterations)
{
  GJK gjk{hullA, hullB, epsilon};
  return gjk.intersects(maxIterations);
}

}  // namespace hydro_sim
