#include "hydro-sim/src/Physics/SupportFunction.hpp"

#include <limits>

namespace hydro_sim::support_function
{

Coordinate support(const ConvexHull& hull, const Vector3D& dir)
{
  double maxDot = -std::numeric_limits<double>::infinity();
  Coordinate furthest{0.0, 0.0, 0.0};

  for (const auto& vertex : hull.getVertices())
  {
    double const dotProduct = vertex.dot(dir);
    if (dotProduct > maxDot)
    {
      maxDot = dotProduct;
      furthest = vertex;
    }
  }

  return furthest;
}

Coordinate supportMinkowski(const ConvexHull& hullA,
                            const ConvexHull& hullB,
                            const Vector3D& dir)
{
  Coordinate const supportA = support(hullA, dir);
  // -dir is an Eigen expression, wrap it so the overload is picked up
  Coordinate const supportB = support(hullB, Vector3D{-dir});
  return Coordinate{supportA - supportB};
}

}  // namespace hydro_sim::support_function
