#ifndef HYDRO_SIM_PHYSICS_SUPPORT_FUNCTION_HPP
#define HYDRO_SIM_PHYSICS_SUPPORT_FUNCTION_HPP

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"
#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace hydro_sim
{

/**
 * @brief Support function utilities shared by GJK, EPA and the SAT check.
 *
 * Both hulls are expected in the same frame; the contact solver expresses
 * the first mesh in the second mesh's frame before any hull is built.
 */
namespace support_function
{

/**
 * @brief Find the hull vertex furthest along a direction.
 *
 * @param hull Convex hull to query
 * @param dir Search direction (need not be normalized)
 * @return Vertex with maximum dot product with @p dir
 */
Coordinate support(const ConvexHull& hull, const Vector3D& dir);

/**
 * @brief Support point of the Minkowski difference A - B.
 *
 * @return support(A, dir) - support(B, -dir)
 */
Coordinate supportMinkowski(const ConvexHull& hullA,
                            const ConvexHull& hullB,
                            const Vector3D& dir);

}  // namespace support_function

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_SUPPORT_FUNCTION_HPP
