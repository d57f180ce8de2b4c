#ifndef HYDRO_SIM_PHYSICS_PENETRATION_RESULT_HPP
#define HYDRO_SIM_PHYSICS_PENETRATION_RESULT_HPP

#include <format>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"

namespace hydro_sim
{

/**
 * @brief Penetration between two overlapping convex hulls.
 *
 * normal and contactPoint together define the shared contact plane used by
 * the hydroelastic pipeline. Everything is expressed in the frame the hulls
 * were built in.
 */
struct PenetrationResult
{
  double depth{0.0};     // Penetration depth along normal [m]
  Vector3D normal;       // Unit contact normal, A toward B
  Coordinate contactPoint;  // Point on the mid-plane of the overlap
};

}  // namespace hydro_sim

template <>
struct std::formatter<hydro_sim::PenetrationResult>
{
  constexpr auto parse(std::format_parse_context& ctx)
  {
    return ctx.begin();
  }

  auto format(const hydro_sim::PenetrationResult& result,
              std::format_context& ctx) const
  {
    return std::format_to(ctx.out(),
                          "depth={:.6f} normal={} point={}",
                          result.depth,
                          result.normal,
                          result.contactPoint);
  }
};

#endif  // HYDRO_SIM_PHYSICS_PENETRATION_RESULT_HPP
