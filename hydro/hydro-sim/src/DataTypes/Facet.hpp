#ifndef HYDRO_SIM_DATATYPES_FACET_HPP
#define HYDRO_SIM_DATATYPES_FACET_HPP

#include <array>
#include <cstddef>
#include <utility>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"

namespace hydro_sim
{

/**
 * @brief Triangular facet of a convex hull or EPA polytope.
 *
 * Stores indices into the owner's vertex array, the outward-facing unit
 * normal and the plane offset (normal · v for any vertex v on the facet).
 */
struct Facet
{
  static constexpr size_t kFacetSize = 3;

  std::array<size_t, kFacetSize> vertexIndices{};
  Coordinate normal;  // Outward-facing unit normal
  double offset{};    // Signed distance of the plane from the origin

  Facet() = default;
  Facet(size_t v0, size_t v1, size_t v2, Coordinate n, double d)
    : vertexIndices{v0, v1, v2}, normal{std::move(n)}, offset{d}
  {
  }
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_DATATYPES_FACET_HPP
