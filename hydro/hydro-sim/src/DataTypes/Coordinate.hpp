#ifndef HYDRO_SIM_DATATYPES_COORDINATE_HPP
#define HYDRO_SIM_DATATYPES_COORDINATE_HPP

#include <vector>

#include "hydro-sim/src/DataTypes/Vec3DBase.hpp"

namespace hydro_sim
{

/**
 * @brief A position in 3D space [m].
 *
 * Points are transformed with rotation and translation; use Vector3D for
 * directions, which only rotate.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

using CoordinateList = std::vector<Coordinate>;

}  // namespace hydro_sim

template <>
struct std::formatter<hydro_sim::Coordinate>
  : hydro_sim::detail::Vec3FormatterBase<hydro_sim::Coordinate>
{
};

#endif  // HYDRO_SIM_DATATYPES_COORDINATE_HPP
