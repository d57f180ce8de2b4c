#ifndef HYDRO_SIM_DATATYPES_VECTOR3D_HPP
#define HYDRO_SIM_DATATYPES_VECTOR3D_HPP

#include "hydro-sim/src/DataTypes/Vec3DBase.hpp"

namespace hydro_sim
{

/**
 * @brief Generic 3D vector (directions, normals, forces, torques).
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Vector3D(const Vector3D&) = default;
  Vector3D(Vector3D&&) noexcept = default;
  Vector3D& operator=(const Vector3D&) = default;
  Vector3D& operator=(Vector3D&&) noexcept = default;
  ~Vector3D() = default;
};

}  // namespace hydro_sim

template <>
struct std::formatter<hydro_sim::Vector3D>
  : hydro_sim::detail::Vec3FormatterBase<hydro_sim::Vector3D>
{
};

#endif  // HYDRO_SIM_DATATYPES_VECTOR3D_HPP
