#ifndef HYDRO_SIM_DATATYPES_VEC3D_BASE_HPP
#define HYDRO_SIM_DATATYPES_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>
#include <format>

namespace hydro_sim::detail
{

/**
 * @brief CRTP base class for 3D vector types
 *
 * Inherits from Eigen::Vector3d so every semantic vector type (positions,
 * directions) keeps full access to Eigen expressions while remaining a
 * distinct C++ type:
 *
 *   struct MyVec3Type final : Vec3DBase<MyVec3Type> { ... };
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

/// Shared std::formatter base for the 3-component vector types.
/// Format options apply to each component, e.g. "{:.3f}" -> "(x, y, z)".
template <typename T>
struct Vec3FormatterBase : std::formatter<double>
{
  auto format(const T& vec, std::format_context& ctx) const
  {
    auto out = ctx.out();
    for (Eigen::Index i = 0; i < 3; ++i)
    {
      out = std::format_to(out, "{}", i == 0 ? "(" : ", ");
      ctx.advance_to(out);
      out = std::formatter<double>::format(vec[i], ctx);
    }
    return std::format_to(out, ")");
  }
};

}  // namespace hydro_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // HYDRO_SIM_DATATYPES_VEC3D_BASE_HPP
