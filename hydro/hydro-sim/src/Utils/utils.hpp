#ifndef HYDRO_SIM_UTILS_HPP
#define HYDRO_SIM_UTILS_HPP

#include <algorithm>
#include <cmath>
#include <concepts>

namespace hydro_sim
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

template <std::floating_point T>
constexpr T clamp01(T value)
{
  return std::clamp(value, T{0}, T{1});
}

}  // namespace hydro_sim

#endif  // HYDRO_SIM_UTILS_HPP
